/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      include/FileSessionHAL.h
 * Description: Header for the file-backed implementation of ISessionHAL.
 * Encapsulates config/state files, the wall clock, and the diagnostic log.
 * =================================================================================
 */
#pragma once

#include "SessionContext.h"
#include "Types.h"
#include <string>

class FileSessionHAL : public ISessionHAL {
private:
  // --- Locations ---
  std::string _configDir;
  std::string _dataDir;
  std::string _configPath;
  std::string _statePath;
  std::string _logPath;

  // --- Error Reporting ---
  std::string _lastError;

  bool prepareDirectory(const std::string &dir);

public:
  FileSessionHAL(const std::string &configDir, const std::string &dataDir);

  // --- Paths ---
  const std::string &getConfigPath() const { return _configPath; }
  const std::string &getLogPath() const { return _logPath; }

  // Reason for the most recent failed write, "" if none.
  const std::string &getLastError() const { return _lastError; }

  // --- Logging API ---
  void log(const char *message) override;
  void logKeyValue(const char *key, const char *value);

  // Drains queued log lines to the log file. Only if the data directory exists.
  bool flushLog();

  // --- ISessionHAL Implementation ---
  bool loadConfig(PomodoroConfig &config) override;
  bool saveConfig(const PomodoroConfig &config) override;
  LoadResult loadState(SessionState &state) override;
  bool saveState(const SessionState &state) override;
  uint64_t now() override;
};
