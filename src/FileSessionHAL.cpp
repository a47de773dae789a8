/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      src/FileSessionHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * File-backed session HAL. Config lives under the user config directory,
 * the session record and the log under the user data directory. Directories
 * are created on the first write only, so read-only commands leave no trace.
 * =================================================================================
 */
#include "FileSessionHAL.h"

#include <sys/stat.h>
#include <time.h>

#include "Config.h"
#include "Logger.h"
#include "SettingsManager.h"
#include "Storage.h"
#include "Utils.h"

FileSessionHAL::FileSessionHAL(const std::string &configDir, const std::string &dataDir)
    : _configDir(configDir), _dataDir(dataDir), _configPath(joinPath(configDir, CONFIG_FILE_NAME)),
      _statePath(joinPath(dataDir, STATE_FILE_NAME)), _logPath(joinPath(dataDir, LOG_FILE_NAME)) {}

bool FileSessionHAL::prepareDirectory(const std::string &dir) {
  std::string err;
  if (!ensureDirectory(dir, err)) {
    _lastError = err;
    logKeyValue("Storage", err.c_str());
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: LOGGING
// =================================================================================

void FileSessionHAL::log(const char *message) { logMessage(message); }

void FileSessionHAL::logKeyValue(const char *key, const char *value) { ::logKeyValue(key, value); }

bool FileSessionHAL::flushLog() {
  struct stat st;
  if (stat(_dataDir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
    // Nothing was ever written for this user; keep read-only commands traceless.
    clearLogQueue();
    return true;
  }
  return flushLogQueue(_logPath.c_str());
}

// =================================================================================
// SECTION: CONFIGURATION
// =================================================================================

bool FileSessionHAL::loadConfig(PomodoroConfig &config) { return SettingsManager::loadConfig(_configPath, config); }

bool FileSessionHAL::saveConfig(const PomodoroConfig &config) {
  if (!prepareDirectory(_configDir)) {
    return false;
  }

  std::string err;
  if (!SettingsManager::saveConfig(_configPath, config, err)) {
    _lastError = err;
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: SESSION STATE
// =================================================================================

LoadResult FileSessionHAL::loadState(SessionState &state) { return loadSessionState(_statePath, state); }

bool FileSessionHAL::saveState(const SessionState &state) {
  if (!prepareDirectory(_dataDir)) {
    return false;
  }

  std::string err;
  if (!saveSessionState(_statePath, state, err)) {
    _lastError = err;
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: CLOCK
// =================================================================================

uint64_t FileSessionHAL::now() {
  time_t t = time(nullptr);
  if (t < 0) {
    return 0;
  }
  return (uint64_t)t;
}
