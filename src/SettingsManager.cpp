/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Implementation of configuration loading, validation and saving.
 * =================================================================================
 */
#include "SettingsManager.h"
#include "Logger.h"
#include "SettingsCodec.h"
#include "Storage.h"
#include "TimeUtils.h"

#include <stdio.h>

void SettingsManager::log(const char *key, const char *val) { logKeyValue(key, val); }

// =================================================================================
// SECTION: LOAD
// =================================================================================

bool SettingsManager::loadConfig(const std::string &path, PomodoroConfig &config) {
  config = DEFAULT_POMODORO_CONFIG;

  std::string text;
  std::string err;
  ReadResult result = readTextFile(path, text, err);

  if (result == READ_MISSING) {
    log("Settings", "No config file. Using defaults.");
    return false;
  }
  if (result == READ_FAILED) {
    std::string msg = err + " (using defaults)";
    log("Settings", msg.c_str());
    return false;
  }

  PomodoroConfig parsed;
  if (!SettingsCodec::decodeConfig(text, parsed, err)) {
    std::string msg = "Ignoring invalid " + path + ": " + err;
    log("Settings", msg.c_str());
    return false;
  }

  config = parsed;

  char logBuf[96];
  snprintf(logBuf, sizeof(logBuf), "Loaded config. Work %lu min, Rest %lu min.",
           (unsigned long)TimeUtils::secondsToMinutes(config.workDuration),
           (unsigned long)TimeUtils::secondsToMinutes(config.restDuration));
  log("Settings", logBuf);
  return true;
}

// =================================================================================
// SECTION: SAVE
// =================================================================================

bool SettingsManager::saveConfig(const std::string &path, const PomodoroConfig &config, std::string &errorMsg) {
  if (!SettingsCodec::validateConfig(config, errorMsg)) {
    log("Settings", errorMsg.c_str());
    return false;
  }

  std::string text;
  SettingsCodec::encodeConfig(config, text);

  if (!writeTextFileAtomic(path, text, errorMsg)) {
    log("Settings", errorMsg.c_str());
    return false;
  }

  log("Settings", "Saved config.");
  return true;
}
