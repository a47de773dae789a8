/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Controller for the user configuration file (config.json).
 * - Loads with fallback to defaults (never fails outward).
 * - Validates through SettingsCodec before anything reaches the engine.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include <string>

class SettingsManager {
public:
  /**
   * Loads the configuration from 'path'.
   * @return true if a valid file was used. On false, 'config' holds
   *         DEFAULT_POMODORO_CONFIG and the reason has been logged.
   */
  static bool loadConfig(const std::string &path, PomodoroConfig &config);

  // Validates, then atomically replaces the file. Directory must exist.
  static bool saveConfig(const std::string &path, const PomodoroConfig &config, std::string &errorMsg);

private:
  static void log(const char *key, const char *value);
};
