/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      Utils.h / Utils.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "Utils.h"
#include "Config.h"

#include <stdlib.h>

std::string joinPath(const std::string &dir, const std::string &name) {
  if (dir.empty())
    return name;
  if (dir[dir.size() - 1] == '/')
    return dir + name;
  return dir + "/" + name;
}

/**
 * Returns the base directory for one XDG variable, or "" if unresolvable.
 */
static std::string resolveBaseDirectory(const char *xdgVariable, const char *homeFallback) {
  const char *xdg = getenv(xdgVariable);
  if (xdg && xdg[0] == '/') {
    return std::string(xdg);
  }

  const char *home = getenv("HOME");
  if (!home || !*home) {
    return std::string();
  }
  return joinPath(home, homeFallback);
}

bool resolveUserDirectories(std::string &configDir, std::string &dataDir, std::string &errorMsg) {
  std::string configBase = resolveBaseDirectory("XDG_CONFIG_HOME", CONFIG_HOME_FALLBACK);
  std::string dataBase = resolveBaseDirectory("XDG_DATA_HOME", DATA_HOME_FALLBACK);

  if (configBase.empty() || dataBase.empty()) {
    errorMsg = "cannot locate home directory (HOME is not set)";
    return false;
  }

  configDir = joinPath(configBase, APP_DIR_NAME);
  dataDir = joinPath(dataBase, APP_DIR_NAME);
  return true;
}
