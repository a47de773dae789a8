/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      Utils.h / Utils.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * General utility functions. Path joining and resolution of the per-user
 * configuration and data directories (XDG base directory convention).
 * =================================================================================
 */
#ifndef UTILS_H
#define UTILS_H

#include <string>

// =================================================================================
// SECTION: PATHS
// =================================================================================
std::string joinPath(const std::string &dir, const std::string &name);

/**
 * Resolves the application directories:
 *   config: $XDG_CONFIG_HOME/tomato  or  $HOME/.config/tomato
 *   data:   $XDG_DATA_HOME/tomato    or  $HOME/.local/share/tomato
 * Relative XDG values are ignored (XDG base directory rules).
 * Nothing is created here.
 * @return false if neither the XDG variable nor HOME is usable.
 */
bool resolveUserDirectories(std::string &configDir, std::string &dataDir, std::string &errorMsg);

#endif
