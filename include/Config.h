/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file. Defines the application identity, on-disk
 * layout (directory and file names) and logging limits.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// --- Application Identity ---
#define APP_NAME "tomato"

#ifndef APP_VERSION
#define APP_VERSION "0.0.0-dev"
#endif

// =================================================================================
// SECTION: ON-DISK LAYOUT
// =================================================================================

// Directory created under $XDG_CONFIG_HOME / $XDG_DATA_HOME
#define APP_DIR_NAME "tomato"

// Fallbacks relative to $HOME when the XDG variables are unset
#define CONFIG_HOME_FALLBACK ".config"
#define DATA_HOME_FALLBACK ".local/share"

#define CONFIG_FILE_NAME "config.json"
#define STATE_FILE_NAME "state.json"
#define LOG_FILE_NAME "tomato.log"

#define APP_DIR_MODE 0700

// =================================================================================
// SECTION: LOGGING
// =================================================================================

#define LOG_QUEUE_SIZE 50
#define MAX_LOG_LENGTH 150
#define LOG_FILE_MAX_BYTES 65536
