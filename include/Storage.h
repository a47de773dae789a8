/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      Storage.h / Storage.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * File storage abstraction. Reads and atomically replaces small text files,
 * creates the application directories, and saves/loads the session record
 * (state.json) so a running pomodoro survives between invocations.
 * =================================================================================
 */
#ifndef STORAGE_H
#define STORAGE_H

#include <stdint.h>
#include <string>

#include "Types.h"

enum ReadResult : uint8_t { READ_OK, READ_MISSING, READ_FAILED };

// =================================================================================
// SECTION: FILE PRIMITIVES
// =================================================================================

ReadResult readTextFile(const std::string &path, std::string &out, std::string &errorMsg);

/**
 * Writes 'text' to a temporary file beside 'path' and renames it over 'path'.
 * Readers see either the old or the new record, never a partial one.
 */
bool writeTextFileAtomic(const std::string &path, const std::string &text, std::string &errorMsg);

// mkdir -p with APP_DIR_MODE for every missing component.
bool ensureDirectory(const std::string &path, std::string &errorMsg);

// =================================================================================
// SECTION: SESSION STATE (state.json)
// =================================================================================

/**
 * Loads the session record.
 * @return LOAD_OK if a valid record was found. Missing, unreadable or
 *         malformed records leave 'state' empty and are only logged.
 */
LoadResult loadSessionState(const std::string &path, SessionState &state);

bool saveSessionState(const std::string &path, const SessionState &state, std::string &errorMsg);

#endif
