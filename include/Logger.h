/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      Logger.h / Logger.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Diagnostic logging. Messages are queued in memory while a command runs and
 * drained to the log file once at the end of the invocation, so stdout stays
 * reserved for command output (status bars read it).
 * =================================================================================
 */
#ifndef LOGGER_H
#define LOGGER_H

#include <stddef.h>

// =================================================================================
// SECTION: CORE LOGGING FUNCTIONS
// =================================================================================
void logMessage(const char *message);

// Format: " Key      : Value"
void logKeyValue(const char *key, const char *value);

/**
 * Appends all queued messages to 'path' and empties the queue.
 * The file is started over once it grows past LOG_FILE_MAX_BYTES.
 * @return false if the file could not be written (queue is still emptied).
 */
bool flushLogQueue(const char *path);

int pendingLogCount();
int droppedLogCount();
void clearLogQueue();

// Read access for tests / diagnostics. Returns "" when out of range.
const char *getLogLine(int index);

#endif
