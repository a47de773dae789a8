/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      lib/PomodoroEngine/Session.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Header for the PomodoroSession class.
 *
 * NOTES:
 * 1. Decoupled from files/clock/logging via ISessionHAL.
 * 2. Phase logic lives in PhaseEngine; this class only orchestrates
 *    load -> compute -> persist for each command.
 * 3. Commands return HTTP-style status codes (200 OK, 304 Not Modified,
 *    500 Storage Failure).
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "SessionContext.h"

class PomodoroSession {
public:
    explicit PomodoroSession(ISessionHAL& hal);

    // --- Commands ---
    int start();
    int stop();
    int status(char *buffer, size_t size);
    int init(bool force);

    // --- Accessors (valid after a command ran) ---
    const PomodoroConfig& getConfig() const { return _config; }
    const SessionState& getState() const { return _state; }
    const Phase& getLastPhase() const { return _lastPhase; }

    void printConfigSummary();

private:
    ISessionHAL& _hal;

    PomodoroConfig _config;
    SessionState _state;
    Phase _lastPhase;

    void loadConfig();
    LoadResult loadState();
    bool resetToIdle();

    void logKeyValue(const char *key, const char *value);
};
