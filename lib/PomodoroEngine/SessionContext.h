/*
 * =================================================================================
 * File:      lib/PomodoroEngine/SessionContext.h
 * Description: Abstraction layer (HAL) for Storage, Clock, and Logging.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class ISessionHAL {
public:
    virtual ~ISessionHAL() {}

    // --- Configuration Storage ---

    // Fills 'config' from the stored record.
    // Returns false if no usable record exists (missing, unreadable or malformed);
    // 'config' then holds DEFAULT_POMODORO_CONFIG. Never fails outward.
    virtual bool loadConfig(PomodoroConfig& config) = 0;

    // Overwrites the stored configuration. Returns false on any write failure.
    virtual bool saveConfig(const PomodoroConfig& config) = 0;

    // --- Session Storage ---

    // Fills 'state' from the stored record.
    // Anything but LOAD_OK leaves 'state' as EMPTY_SESSION_STATE.
    virtual LoadResult loadState(SessionState& state) = 0;

    // Overwrites the stored session record. Returns false on any write failure.
    virtual bool saveState(const SessionState& state) = 0;

    // --- Clock ---
    // Seconds since the Unix epoch.
    virtual uint64_t now() = 0;

    // --- Logging ---
    virtual void log(const char* message) = 0;
};
