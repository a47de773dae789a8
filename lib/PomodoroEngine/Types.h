/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      lib/PomodoroEngine/Types.h
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

// --- Enums ---
enum PhaseType : uint8_t { PHASE_IDLE, PHASE_WORK, PHASE_REST, PHASE_DONE };
enum DisplayMode : uint8_t { DISPLAY_TEXT, DISPLAY_COMPACT };

// Outcome of reading a stored record
enum LoadResult : uint8_t { LOAD_OK, LOAD_MISSING, LOAD_UNREADABLE, LOAD_MALFORMED };

// --- Constants ---

// Schedule defaults (seconds)
#define DEFAULT_WORK_SECONDS 1500
#define DEFAULT_REST_SECONDS 300
#define DEFAULT_REPEAT_COUNT 8

// Rendering
#define PHASE_TEXT_MAX_LENGTH 32

// --- Configuration Structs ---
struct PomodoroConfig {
  uint32_t workDuration;   // seconds
  uint32_t restDuration;   // seconds
  uint32_t repeatCount;    // pomodoros per set (informational)
  DisplayMode displayMode;
};

// --- State Structs ---
struct SessionState {
  bool hasStartedAt;
  uint64_t startedAt;      // seconds since Unix epoch
};

// Derived on every query, never persisted.
// 'remaining' only carries meaning for PHASE_WORK and PHASE_REST.
struct Phase {
  PhaseType type;
  uint32_t remaining;      // seconds
};

static const PomodoroConfig DEFAULT_POMODORO_CONFIG = {
    DEFAULT_WORK_SECONDS, // workDuration (25 min)
    DEFAULT_REST_SECONDS, // restDuration (5 min)
    DEFAULT_REPEAT_COUNT, // repeatCount
    DISPLAY_TEXT          // displayMode
};

static const SessionState EMPTY_SESSION_STATE = { false, 0 };

/**
 * Work + Rest. Elapsed time at or beyond this value is DONE.
 */
inline uint64_t configTotalSeconds(const PomodoroConfig &config) {
  return (uint64_t)config.workDuration + (uint64_t)config.restDuration;
}

extern const char *phaseToString(PhaseType p);
extern const char *displayModeToString(DisplayMode m);
