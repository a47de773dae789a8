/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      lib/PomodoroEngine/Session.cpp
 *
 * Description:
 * Session lifecycle commands (start / stop / status / init).
 * - Uses 'PhaseEngine' for all time arithmetic.
 * - Reaches storage, the clock and the log only through ISessionHAL.
 * - Load failures never abort a command; write failures always do.
 * =================================================================================
 */
#include <stdio.h>

#include "Session.h"
#include "PhaseEngine.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: CONSTRUCTOR
// =================================================================================

PomodoroSession::PomodoroSession(ISessionHAL& hal)
    : _hal(hal),
      _config(DEFAULT_POMODORO_CONFIG),
      _state(EMPTY_SESSION_STATE),
      _lastPhase(PhaseEngine::idle())
{
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging & Loading)
// =================================================================================

void PomodoroSession::logKeyValue(const char *key, const char *value) {
    char tempBuf[128];
    // Format: " Key : Value"
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void PomodoroSession::loadConfig() {
    if (!_hal.loadConfig(_config)) {
        _config = DEFAULT_POMODORO_CONFIG;
        logKeyValue("Config", "Using built-in defaults.");
    }
}

LoadResult PomodoroSession::loadState() {
    LoadResult result = _hal.loadState(_state);
    if (result != LOAD_OK) {
        _state = EMPTY_SESSION_STATE;
    }
    return result;
}

bool PomodoroSession::resetToIdle() {
    SessionState cleared = EMPTY_SESSION_STATE;
    if (!_hal.saveState(cleared)) {
        return false;
    }
    _state = cleared;
    return true;
}

void PomodoroSession::printConfigSummary() {
    char logBuf[128];
    char timeStr[32];

    _hal.log("[ SCHEDULE ]");

    TimeUtils::formatSeconds(_config.workDuration, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-12s : %s", "Work", timeStr);
    _hal.log(logBuf);

    TimeUtils::formatSeconds(_config.restDuration, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-12s : %s", "Rest", timeStr);
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-12s : %lu", "Repeat Count", (unsigned long)_config.repeatCount);
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-12s : %s", "Display", displayModeToString(_config.displayMode));
    _hal.log(logBuf);
}

// =================================================================================
// SECTION: COMMANDS
// =================================================================================

/**
 * Starts a new pomodoro at the current time.
 * Any running pomodoro is replaced unconditionally.
 */
int PomodoroSession::start() {
  loadConfig();

  SessionState next;
  next.hasStartedAt = true;
  next.startedAt = _hal.now();

  if (!_hal.saveState(next)) {
    logKeyValue("Session", "Could not persist start.");
    return 500; // Storage Failure
  }
  _state = next;
  _lastPhase = PhaseEngine::computePhase(_state, next.startedAt, _config);

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), ">>> SESSION STARTED at %llu", (unsigned long long)next.startedAt);
  logKeyValue("Session", logBuf);
  printConfigSummary();

  return 200;
}

/**
 * Clears the running pomodoro.
 * Nothing stored (or already idle) is not an error; nothing is written then.
 * A malformed record is replaced by a clean idle one.
 */
int PomodoroSession::stop() {
  LoadResult loaded = loadState();

  if (loaded == LOAD_MALFORMED) {
    if (!resetToIdle()) {
      logKeyValue("Session", "Could not replace malformed session record.");
      return 500; // Storage Failure
    }
    _lastPhase = PhaseEngine::idle();
    logKeyValue("Session", "Replaced malformed session record.");
    return 200;
  }

  if (!_state.hasStartedAt) {
    logKeyValue("Session", "Stop requested, no pomodoro running.");
    _lastPhase = PhaseEngine::idle();
    return 304; // Not Modified
  }

  if (!resetToIdle()) {
    logKeyValue("Session", "Could not persist stop.");
    return 500; // Storage Failure
  }
  _lastPhase = PhaseEngine::idle();

  logKeyValue("Session", ">>> SESSION STOPPED");
  return 200;
}

/**
 * Renders the current phase into 'buffer'. Read-only: never writes state.
 */
int PomodoroSession::status(char *buffer, size_t size) {
  loadConfig();
  loadState();

  uint64_t now = _hal.now();
  _lastPhase = PhaseEngine::computePhase(_state, now, _config);
  PhaseEngine::formatPhase(_lastPhase, _config.displayMode, buffer, size);

  return 200;
}

/**
 * Writes a default configuration. Only with 'force'; otherwise the
 * existing configuration (if any) is left untouched.
 */
int PomodoroSession::init(bool force) {
  if (!force) {
    logKeyValue("Config", "Init without force, nothing written.");
    return 304; // Not Modified
  }

  PomodoroConfig defaults = DEFAULT_POMODORO_CONFIG;
  if (!_hal.saveConfig(defaults)) {
    logKeyValue("Config", "Could not write default configuration.");
    return 500; // Storage Failure
  }
  _config = defaults;

  logKeyValue("Config", "Wrote default configuration.");
  return 200;
}
