/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      lib/PomodoroEngine/Types.cpp
 * =================================================================================
 */

#include "Types.h"

const char *phaseToString(PhaseType p) {
  switch (p) {
  case PHASE_IDLE:
    return "IDLE";
  case PHASE_WORK:
    return "WORK";
  case PHASE_REST:
    return "REST";
  case PHASE_DONE:
    return "DONE";
  default:
    return "IDLE";
  }
}

const char *displayModeToString(DisplayMode m) {
  switch (m) {
  case DISPLAY_COMPACT:
    return "compact";
  default:
    return "text";
  }
}
