/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      lib/PomodoroEngine/PhaseEngine.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <stdio.h>

#include "PhaseEngine.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: PHASE COMPUTATION
// =================================================================================

uint64_t PhaseEngine::elapsedSeconds(const SessionState& state, uint64_t now) {
    if (!state.hasStartedAt) return 0;
    if (now < state.startedAt) return 0;
    return now - state.startedAt;
}

Phase PhaseEngine::computePhase(const SessionState& state, uint64_t now, const PomodoroConfig& config) {
    if (!state.hasStartedAt) {
        return idle();
    }

    uint64_t elapsed = elapsedSeconds(state, now);
    uint64_t workEnd = config.workDuration;
    uint64_t restEnd = configTotalSeconds(config);

    if (elapsed <= workEnd) {
        return work((uint32_t)(workEnd - elapsed));
    }
    if (elapsed < restEnd) {
        return rest((uint32_t)(restEnd - elapsed));
    }
    return done();
}

// =================================================================================
// SECTION: RENDERING
// =================================================================================

void PhaseEngine::formatPhase(const Phase& phase, DisplayMode mode, char *buffer, size_t size) {
    if (size == 0) return;

    switch (phase.type) {
    case PHASE_WORK:
    case PHASE_REST: {
        char prefix = (phase.type == PHASE_WORK) ? 'W' : 'R';
        if (phase.remaining >= TimeUtils::SECS_MIN) {
            snprintf(buffer, size, "%c:%2lum", prefix,
                     (unsigned long)TimeUtils::secondsToMinutes(phase.remaining));
        } else {
            snprintf(buffer, size, "%c:%2lus", prefix, (unsigned long)phase.remaining);
        }
        break;
    }
    case PHASE_DONE:
        snprintf(buffer, size, "%s", mode == DISPLAY_COMPACT ? ">DONE" : "READY");
        break;
    case PHASE_IDLE:
    default:
        snprintf(buffer, size, "%s", mode == DISPLAY_COMPACT ? ">----" : "no pomodoro running");
        break;
    }
}
