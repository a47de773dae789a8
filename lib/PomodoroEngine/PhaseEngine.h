/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      lib/PomodoroEngine/PhaseEngine.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Pure phase computation. Maps (start time, current time, schedule) to the
 * current Phase and renders it for terminals and status bars.
 * No I/O, no state. Phase is recomputed from scratch on every query and is
 * never advanced incrementally.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class PhaseEngine {
public:
    /**
     * Derives the current phase.
     *   - No start time                 -> IDLE
     *   - elapsed <= work               -> WORK (remaining = work - elapsed)
     *   - work < elapsed < work + rest  -> REST (remaining = total - elapsed)
     *   - elapsed >= work + rest        -> DONE (sticky)
     * The WORK/REST boundary is inclusive. A clock that went backwards
     * (now < startedAt) counts as zero elapsed.
     */
    static Phase computePhase(const SessionState& state, uint64_t now, const PomodoroConfig& config);

    // Seconds since start, clamped at zero. 0 when no session is running.
    static uint64_t elapsedSeconds(const SessionState& state, uint64_t now);

    /**
     * Renders a phase.
     *   WORK/REST : "W:15m", "R: 3m", "W:45s" (minutes truncated, 2-column value)
     *   IDLE      : "no pomodoro running" (DISPLAY_TEXT) / ">----" (DISPLAY_COMPACT)
     *   DONE      : "READY"               (DISPLAY_TEXT) / ">DONE" (DISPLAY_COMPACT)
     * @param buffer Destination, PHASE_TEXT_MAX_LENGTH is always enough.
     */
    static void formatPhase(const Phase& phase, DisplayMode mode, char *buffer, size_t size);

    // --- Phase Constructors ---
    static Phase idle() { Phase p = { PHASE_IDLE, 0 }; return p; }
    static Phase done() { Phase p = { PHASE_DONE, 0 }; return p; }
    static Phase work(uint32_t remaining) { Phase p = { PHASE_WORK, remaining }; return p; }
    static Phase rest(uint32_t remaining) { Phase p = { PHASE_REST, remaining }; return p; }
};
