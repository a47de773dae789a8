/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      lib/PomodoroEngine/TimeUtils.h
 *
 * Description:
 * Static utility class for time conversion and string formatting.
 * Converts raw seconds into human-readable duration strings (e.g. "1h 10min 5s")
 * for log output, and handles the minute <-> second conversion used by the
 * persisted configuration.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdio.h>
#include <stdint.h>

class TimeUtils {
public:
    static const unsigned long SECS_MIN  = 60;
    static const unsigned long SECS_HOUR = 3600;

    /**
     * Formats seconds into a human-readable string (e.g., "1h 10min 5s").
     * Units with 0 values are omitted unless the total time is 0s.
     * @param totalSeconds The duration in seconds.
     * @param buffer       The destination buffer.
     * @param size         The size of the buffer.
     */
    static void formatSeconds(unsigned long totalSeconds, char *buffer, size_t size) {
        if (size == 0) return;
        if (totalSeconds == 0) {
            snprintf(buffer, size, "0s");
            return;
        }

        unsigned long h = totalSeconds / SECS_HOUR;
        unsigned long m = (totalSeconds % SECS_HOUR) / SECS_MIN;
        unsigned long s = totalSeconds % SECS_MIN;

        buffer[0] = '\0';
        size_t offset = 0;

        auto append = [&](unsigned long val, const char* suffix) {
            if (val > 0 && offset < size) {
                int written = snprintf(buffer + offset, size - offset, "%s%lu%s",
                                       offset > 0 ? " " : "", val, suffix);
                if (written > 0) offset += (size_t)written;
            }
        };

        append(h, "h");
        append(m, "min");
        append(s, "s");
    }

    /**
     * Persisted durations are whole minutes.
     */
    static uint32_t minutesToSeconds(uint32_t minutes) {
        return minutes * (uint32_t)SECS_MIN;
    }

    // Truncating.
    static uint32_t secondsToMinutes(uint32_t seconds) {
        return seconds / (uint32_t)SECS_MIN;
    }
};
