#pragma once
#include <ArduinoJson.h>
#include <string>
#include "Types.h"

// --- Safety Limits (persisted units: minutes) ---
#define MAX_WORK_MINUTES 1440
#define MAX_REST_MINUTES 1440
#define MAX_REPEAT_COUNT 255

class SettingsCodec {
public:
    // Parses a config record {"count", "duration", "rest", "display"}.
    // Missing keys keep their default. Wrong types or out-of-range values fail.
    // Returns true if valid. Populates outConfig only on success.
    static bool parseConfig(JsonVariantConst json, PomodoroConfig& outConfig, std::string& errorMsg);

    // Checks the schedule invariants (work > 0, limits). Writes explanation to errorMsg.
    static bool validateConfig(const PomodoroConfig& config, std::string& errorMsg);

    static void writeConfig(const PomodoroConfig& config, JsonDocument& doc);

    // Parses a state record {"started_at": <int> | null}. Missing key means idle.
    static bool parseState(JsonVariantConst json, SessionState& outState, std::string& errorMsg);

    static void writeState(const SessionState& state, JsonDocument& doc);

    // --- Text Helpers (file contents) ---
    static bool decodeConfig(const std::string& text, PomodoroConfig& outConfig, std::string& errorMsg);
    static void encodeConfig(const PomodoroConfig& config, std::string& outText);
    static bool decodeState(const std::string& text, SessionState& outState, std::string& errorMsg);
    static void encodeState(const SessionState& state, std::string& outText);

    static bool parseDisplayMode(const char* name, DisplayMode& outMode);
};
