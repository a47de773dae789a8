#include "SettingsCodec.h"
#include "TimeUtils.h"
#include <string.h>

bool SettingsCodec::parseDisplayMode(const char* name, DisplayMode& outMode) {
    if (!name) return false;
    if (strcmp(name, "text") == 0) {
        outMode = DISPLAY_TEXT;
        return true;
    }
    if (strcmp(name, "compact") == 0) {
        outMode = DISPLAY_COMPACT;
        return true;
    }
    return false;
}

bool SettingsCodec::validateConfig(const PomodoroConfig& config, std::string& errorMsg) {
    if (config.workDuration == 0) {
        errorMsg = "duration must be at least 1 minute.";
        return false;
    }
    if (config.workDuration > TimeUtils::minutesToSeconds(MAX_WORK_MINUTES)) {
        errorMsg = "duration too long (max " + std::to_string(MAX_WORK_MINUTES) + " minutes).";
        return false;
    }
    if (config.restDuration > TimeUtils::minutesToSeconds(MAX_REST_MINUTES)) {
        errorMsg = "rest too long (max " + std::to_string(MAX_REST_MINUTES) + " minutes).";
        return false;
    }
    if (config.repeatCount == 0 || config.repeatCount > MAX_REPEAT_COUNT) {
        errorMsg = "count must be between 1 and " + std::to_string(MAX_REPEAT_COUNT) + ".";
        return false;
    }
    return true;
}

bool SettingsCodec::parseConfig(JsonVariantConst json, PomodoroConfig& outConfig, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Config must be a JSON object.";
        return false;
    }

    PomodoroConfig parsed = DEFAULT_POMODORO_CONFIG;

    // 1. Repeat Count
    JsonVariantConst count = json["count"];
    if (!count.isNull()) {
        if (!count.is<uint32_t>()) {
            errorMsg = "count must be a non-negative integer.";
            return false;
        }
        parsed.repeatCount = count.as<uint32_t>();
    }

    // 2. Durations (persisted as whole minutes)
    JsonVariantConst duration = json["duration"];
    if (!duration.isNull()) {
        if (!duration.is<uint32_t>() || duration.as<uint32_t>() > MAX_WORK_MINUTES) {
            errorMsg = "duration must be an integer number of minutes (max " +
                       std::to_string(MAX_WORK_MINUTES) + ").";
            return false;
        }
        parsed.workDuration = TimeUtils::minutesToSeconds(duration.as<uint32_t>());
    }

    JsonVariantConst rest = json["rest"];
    if (!rest.isNull()) {
        if (!rest.is<uint32_t>() || rest.as<uint32_t>() > MAX_REST_MINUTES) {
            errorMsg = "rest must be an integer number of minutes (max " +
                       std::to_string(MAX_REST_MINUTES) + ").";
            return false;
        }
        parsed.restDuration = TimeUtils::minutesToSeconds(rest.as<uint32_t>());
    }

    // 3. Display Mode
    JsonVariantConst display = json["display"];
    if (!display.isNull()) {
        if (!display.is<const char*>() || !parseDisplayMode(display.as<const char*>(), parsed.displayMode)) {
            errorMsg = "display must be \"text\" or \"compact\".";
            return false;
        }
    }

    if (!validateConfig(parsed, errorMsg)) {
        return false;
    }

    outConfig = parsed;
    return true;
}

void SettingsCodec::writeConfig(const PomodoroConfig& config, JsonDocument& doc) {
    doc["count"] = config.repeatCount;
    doc["duration"] = TimeUtils::secondsToMinutes(config.workDuration);
    doc["rest"] = TimeUtils::secondsToMinutes(config.restDuration);
    doc["display"] = displayModeToString(config.displayMode);
}

bool SettingsCodec::parseState(JsonVariantConst json, SessionState& outState, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "State must be a JSON object.";
        return false;
    }

    JsonVariantConst startedAt = json["started_at"];
    if (startedAt.isNull()) {
        outState = EMPTY_SESSION_STATE;
        return true;
    }

    if (!startedAt.is<uint64_t>()) {
        errorMsg = "started_at must be a non-negative integer or null.";
        return false;
    }

    outState.hasStartedAt = true;
    outState.startedAt = startedAt.as<uint64_t>();
    return true;
}

void SettingsCodec::writeState(const SessionState& state, JsonDocument& doc) {
    if (state.hasStartedAt) {
        doc["started_at"] = state.startedAt;
    } else {
        doc["started_at"] = nullptr;
    }
}

bool SettingsCodec::decodeConfig(const std::string& text, PomodoroConfig& outConfig, std::string& errorMsg) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, text);
    if (err) {
        errorMsg = std::string("Invalid JSON: ") + err.c_str();
        return false;
    }
    return parseConfig(doc.as<JsonVariantConst>(), outConfig, errorMsg);
}

void SettingsCodec::encodeConfig(const PomodoroConfig& config, std::string& outText) {
    JsonDocument doc;
    writeConfig(config, doc);
    outText.clear();
    serializeJsonPretty(doc, outText);
    outText += "\n";
}

bool SettingsCodec::decodeState(const std::string& text, SessionState& outState, std::string& errorMsg) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, text);
    if (err) {
        errorMsg = std::string("Invalid JSON: ") + err.c_str();
        return false;
    }
    return parseState(doc.as<JsonVariantConst>(), outState, errorMsg);
}

void SettingsCodec::encodeState(const SessionState& state, std::string& outText) {
    JsonDocument doc;
    writeState(state, doc);
    outText.clear();
    serializeJsonPretty(doc, outText);
    outText += "\n";
}
