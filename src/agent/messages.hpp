#pragma once

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Local time as ISO-8601 with microseconds, e.g. 2025-03-01T14:05:09.123456
std::string iso_timestamp(std::chrono::system_clock::time_point tp);
std::string iso_timestamp_now();

// Broadcast to the room for every non-blank interim or final result.
struct TranscriptMessage {
    std::string text;
    bool is_final = false;
    std::string participant;
    std::string timestamp;
    std::optional<double> confidence;

    nlohmann::json to_json() const;
};

// Periodic liveness report.
struct HeartbeatMessage {
    size_t active_sessions = 0;
    std::string timestamp;

    nlohmann::json to_json() const;
};

// One persisted final transcript.
struct TranscriptRecord {
    std::string timestamp;
    std::string participant;
    std::string text;
    std::string room;

    nlohmann::json to_json() const;
    static std::optional<TranscriptRecord> from_json(const nlohmann::json& j);
};

// True if the text has at least one non-whitespace character.
bool has_text(const std::string& text);
