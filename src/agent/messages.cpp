#include "messages.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <format>

using json = nlohmann::json;

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                      tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;

    std::tm tm{};
    localtime_r(&secs, &tm);
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
}

std::string iso_timestamp_now() {
    return iso_timestamp(std::chrono::system_clock::now());
}

json TranscriptMessage::to_json() const {
    json j = {
        {"type", "transcription"},
        {"text", text},
        {"isFinal", is_final},
        {"participant", participant},
        {"timestamp", timestamp},
    };
    if (confidence) {
        j["confidence"] = *confidence;
    } else {
        j["confidence"] = nullptr;
    }
    return j;
}

json HeartbeatMessage::to_json() const {
    return {
        {"type", "agent_status"},
        {"status", "active"},
        {"processing_tracks", active_sessions},
        {"timestamp", timestamp},
    };
}

json TranscriptRecord::to_json() const {
    return {
        {"timestamp", timestamp},
        {"participant", participant},
        {"text", text},
        {"room", room},
    };
}

std::optional<TranscriptRecord> TranscriptRecord::from_json(const json& j) {
    if (!j.is_object()) return std::nullopt;
    try {
        return TranscriptRecord{
            .timestamp = j.value("timestamp", ""),
            .participant = j.value("participant", ""),
            .text = j.value("text", ""),
            .room = j.value("room", ""),
        };
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

bool has_text(const std::string& text) {
    return std::ranges::any_of(text, [](unsigned char c) { return !std::isspace(c); });
}
