#include <catch2/catch_test_macros.hpp>

#include "messages.hpp"

#include <chrono>
#include <regex>

using json = nlohmann::json;

TEST_CASE("Messages", "[messages]") {

    SECTION("TimestampFormat") {
        auto ts = iso_timestamp_now();
        REQUIRE(std::regex_match(ts, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6})")));
    }

    SECTION("TimestampKeepsMicroseconds") {
        auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)) +
                  std::chrono::microseconds(42);
        REQUIRE(iso_timestamp(tp).ends_with(".000042"));
    }

    SECTION("TranscriptMessageShape") {
        TranscriptMessage msg{
            .text = "hello",
            .is_final = true,
            .participant = "alice",
            .timestamp = "2025-03-01T14:05:09.123456",
            .confidence = 0.5,
        };
        auto j = msg.to_json();
        REQUIRE(j["type"] == "transcription");
        REQUIRE(j["text"] == "hello");
        REQUIRE(j["isFinal"] == true);
        REQUIRE(j["participant"] == "alice");
        REQUIRE(j["timestamp"] == "2025-03-01T14:05:09.123456");
        REQUIRE(j["confidence"] == 0.5);
        REQUIRE(j.size() == 6);
    }

    SECTION("MissingConfidenceIsNull") {
        TranscriptMessage msg{.text = "hi", .is_final = false, .participant = "bob",
                              .timestamp = "t", .confidence = std::nullopt};
        auto j = msg.to_json();
        REQUIRE(j.contains("confidence"));
        REQUIRE(j["confidence"].is_null());
    }

    SECTION("HeartbeatShape") {
        HeartbeatMessage msg{.active_sessions = 3, .timestamp = "t"};
        auto j = msg.to_json();
        REQUIRE(j["type"] == "agent_status");
        REQUIRE(j["status"] == "active");
        REQUIRE(j["processing_tracks"] == 3);
        REQUIRE(j["timestamp"] == "t");
    }

    SECTION("RecordFromJson") {
        auto rec = TranscriptRecord::from_json(
            {{"timestamp", "t"}, {"participant", "alice"}, {"text", "hi"}, {"room", "r"}});
        REQUIRE(rec.has_value());
        REQUIRE(rec->participant == "alice");
        REQUIRE(rec->to_json()["text"] == "hi");

        REQUIRE_FALSE(TranscriptRecord::from_json(json::array()).has_value());
        REQUIRE_FALSE(TranscriptRecord::from_json({{"text", 5}}).has_value());
    }

    SECTION("HasText") {
        REQUIRE(has_text("a"));
        REQUIRE(has_text("  a  "));
        REQUIRE_FALSE(has_text(""));
        REQUIRE_FALSE(has_text(" \t\r\n"));
    }
}
