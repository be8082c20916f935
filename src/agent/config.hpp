#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Room {
        std::string bridge;                // gateway socket; empty = platform default
        uint32_t connect_timeout_ms = 10000;
    } room;

    struct Speech {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
        long timeout_s = 60;

        double silence_threshold = 500.0;
        uint32_t silence_ms = 700;
        uint32_t interim_interval_ms = 1000;
        uint32_t max_utterance_s = 15;
        uint32_t min_speech_ms = 200;
    } speech;

    struct Storage {
        std::string transcript_dir;        // empty = platform data dir
    } storage;

    struct Heartbeat {
        uint32_t interval_s = 30;
    } heartbeat;

    struct Status {
        std::string socket;                // empty = platform default
    } status;

    // Environment wins over the file: ROOM_TRANSCRIBER_BRIDGE,
    // ROOM_TRANSCRIBER_SPEECH_URL, ROOM_TRANSCRIBER_TRANSCRIPT_DIR.
    void apply_env();

    static Config load(const std::string& path);
    static Config load_default();
};
