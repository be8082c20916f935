#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("room")) {
            auto& r = j["room"];
            if (r.contains("bridge")) cfg.room.bridge = r["bridge"].get<std::string>();
            if (r.contains("connect_timeout_ms")) cfg.room.connect_timeout_ms = r["connect_timeout_ms"].get<uint32_t>();
        }

        if (j.contains("speech")) {
            auto& s = j["speech"];
            if (s.contains("url")) cfg.speech.url = s["url"].get<std::string>();
            if (s.contains("api_format")) cfg.speech.api_format = s["api_format"].get<std::string>();
            if (s.contains("language")) cfg.speech.language = s["language"].get<std::string>();
            if (s.contains("timeout_s")) cfg.speech.timeout_s = s["timeout_s"].get<long>();
            if (s.contains("silence_threshold")) cfg.speech.silence_threshold = s["silence_threshold"].get<double>();
            if (s.contains("silence_ms")) cfg.speech.silence_ms = s["silence_ms"].get<uint32_t>();
            if (s.contains("interim_interval_ms")) cfg.speech.interim_interval_ms = s["interim_interval_ms"].get<uint32_t>();
            if (s.contains("max_utterance_s")) cfg.speech.max_utterance_s = s["max_utterance_s"].get<uint32_t>();
            if (s.contains("min_speech_ms")) cfg.speech.min_speech_ms = s["min_speech_ms"].get<uint32_t>();
        }

        if (j.contains("storage")) {
            auto& st = j["storage"];
            if (st.contains("transcript_dir")) cfg.storage.transcript_dir = st["transcript_dir"].get<std::string>();
        }

        if (j.contains("heartbeat")) {
            auto& h = j["heartbeat"];
            if (h.contains("interval_s")) cfg.heartbeat.interval_s = h["interval_s"].get<uint32_t>();
        }

        if (j.contains("status")) {
            auto& st = j["status"];
            if (st.contains("socket")) cfg.status.socket = st["socket"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    if (cfg.heartbeat.interval_s == 0) {
        std::println(stderr, "config: heartbeat.interval_s must be positive, using 30");
        cfg.heartbeat.interval_s = 30;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    if (const char* v = std::getenv("ROOM_TRANSCRIBER_BRIDGE"); v && *v) room.bridge = v;
    if (const char* v = std::getenv("ROOM_TRANSCRIBER_SPEECH_URL"); v && *v) speech.url = v;
    if (const char* v = std::getenv("ROOM_TRANSCRIBER_TRANSCRIPT_DIR"); v && *v) storage.transcript_dir = v;
}
