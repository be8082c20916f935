#pragma once

#include "speech_engine.hpp"
#include "utterance_segmenter.hpp"

#include <span>
#include <string>

// Speech engine backed by a whisper.cpp server or an OpenAI-compatible
// transcription endpoint on the local network.
class LanSpeechEngine : public SpeechEngine {
public:
    struct Options {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
        long timeout_s = 60;
        UtteranceSegmenter::Params segmenter;
    };

    explicit LanSpeechEngine(Options opts);
    ~LanSpeechEngine() override;

    LanSpeechEngine(const LanSpeechEngine&) = delete;
    LanSpeechEngine& operator=(const LanSpeechEngine&) = delete;

    std::expected<std::unique_ptr<SpeechStream>, std::string> open_stream() override;

    // One blocking HTTP round trip for a mono utterance.
    std::expected<SpeechAlternative, std::string>
        transcribe(std::span<const int16_t> mono, uint32_t sample_rate) const;

private:
    Options opts_;
};
