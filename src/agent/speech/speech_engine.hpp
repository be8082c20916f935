#pragma once

#include "../audio_stream.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class SpeechEventType { InterimTranscript, FinalTranscript, EndOfSpeech };

struct SpeechAlternative {
    std::string text;
    std::optional<double> confidence;
};

struct SpeechEvent {
    SpeechEventType type = SpeechEventType::InterimTranscript;
    // Ranked, best first. Empty for EndOfSpeech.
    std::vector<SpeechAlternative> alternatives;
};

// One recognition conversation. push_frame()/end_input() are called from the
// frame-forwarding thread, next_event() from the event-draining thread.
class SpeechStream {
public:
    virtual ~SpeechStream() = default;

    virtual std::expected<void, std::string> push_frame(const AudioFrame& frame) = 0;

    // No more audio follows. Pending speech is flushed, then the event
    // sequence ends.
    virtual void end_input() = 0;

    // Blocks for the next event. nullopt once the sequence has ended.
    virtual std::expected<std::optional<SpeechEvent>, std::string> next_event() = 0;

    // Abandon the conversation; both sides unblock.
    virtual void cancel() = 0;
};

class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;
    virtual std::expected<std::unique_ptr<SpeechStream>, std::string> open_stream() = 0;
};
