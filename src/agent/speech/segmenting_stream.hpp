#pragma once

#include "../channel.hpp"
#include "speech_engine.hpp"
#include "utterance_segmenter.hpp"

#include <functional>
#include <span>
#include <thread>

// A SpeechStream over a non-streaming recognizer: a worker thread segments
// the incoming audio into utterances and transcribes each one, re-running the
// recognizer on the growing utterance to produce interim results.
class SegmentingSpeechStream : public SpeechStream {
public:
    // Transcribes one mono utterance. Called on the worker thread.
    using TranscribeFn = std::function<std::expected<SpeechAlternative, std::string>(
        std::span<const int16_t> mono, uint32_t sample_rate)>;

    // Queued input frames above which interim results are skipped, so a
    // recognizer slower than real time only spends its time on finals.
    static constexpr size_t MAX_BACKLOG_FRAMES = 50;

    SegmentingSpeechStream(UtteranceSegmenter::Params params, TranscribeFn transcribe);
    ~SegmentingSpeechStream() override;

    SegmentingSpeechStream(const SegmentingSpeechStream&) = delete;
    SegmentingSpeechStream& operator=(const SegmentingSpeechStream&) = delete;

    std::expected<void, std::string> push_frame(const AudioFrame& frame) override;
    void end_input() override;
    std::expected<std::optional<SpeechEvent>, std::string> next_event() override;
    void cancel() override;

private:
    void run(std::stop_token stoken);
    bool emit_interim();
    bool emit_final();

    UtteranceSegmenter segmenter_;
    TranscribeFn transcribe_;

    Channel<AudioFrame> input_;
    Channel<SpeechEvent> events_;

    // Last member: joined before the channels go away.
    std::jthread worker_;
};
