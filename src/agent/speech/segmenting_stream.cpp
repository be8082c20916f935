#include "segmenting_stream.hpp"

#include "pcm.hpp"

SegmentingSpeechStream::SegmentingSpeechStream(UtteranceSegmenter::Params params,
                                               TranscribeFn transcribe)
    : segmenter_(params), transcribe_(std::move(transcribe)),
      worker_([this](std::stop_token stoken) { run(stoken); }) {}

SegmentingSpeechStream::~SegmentingSpeechStream() {
    cancel();
}

std::expected<void, std::string> SegmentingSpeechStream::push_frame(const AudioFrame& frame) {
    if (!input_.push(frame)) {
        return std::unexpected("speech stream input already ended");
    }
    return {};
}

void SegmentingSpeechStream::end_input() {
    input_.close();
}

std::expected<std::optional<SpeechEvent>, std::string> SegmentingSpeechStream::next_event() {
    return events_.next();
}

void SegmentingSpeechStream::cancel() {
    worker_.request_stop();
    input_.close();
    events_.close();
}

void SegmentingSpeechStream::run(std::stop_token stoken) {
    while (true) {
        auto item = input_.next(stoken);
        if (!item) {
            events_.fail(item.error());
            return;
        }
        if (!item->has_value()) break;

        const AudioFrame& frame = **item;
        auto mono = pcm::downmix(frame.samples, frame.num_channels);

        bool ok = true;
        switch (segmenter_.feed(mono, frame.sample_rate)) {
            case UtteranceSegmenter::Decision::Interim:
                if (input_.size() <= MAX_BACKLOG_FRAMES) ok = emit_interim();
                break;
            case UtteranceSegmenter::Decision::Final:
                ok = emit_final();
                break;
            case UtteranceSegmenter::Decision::None:
                break;
        }
        if (!ok) return;
    }

    if (stoken.stop_requested()) {
        events_.close();
        return;
    }

    // Input ended: whatever speech is still buffered becomes a final result.
    if (segmenter_.has_speech() && !emit_final()) return;
    events_.close();
}

bool SegmentingSpeechStream::emit_interim() {
    auto result = transcribe_(segmenter_.utterance(), segmenter_.sample_rate());
    if (!result) {
        events_.fail(result.error());
        return false;
    }
    events_.push(SpeechEvent{SpeechEventType::InterimTranscript, {std::move(*result)}});
    return true;
}

bool SegmentingSpeechStream::emit_final() {
    auto rate = segmenter_.sample_rate();
    auto audio = segmenter_.take_utterance();
    auto result = transcribe_(audio, rate);
    if (!result) {
        events_.fail(result.error());
        return false;
    }
    events_.push(SpeechEvent{SpeechEventType::FinalTranscript, {std::move(*result)}});
    events_.push(SpeechEvent{SpeechEventType::EndOfSpeech, {}});
    return true;
}
