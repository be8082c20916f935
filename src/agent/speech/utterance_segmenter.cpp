#include "utterance_segmenter.hpp"

#include <cmath>

UtteranceSegmenter::UtteranceSegmenter(Params params) : params_(params) {}

double UtteranceSegmenter::rms(std::span<const int16_t> samples) {
    if (samples.empty()) return 0.0;
    double sum = 0.0;
    for (int16_t s : samples) {
        sum += static_cast<double>(s) * s;
    }
    return std::sqrt(sum / static_cast<double>(samples.size()));
}

uint64_t UtteranceSegmenter::to_ms(uint64_t samples) const {
    return samples * 1000 / sample_rate_;
}

UtteranceSegmenter::Decision UtteranceSegmenter::feed(std::span<const int16_t> mono,
                                                      uint32_t sample_rate) {
    if (mono.empty() || sample_rate == 0) return Decision::None;

    // The rate is fixed for the lifetime of an utterance.
    if (utterance_.empty()) sample_rate_ = sample_rate;

    bool loud = rms(mono) >= params_.silence_threshold;
    if (!in_speech_) {
        if (!loud) return Decision::None;
        in_speech_ = true;
    }

    utterance_.insert(utterance_.end(), mono.begin(), mono.end());
    if (loud) {
        speech_samples_ += mono.size();
        silence_samples_ = 0;
    } else {
        silence_samples_ += mono.size();
    }

    if (to_ms(silence_samples_) >= params_.silence_ms) {
        if (to_ms(speech_samples_) < params_.min_speech_ms) {
            reset();
            return Decision::None;
        }
        return Decision::Final;
    }

    if (to_ms(utterance_.size()) >= params_.max_utterance_ms) {
        return Decision::Final;
    }

    if (to_ms(utterance_.size() - samples_at_last_interim_) >= params_.interim_interval_ms) {
        samples_at_last_interim_ = utterance_.size();
        return Decision::Interim;
    }

    return Decision::None;
}

bool UtteranceSegmenter::has_speech() const {
    return in_speech_ && to_ms(speech_samples_) >= params_.min_speech_ms;
}

std::vector<int16_t> UtteranceSegmenter::take_utterance() {
    auto out = std::move(utterance_);
    reset();
    return out;
}

void UtteranceSegmenter::reset() {
    utterance_.clear();
    in_speech_ = false;
    speech_samples_ = 0;
    silence_samples_ = 0;
    samples_at_last_interim_ = 0;
}
