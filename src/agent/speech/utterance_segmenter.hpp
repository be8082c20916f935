#pragma once

#include <cstdint>
#include <span>
#include <vector>

// Energy-based voice activity detection over a mono sample stream.
// Splits speech into utterances and tells the caller when to request an
// interim or a final transcription of the current utterance.
class UtteranceSegmenter {
public:
    struct Params {
        double silence_threshold = 500.0; // RMS of int16 samples
        uint32_t silence_ms = 700;        // trailing silence that ends an utterance
        uint32_t interim_interval_ms = 1000;
        uint32_t max_utterance_ms = 15000;
        uint32_t min_speech_ms = 200;     // shorter bursts are discarded
    };

    enum class Decision { None, Interim, Final };

    explicit UtteranceSegmenter(Params params);

    Decision feed(std::span<const int16_t> mono, uint32_t sample_rate);

    // True when an utterance with enough speech is buffered.
    bool has_speech() const;

    const std::vector<int16_t>& utterance() const { return utterance_; }
    uint32_t sample_rate() const { return sample_rate_; }

    // Returns the buffered utterance and starts over.
    std::vector<int16_t> take_utterance();

    static double rms(std::span<const int16_t> samples);

private:
    uint64_t to_ms(uint64_t samples) const;
    void reset();

    Params params_;
    uint32_t sample_rate_ = 16000;

    std::vector<int16_t> utterance_;
    bool in_speech_ = false;
    uint64_t speech_samples_ = 0;
    uint64_t silence_samples_ = 0;
    uint64_t samples_at_last_interim_ = 0;
};
