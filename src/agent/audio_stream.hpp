#pragma once

#include "channel.hpp"

#include <cstdint>
#include <memory>
#include <vector>

struct AudioFrame {
    std::vector<int16_t> samples; // interleaved
    uint32_t sample_rate = 16000;
    uint32_t num_channels = 1;

    size_t samples_per_channel() const {
        return num_channels ? samples.size() / num_channels : 0;
    }
};

// Frames of one remote audio track, finite and consumed once.
using AudioStream = Channel<AudioFrame>;
using AudioStreamPtr = std::shared_ptr<AudioStream>;
