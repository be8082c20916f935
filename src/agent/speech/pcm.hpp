#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace pcm {

// Averages interleaved channels into one.
inline std::vector<int16_t> downmix(std::span<const int16_t> interleaved, uint32_t channels) {
    if (channels <= 1) return {interleaved.begin(), interleaved.end()};

    std::vector<int16_t> mono(interleaved.size() / channels);
    for (size_t i = 0; i < mono.size(); ++i) {
        int32_t sum = 0;
        for (uint32_t c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = static_cast<int16_t>(sum / static_cast<int32_t>(channels));
    }
    return mono;
}

// 16-bit mono PCM wrapped in a RIFF/WAVE container, in memory.
inline std::vector<uint8_t> encode_wav(std::span<const int16_t> mono, uint32_t sample_rate) {
    constexpr uint16_t bits = 16;
    constexpr uint16_t block_align = bits / 8;
    const uint32_t data_size = static_cast<uint32_t>(mono.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(44 + data_size);

    auto put = [&out](const void* p, size_t n) {
        auto b = static_cast<const uint8_t*>(p);
        out.insert(out.end(), b, b + n);
    };
    auto put16 = [&put](uint16_t v) { put(&v, sizeof(v)); };
    auto put32 = [&put](uint32_t v) { put(&v, sizeof(v)); };

    put("RIFF", 4);
    put32(36 + data_size);
    put("WAVE", 4);
    put("fmt ", 4);
    put32(16);
    put16(1); // PCM
    put16(1); // mono
    put32(sample_rate);
    put32(sample_rate * block_align);
    put16(block_align);
    put16(bits);
    put("data", 4);
    put32(data_size);
    put(mono.data(), data_size);

    return out;
}

} // namespace pcm
