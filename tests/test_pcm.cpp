#include <catch2/catch_test_macros.hpp>

#include "speech/pcm.hpp"

#include <cstring>
#include <vector>

namespace {

uint32_t read_u32(const std::vector<uint8_t>& buf, size_t offset) {
    uint32_t v;
    std::memcpy(&v, buf.data() + offset, sizeof(v));
    return v;
}

uint16_t read_u16(const std::vector<uint8_t>& buf, size_t offset) {
    uint16_t v;
    std::memcpy(&v, buf.data() + offset, sizeof(v));
    return v;
}

} // namespace

TEST_CASE("PCM helpers", "[pcm]") {

    SECTION("WavHeader") {
        std::vector<int16_t> samples(1600, 100);
        auto wav = pcm::encode_wav(samples, 16000);

        REQUIRE(wav.size() == 44 + 3200);
        REQUIRE(std::memcmp(wav.data(), "RIFF", 4) == 0);
        REQUIRE(read_u32(wav, 4) == 36 + 3200);
        REQUIRE(std::memcmp(wav.data() + 8, "WAVE", 4) == 0);
        REQUIRE(std::memcmp(wav.data() + 12, "fmt ", 4) == 0);
        REQUIRE(read_u16(wav, 20) == 1);     // PCM
        REQUIRE(read_u16(wav, 22) == 1);     // mono
        REQUIRE(read_u32(wav, 24) == 16000);
        REQUIRE(read_u32(wav, 28) == 32000); // byte rate
        REQUIRE(read_u16(wav, 34) == 16);
        REQUIRE(std::memcmp(wav.data() + 36, "data", 4) == 0);
        REQUIRE(read_u32(wav, 40) == 3200);
    }

    SECTION("WavKeepsSampleRate") {
        std::vector<int16_t> samples(10, 0);
        auto wav = pcm::encode_wav(samples, 48000);
        REQUIRE(read_u32(wav, 24) == 48000);
        REQUIRE(read_u32(wav, 28) == 96000);
    }

    SECTION("DownmixAveragesChannels") {
        std::vector<int16_t> stereo{100, 300, -200, 200, 32767, 32767};
        auto mono = pcm::downmix(stereo, 2);
        REQUIRE(mono == std::vector<int16_t>{200, 0, 32767});
    }

    SECTION("DownmixMonoIsCopy") {
        std::vector<int16_t> samples{1, 2, 3};
        REQUIRE(pcm::downmix(samples, 1) == samples);
    }
}
