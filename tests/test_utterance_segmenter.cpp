#include <catch2/catch_test_macros.hpp>

#include "speech/utterance_segmenter.hpp"

#include <vector>

using Decision = UtteranceSegmenter::Decision;

namespace {

// 10 ms of 16 kHz mono
const std::vector<int16_t> LOUD(160, 1000);
const std::vector<int16_t> QUIET(160, 0);

Decision feed_n(UtteranceSegmenter& seg, const std::vector<int16_t>& frame, int n,
                uint32_t rate = 16000) {
    Decision last = Decision::None;
    for (int i = 0; i < n; i++) {
        last = seg.feed(frame, rate);
    }
    return last;
}

} // namespace

TEST_CASE("Utterance segmenter", "[segmenter]") {
    UtteranceSegmenter::Params params;
    params.interim_interval_ms = 60000;

    SECTION("Rms") {
        std::vector<int16_t> a{3, -3, 3, -3};
        REQUIRE(UtteranceSegmenter::rms(a) == 3.0);
        REQUIRE(UtteranceSegmenter::rms({}) == 0.0);
    }

    SECTION("LeadingSilenceIsDropped") {
        UtteranceSegmenter seg(params);
        REQUIRE(feed_n(seg, QUIET, 100) == Decision::None);
        REQUIRE(seg.utterance().empty());
        REQUIRE_FALSE(seg.has_speech());
    }

    SECTION("TrailingSilenceEndsUtterance") {
        UtteranceSegmenter seg(params);
        feed_n(seg, QUIET, 10);
        REQUIRE(feed_n(seg, LOUD, 30) == Decision::None);
        REQUIRE(seg.has_speech());

        // 690 ms of silence is not enough, 700 ms is
        REQUIRE(feed_n(seg, QUIET, 69) == Decision::None);
        REQUIRE(seg.feed(QUIET, 16000) == Decision::Final);

        auto utterance = seg.take_utterance();
        REQUIRE(utterance.size() == 100 * 160);
        REQUIRE(seg.utterance().empty());
        REQUIRE_FALSE(seg.has_speech());
    }

    SECTION("ShortBurstIsDiscarded") {
        UtteranceSegmenter seg(params);
        feed_n(seg, LOUD, 10);
        REQUIRE_FALSE(seg.has_speech());

        REQUIRE(feed_n(seg, QUIET, 70) == Decision::None);
        REQUIRE(seg.utterance().empty());
    }

    SECTION("InterimAtInterval") {
        params.interim_interval_ms = 1000;
        UtteranceSegmenter seg(params);

        REQUIRE(feed_n(seg, LOUD, 99) == Decision::None);
        REQUIRE(seg.feed(LOUD, 16000) == Decision::Interim);
        REQUIRE(feed_n(seg, LOUD, 99) == Decision::None);
        REQUIRE(seg.feed(LOUD, 16000) == Decision::Interim);
        REQUIRE(seg.utterance().size() == 200 * 160);
    }

    SECTION("LongUtteranceIsCut") {
        params.max_utterance_ms = 2000;
        UtteranceSegmenter seg(params);

        REQUIRE(feed_n(seg, LOUD, 199) == Decision::None);
        REQUIRE(seg.feed(LOUD, 16000) == Decision::Final);
    }

    SECTION("SampleRateFollowsInput") {
        UtteranceSegmenter seg(params);
        std::vector<int16_t> loud48(480, 1000);

        feed_n(seg, loud48, 30, 48000);
        REQUIRE(seg.sample_rate() == 48000);
        REQUIRE(seg.has_speech());

        // Mid-utterance the rate is pinned.
        seg.feed(LOUD, 16000);
        REQUIRE(seg.sample_rate() == 48000);
    }

    SECTION("EmptyFrameIsIgnored") {
        UtteranceSegmenter seg(params);
        REQUIRE(seg.feed({}, 16000) == Decision::None);
        REQUIRE(seg.feed(LOUD, 0) == Decision::None);
        REQUIRE(seg.utterance().empty());
    }
}
