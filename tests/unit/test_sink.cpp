#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "Sink.hpp"
#include "SourcesQueue.hpp"
#include "TrackPosition.hpp"
#include "../TestHelper.hpp"

using namespace pcmflow;
using namespace std::chrono_literals;

namespace {

const StreamFormat kMono{1, 44100, SampleFormat::F32};

size_t count_equal(const std::vector<Sample>& samples, float value) {
    return static_cast<size_t>(std::count(samples.begin(), samples.end(), value));
}

size_t count_nonzero(const std::vector<Sample>& samples) {
    return static_cast<size_t>(std::count_if(samples.begin(), samples.end(), [](Sample s) { return s != 0.0f; }));
}

} // namespace

// --- SourcesQueue ---

TEST(SourcesQueueTest, PlaysBackToBackWithoutGap) {
    auto [input, queue] = make_queue(kMono, 8, false);
    ASSERT_EQ(input->append(test::ramp(10)), ErrorCode::Ok);
    ASSERT_EQ(input->append(test::constant(10, 0.5f)), ErrorCode::Ok);
    EXPECT_EQ(input->len(), 2u);

    auto out = test::pull_block(*queue, 32);
    ASSERT_EQ(out.size(), 20u);

    const auto first = test::ramp_samples(10);
    EXPECT_TRUE(std::equal(first.begin(), first.end(), out.begin()));
    for (size_t k = 10; k < 20; ++k) {
        EXPECT_EQ(out[k], 0.5f);
    }

    EXPECT_TRUE(queue->is_exhausted());
    EXPECT_EQ(input->len(), 0u);
    EXPECT_EQ(input->take_finished(), 2u);
    EXPECT_EQ(input->take_finished(), 0u);
    EXPECT_EQ(input->collect_garbage(), 2u);
}

TEST(SourcesQueueTest, KeepAliveEmitsSilenceWhileIdle) {
    auto [input, queue] = make_queue(kMono, 8, true);
    auto out = test::pull_block(*queue, 64);
    ASSERT_EQ(out.size(), 64u);
    EXPECT_EQ(count_nonzero(out), 0u);

    ASSERT_EQ(input->append(test::constant(16, 0.5f)), ErrorCode::Ok);
    out = test::pull_block(*queue, 64);
    EXPECT_EQ(count_equal(out, 0.5f), 16u);
    EXPECT_EQ(out[16], 0.0f);
    EXPECT_FALSE(queue->is_exhausted());
}

TEST(SourcesQueueTest, SkipPromotesNextSource) {
    auto [input, queue] = make_queue(kMono, 8, true);
    ASSERT_EQ(input->append(test::constant(1000, 0.5f)), ErrorCode::Ok);
    ASSERT_EQ(input->append(test::constant(1000, 0.25f)), ErrorCode::Ok);

    test::pull_block(*queue, 5);
    ASSERT_EQ(input->skip(), ErrorCode::Ok);
    auto out = test::pull_block(*queue, 5);
    EXPECT_EQ(count_equal(out, 0.25f), 5u);
    EXPECT_EQ(input->len(), 1u);
    EXPECT_EQ(input->take_finished(), 0u); // skipped sources do not count as finished
}

TEST(SourcesQueueTest, SkipOnEmptyQueueIsIgnored) {
    auto [input, queue] = make_queue(kMono, 8, true);
    ASSERT_EQ(input->skip(), ErrorCode::Ok);
    EXPECT_EQ(count_nonzero(test::pull_block(*queue, 8)), 0u);
    EXPECT_EQ(input->len(), 0u);
}

TEST(SourcesQueueTest, ClearDropsEverything) {
    auto [input, queue] = make_queue(kMono, 8, true);
    ASSERT_EQ(input->append(test::constant(1000, 0.5f)), ErrorCode::Ok);
    ASSERT_EQ(input->append(test::constant(1000, 0.25f)), ErrorCode::Ok);
    test::pull_block(*queue, 5);

    ASSERT_EQ(input->clear(), ErrorCode::Ok);
    EXPECT_EQ(count_nonzero(test::pull_block(*queue, 8)), 0u);
    EXPECT_TRUE(input->empty());
    EXPECT_EQ(input->collect_garbage(), 2u);
}

TEST(SourcesQueueTest, RejectsMismatchAndOverflow) {
    auto [input, queue] = make_queue(kMono, 2, true);

    SourcePtr stereo = test::ramp(10, 2);
    EXPECT_EQ(input->append(std::move(stereo)), ErrorCode::FormatMismatch);
    EXPECT_NE(stereo, nullptr);

    ASSERT_EQ(input->append(test::ramp(10)), ErrorCode::Ok);
    ASSERT_EQ(input->append(test::ramp(10)), ErrorCode::Ok);
    SourcePtr third = test::ramp(10);
    EXPECT_EQ(input->append(std::move(third)), ErrorCode::QueueFull);
    EXPECT_NE(third, nullptr);
}

TEST(SourcesQueueTest, PositionRestartsWithEachTrack) {
    CounterParameter position(0);
    auto [input, queue] = make_queue(kMono, 8, false, position);
    ASSERT_EQ(input->append(std::make_unique<TrackPosition>(test::ramp(10), position)), ErrorCode::Ok);
    ASSERT_EQ(input->append(std::make_unique<TrackPosition>(test::ramp(10), position)), ErrorCode::Ok);

    test::pull_block(*queue, 6);
    EXPECT_EQ(position.load(), 6u);
    test::pull_block(*queue, 9);
    EXPECT_EQ(position.load(), 5u);
}

TEST(SourcesQueueTest, SignalsFireAsEachSourceEnds) {
    auto [input, queue] = make_queue(kMono, 8, true);
    FlagParameter first_done;
    FlagParameter second_done;
    ASSERT_EQ(input->append_with_signal(test::ramp(10), &first_done), ErrorCode::Ok);
    ASSERT_EQ(input->append_with_signal(test::ramp(10), &second_done), ErrorCode::Ok);
    EXPECT_FALSE(first_done.load());
    EXPECT_FALSE(second_done.load());

    test::pull_block(*queue, 9);
    EXPECT_FALSE(first_done.load());
    test::pull_block(*queue, 2);
    EXPECT_TRUE(first_done.load());
    EXPECT_FALSE(second_done.load());

    test::pull_block(*queue, 9);
    EXPECT_FALSE(second_done.load());
    test::pull_block(*queue, 1);
    EXPECT_TRUE(second_done.load());
}

TEST(SourcesQueueTest, SignalFiresWhenSourceIsDropped) {
    auto [input, queue] = make_queue(kMono, 8, true);
    FlagParameter skipped;
    FlagParameter cleared;
    ASSERT_EQ(input->append_with_signal(test::ramp(1000), &skipped), ErrorCode::Ok);
    ASSERT_EQ(input->append_with_signal(test::ramp(1000), &cleared), ErrorCode::Ok);
    test::pull_block(*queue, 4);

    ASSERT_EQ(input->skip(), ErrorCode::Ok);
    test::pull_block(*queue, 4);
    EXPECT_TRUE(skipped.load());
    EXPECT_FALSE(cleared.load());

    ASSERT_EQ(input->clear(), ErrorCode::Ok);
    test::pull_block(*queue, 4);
    EXPECT_TRUE(cleared.load());
}

TEST(SourcesQueueTest, SignalAppendRejectsLikeAppend) {
    auto [input, queue] = make_queue(kMono, 1, true);
    FlagParameter done(true);

    SourcePtr stereo = test::ramp(10, 2);
    EXPECT_EQ(input->append_with_signal(std::move(stereo), &done), ErrorCode::FormatMismatch);
    EXPECT_NE(stereo, nullptr);
    EXPECT_EQ(input->append_with_signal(test::ramp(10), nullptr), ErrorCode::InvalidParameter);

    ASSERT_EQ(input->append(test::ramp(10)), ErrorCode::Ok);
    SourcePtr extra = test::ramp(10);
    EXPECT_EQ(input->append_with_signal(std::move(extra), &done), ErrorCode::QueueFull);
    EXPECT_NE(extra, nullptr);
    EXPECT_TRUE(done.load());
}

TEST(SourcesQueueTest, KeepAliveCanChangeAtRunTime) {
    auto [input, queue] = make_queue(kMono, 8, false);
    EXPECT_FALSE(input->keep_alive_if_empty());

    input->set_keep_alive_if_empty(true);
    EXPECT_TRUE(input->keep_alive_if_empty());
    EXPECT_FALSE(queue->remaining_frames().has_value());
    auto out = test::pull_block(*queue, 16);
    ASSERT_EQ(out.size(), 16u);
    EXPECT_EQ(count_nonzero(out), 0u);

    ASSERT_EQ(input->append(test::ramp(10)), ErrorCode::Ok);
    input->set_keep_alive_if_empty(false);
    EXPECT_EQ(test::pull_block(*queue, 32), test::ramp_samples(10));
    EXPECT_TRUE(queue->is_exhausted());
}

TEST(SourcesQueueTest, RetiredSourcesAreReleasedOnlyByControlSide) {
    auto destroyed = std::make_shared<std::atomic<int>>(0);
    auto counted = [&destroyed](size_t frames) -> SourcePtr {
        return std::make_unique<test::CountedSource>(test::ramp(frames), destroyed);
    };

    auto [input, queue] = make_queue(kMono, 3, true);
    ASSERT_EQ(input->append(counted(10)), ErrorCode::Ok);
    ASSERT_EQ(input->append(counted(1000)), ErrorCode::Ok);
    ASSERT_EQ(input->append(counted(1000)), ErrorCode::Ok);

    test::pull_block(*queue, 20);
    ASSERT_EQ(input->skip(), ErrorCode::Ok);
    test::pull_block(*queue, 4);
    ASSERT_EQ(input->clear(), ErrorCode::Ok);
    test::pull_block(*queue, 4);
    EXPECT_TRUE(input->empty());
    EXPECT_EQ(destroyed->load(), 0);

    // Finished sources hold their place until collected, and append collects them
    ASSERT_EQ(input->append(counted(10)), ErrorCode::Ok);
    EXPECT_EQ(destroyed->load(), 3);
    EXPECT_EQ(input->collect_garbage(), 0u);
}

TEST(SourcesQueueTest, FactoryRejectsZeroCapacity) {
    EXPECT_THROW(make_queue(kMono, 0, true), std::invalid_argument);
}

// --- Sink ---

TEST(SinkTest, AppendWhileIdleStartsPlayback) {
    auto [controller, mixer] = make_mixer(kMono);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(controller->active_slots(), 1u);

    test::pull_block(*mixer, 64);
    ASSERT_EQ(sink->append(test::constant(100, 0.5f)), ErrorCode::Ok);
    EXPECT_TRUE(sink->is_playing());

    auto out = test::pull_block(*mixer, 256);
    EXPECT_EQ(out[0], 0.5f);
    EXPECT_EQ(out[99], 0.5f);
    EXPECT_EQ(out[100], 0.0f);
    EXPECT_EQ(count_equal(out, 0.5f), 100u);
    EXPECT_TRUE(sink->empty());
    EXPECT_EQ(sink->poll_finished(), 1u);
    EXPECT_FALSE(sink->is_playing());
}

TEST(SinkTest, AppendToIdleSinkPlaysFromFirstFrame) {
    auto [controller, mixer] = make_mixer(kMono);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);
    test::pull_block(*mixer, 16);

    ASSERT_EQ(sink->append(test::ramp(50)), ErrorCode::Ok);
    auto out = test::pull_block(*mixer, 64);
    const auto input = test::ramp_samples(50);
    ASSERT_EQ(out.size(), 64u);
    EXPECT_TRUE(std::equal(input.begin(), input.end(), out.begin()));
    EXPECT_EQ(count_nonzero(out), 50u);
}

TEST(SinkTest, SignalledAppendReportsEachSource) {
    auto [controller, mixer] = make_mixer(kMono);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);

    FlagParameter first_done;
    FlagParameter second_done;
    ASSERT_EQ(sink->append_with_signal(test::constant(100, 0.5f), &first_done), ErrorCode::Ok);
    ASSERT_EQ(sink->append_with_signal(test::constant(100, 0.25f), &second_done), ErrorCode::Ok);
    EXPECT_EQ(sink->append_with_signal(test::constant(100, 0.25f), nullptr), ErrorCode::InvalidParameter);

    test::pull_block(*mixer, 150);
    EXPECT_TRUE(first_done.load());
    EXPECT_FALSE(second_done.load());

    test::pull_block(*mixer, 100);
    EXPECT_TRUE(second_done.load());
    EXPECT_EQ(sink->poll_finished(), 2u);
}

TEST(SinkTest, AppendWhilePlayingIsGapless) {
    auto [controller, mixer] = make_mixer(kMono);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);

    ASSERT_EQ(sink->append(test::constant(100, 0.5f)), ErrorCode::Ok);
    test::pull_block(*mixer, 10);
    ASSERT_EQ(sink->append(test::constant(100, 0.25f)), ErrorCode::Ok);
    EXPECT_EQ(sink->len(), 2u);

    auto out = test::pull_block(*mixer, 300);
    const auto last_first = std::find(out.rbegin(), out.rend(), 0.5f);
    const auto first_second = std::find(out.begin(), out.end(), 0.25f);
    ASSERT_NE(last_first, out.rend());
    ASSERT_NE(first_second, out.end());
    EXPECT_EQ(std::distance(out.begin(), first_second), std::distance(last_first, out.rend()));
    EXPECT_EQ(count_equal(out, 0.25f), 100u);
}

TEST(SinkTest, SkipMovesToNextSource) {
    auto [controller, mixer] = make_mixer(kMono);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);

    ASSERT_EQ(sink->append(test::constant(10000, 0.5f)), ErrorCode::Ok);
    ASSERT_EQ(sink->append(test::constant(10000, 0.25f)), ErrorCode::Ok);
    test::pull_block(*mixer, 32);

    ASSERT_EQ(sink->skip(), ErrorCode::Ok);
    auto out = test::pull_block(*mixer, 32);
    EXPECT_EQ(out[0], 0.25f);
    EXPECT_EQ(count_equal(out, 0.25f), 32u);
    EXPECT_EQ(sink->len(), 1u);

    ASSERT_EQ(sink->skip(), ErrorCode::Ok);
    out = test::pull_block(*mixer, 32);
    EXPECT_EQ(count_nonzero(out), 0u);
    EXPECT_TRUE(sink->empty());

    // Skipping an idle sink keeps it idle
    ASSERT_EQ(sink->skip(), ErrorCode::Ok);
    EXPECT_EQ(count_nonzero(test::pull_block(*mixer, 32)), 0u);
    EXPECT_EQ(controller->active_slots(), 1u);
}

TEST(SinkTest, StopRemovesSlotAndAppendReinstalls) {
    auto [controller, mixer] = make_mixer(kMono);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);

    ASSERT_EQ(sink->append(test::constant(10000, 0.5f)), ErrorCode::Ok);
    test::pull_block(*mixer, 32);

    ASSERT_EQ(sink->stop(), ErrorCode::Ok);
    EXPECT_TRUE(sink->empty());
    test::pull_block(*mixer, 32);
    EXPECT_EQ(mixer->slot_count(), 0u);
    EXPECT_EQ(controller->active_slots(), 0u);

    ASSERT_EQ(sink->append(test::constant(100, 0.25f)), ErrorCode::Ok);
    EXPECT_EQ(controller->active_slots(), 1u);
    auto out = test::pull_block(*mixer, 256);
    EXPECT_EQ(count_equal(out, 0.25f), 100u);
    EXPECT_EQ(count_equal(out, 0.5f), 0u);
}

TEST(SinkTest, VolumeAndPause) {
    auto [controller, mixer] = make_mixer(kMono);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);

    ASSERT_EQ(sink->append(test::constant(10000, 0.5f)), ErrorCode::Ok);
    ASSERT_EQ(sink->set_volume(0.5f), ErrorCode::Ok);
    EXPECT_FLOAT_EQ(sink->volume(), 0.5f);
    EXPECT_FLOAT_EQ(test::pull_block(*mixer, 32).back(), 0.25f);

    sink->pause();
    EXPECT_TRUE(sink->is_paused());
    EXPECT_FALSE(sink->is_playing());
    EXPECT_EQ(count_nonzero(test::pull_block(*mixer, 32)), 0u);
    EXPECT_EQ(sink->len(), 1u);

    sink->resume();
    EXPECT_FLOAT_EQ(test::pull_block(*mixer, 32).back(), 0.25f);

    EXPECT_EQ(sink->set_volume(std::numeric_limits<float>::quiet_NaN()), ErrorCode::InvalidParameter);
    EXPECT_FLOAT_EQ(sink->volume(), 0.5f);
}

TEST(SinkTest, SpeedChangesDuration) {
    auto [controller, mixer] = make_mixer(kMono);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);

    ASSERT_EQ(sink->set_speed(2.0f), ErrorCode::Ok);
    ASSERT_EQ(sink->append(test::constant(1000, 0.5f)), ErrorCode::Ok);

    auto out = test::pull_block(*mixer, 2048);
    EXPECT_EQ(count_nonzero(out), 500u);

    EXPECT_EQ(sink->set_speed(0.0f), ErrorCode::InvalidParameter);
    EXPECT_EQ(sink->set_speed(-1.0f), ErrorCode::InvalidParameter);
    EXPECT_FLOAT_EQ(sink->speed(), 2.0f);
}

TEST(SinkTest, PositionTracksCurrentSource) {
    const StreamFormat format{1, 1000, SampleFormat::F32};
    auto [controller, mixer] = make_mixer(format);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);

    ASSERT_EQ(sink->append(test::ramp(1000, 1, 1000)), ErrorCode::Ok);
    ASSERT_EQ(sink->append(test::ramp(1000, 1, 1000)), ErrorCode::Ok);
    EXPECT_DOUBLE_EQ(sink->position().count(), 0.0);

    test::pull_block(*mixer, 250);
    EXPECT_DOUBLE_EQ(sink->position().count(), 0.25);

    test::pull_block(*mixer, 1000);
    EXPECT_DOUBLE_EQ(sink->position().count(), 0.25);

    ASSERT_EQ(sink->stop(), ErrorCode::Ok);
    EXPECT_DOUBLE_EQ(sink->position().count(), 0.0);
}

TEST(SinkTest, ConvertsToMixerFormat) {
    const StreamFormat format{2, 48000, SampleFormat::F32};
    auto [controller, mixer] = make_mixer(format);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->format(), format);

    ASSERT_EQ(sink->append(test::constant(100, 0.5f, 1, 24000)), ErrorCode::Ok);
    auto out = test::pull_block(*mixer, 512);
    ASSERT_EQ(out.size(), 1024u);

    const size_t frames = count_equal(out, 0.5f) / 2;
    EXPECT_NEAR(static_cast<double>(frames), 200.0, 2.0);
    for (size_t f = 0; f < 512; ++f) {
        EXPECT_EQ(out[f * 2], out[f * 2 + 1]);
    }
}

TEST(SinkTest, RejectsWhenQueueFull) {
    auto [controller, mixer] = make_mixer(kMono);
    auto sink = Sink::connect(controller, 2);
    ASSERT_NE(sink, nullptr);

    ASSERT_EQ(sink->append(test::ramp(10)), ErrorCode::Ok);
    ASSERT_EQ(sink->append(test::ramp(10)), ErrorCode::Ok);
    SourcePtr third = test::ramp(10);
    EXPECT_EQ(sink->append(std::move(third)), ErrorCode::QueueFull);
    EXPECT_NE(third, nullptr);

    SourcePtr none;
    EXPECT_EQ(sink->append(std::move(none)), ErrorCode::InvalidParameter);
}

TEST(SinkTest, ConnectFailsOnFullMixer) {
    MixerConfig config;
    config.max_slots = 1;
    auto [controller, mixer] = make_mixer(kMono, config);

    auto first = Sink::connect(controller);
    ASSERT_NE(first, nullptr);

    ErrorCode error = ErrorCode::Ok;
    auto second = Sink::connect(controller, 64, &error);
    EXPECT_EQ(second, nullptr);
    EXPECT_EQ(error, ErrorCode::MixerFull);
}

TEST(SinkTest, DestructionStopsUnlessDetached) {
    auto [controller, mixer] = make_mixer(kMono);
    {
        auto sink = Sink::connect(controller);
        ASSERT_NE(sink, nullptr);
        ASSERT_EQ(sink->append(test::constant(10000, 0.5f)), ErrorCode::Ok);
    }
    test::pull_block(*mixer, 16);
    EXPECT_EQ(controller->active_slots(), 0u);

    {
        auto sink = Sink::connect(controller);
        ASSERT_NE(sink, nullptr);
        ASSERT_EQ(sink->append(test::constant(10000, 0.5f)), ErrorCode::Ok);
        sink->detach();
    }
    EXPECT_EQ(test::pull_block(*mixer, 16).back(), 0.5f);
    EXPECT_EQ(controller->active_slots(), 1u);
}

TEST(SinkTest, SleepUntilEndTimesOutWhenNothingPulls) {
    auto [controller, mixer] = make_mixer(kMono);
    auto sink = Sink::connect(controller);
    ASSERT_NE(sink, nullptr);

    EXPECT_TRUE(sink->sleep_until_end(10ms));
    ASSERT_EQ(sink->append(test::constant(100, 0.5f)), ErrorCode::Ok);
    EXPECT_FALSE(sink->sleep_until_end(20ms));
}
