#include <gtest/gtest.h>
#include "Mixer.hpp"
#include "Amplify.hpp"
#include "Zero.hpp"
#include "SineWave.hpp"
#include "TakeDuration.hpp"
#include "../TestHelper.hpp"

using namespace pcmflow;
using namespace std::chrono_literals;

namespace {

const StreamFormat kMono{1, 44100, SampleFormat::F32};
const StreamFormat kStereo{2, 44100, SampleFormat::F32};

MixerConfig finite_config() {
    MixerConfig config;
    config.keep_alive_if_empty = false;
    return config;
}

std::vector<MixerEvent> drain_events(MixerController& controller) {
    std::vector<MixerEvent> events;
    while (auto event = controller.poll_event()) {
        events.push_back(*event);
    }
    return events;
}

} // namespace

TEST(MixerTest, SilentSourcesMixToSilence) {
    auto [controller, mixer] = make_mixer(kStereo);
    for (int i = 0; i < 8; ++i) {
        ASSERT_EQ(controller->add(std::make_unique<Zero>(2, 44100)), ErrorCode::Ok);
    }

    auto block = test::pull_block(*mixer, 256);
    ASSERT_EQ(block.size(), 512u);
    for (Sample s : block) {
        EXPECT_EQ(s, 0.0f);
    }
    EXPECT_EQ(mixer->slot_count(), 8u);
}

TEST(MixerTest, InvertedCopyCancels) {
    auto [controller, mixer] = make_mixer(kMono);
    auto inverted = std::make_unique<Amplify>(std::make_unique<SineWave>(440.0f, 44100), -1.0f);

    ASSERT_EQ(controller->add(std::make_unique<SineWave>(440.0f, 44100)), ErrorCode::Ok);
    ASSERT_EQ(controller->add(std::move(inverted)), ErrorCode::Ok);

    for (Sample s : test::pull_block(*mixer, 1024)) {
        EXPECT_NEAR(s, 0.0f, 1e-6f);
    }
}

TEST(MixerTest, SumIsClamped) {
    auto [controller, mixer] = make_mixer(kMono);
    ASSERT_EQ(controller->add(test::constant(64, 0.75f)), ErrorCode::Ok);
    ASSERT_EQ(controller->add(test::constant(64, 0.75f)), ErrorCode::Ok);
    ASSERT_EQ(controller->add(test::constant(64, -0.2f)), ErrorCode::Ok);

    for (Sample s : test::pull_block(*mixer, 64)) {
        EXPECT_FLOAT_EQ(s, 1.0f);
    }
}

TEST(MixerTest, FinishedSlotIsPurgedOnNextTick) {
    auto [controller, mixer] = make_mixer(kMono);
    SlotHandle handle;
    ASSERT_EQ(controller->add(test::ramp(10), &handle), ErrorCode::Ok);
    ASSERT_TRUE(handle.valid());

    auto block = test::pull_block(*mixer, 32);
    ASSERT_EQ(block.size(), 32u); // keep-alive pads with silence
    EXPECT_EQ(block[10], 0.0f);

    auto events = drain_events(*controller);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, MixerEvent::Type::SlotFinished);
    EXPECT_EQ(events[0].slot, handle);

    test::pull_block(*mixer, 32);
    EXPECT_EQ(mixer->slot_count(), 0u);
    EXPECT_EQ(controller->active_slots(), 0u);

    events = drain_events(*controller);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, MixerEvent::Type::SlotRemoved);
    EXPECT_EQ(controller->collect_garbage(), 1u);
}

TEST(MixerTest, DrainTicksHoldSlotOpen) {
    MixerConfig config;
    config.drain_ticks = 2;
    auto [controller, mixer] = make_mixer(kMono, config);
    ASSERT_EQ(controller->add(test::ramp(4)), ErrorCode::Ok);

    test::pull_block(*mixer, 8); // finishes
    test::pull_block(*mixer, 8); // grace 1
    test::pull_block(*mixer, 8); // grace 2
    EXPECT_EQ(mixer->slot_count(), 1u);

    test::pull_block(*mixer, 8);
    EXPECT_EQ(mixer->slot_count(), 0u);
}

TEST(MixerTest, FiniteMixerEndsWithLongestSource) {
    auto [controller, mixer] = make_mixer(kMono, finite_config());
    ASSERT_EQ(controller->add(test::ramp(100)), ErrorCode::Ok);
    ASSERT_EQ(controller->add(test::constant(50, 0.5f)), ErrorCode::Ok);
    ASSERT_EQ(controller->add(test::ramp(0)), ErrorCode::Ok);

    auto out = test::drain(*mixer, 64);
    ASSERT_EQ(out.size(), 100u);

    const auto first = test::ramp_samples(100);
    for (size_t k = 0; k < 50; ++k) {
        EXPECT_FLOAT_EQ(out[k], first[k] + 0.5f);
    }
    for (size_t k = 50; k < 100; ++k) {
        EXPECT_FLOAT_EQ(out[k], first[k]);
    }
    EXPECT_TRUE(mixer->is_exhausted());
}

TEST(MixerTest, KeepAliveEmitsSilenceWithoutSlots) {
    auto [controller, mixer] = make_mixer(kStereo);
    auto block = test::pull_block(*mixer, 128);
    ASSERT_EQ(block.size(), 256u);
    for (Sample s : block) {
        EXPECT_EQ(s, 0.0f);
    }
    EXPECT_FALSE(mixer->remaining_frames().has_value());
    EXPECT_EQ(controller->ticks(), 1u);
}

TEST(MixerTest, LongPullsAreMixedInChunks) {
    MixerConfig config = finite_config();
    config.max_block_frames = 16;
    auto [controller, mixer] = make_mixer(kMono, config);
    ASSERT_EQ(controller->add(test::ramp(100)), ErrorCode::Ok);

    auto block = test::pull_block(*mixer, 100);
    EXPECT_EQ(block, test::ramp_samples(100));
    EXPECT_EQ(controller->ticks(), 1u);
}

TEST(MixerTest, RemainingFramesIsLongestActive) {
    auto [controller, mixer] = make_mixer(kMono, finite_config());
    ASSERT_EQ(controller->add(test::ramp(100)), ErrorCode::Ok);
    ASSERT_EQ(controller->add(test::ramp(40)), ErrorCode::Ok);

    test::pull_block(*mixer, 10);
    EXPECT_EQ(mixer->remaining_frames(), 90u);
}

TEST(MixerControllerTest, RejectsFormatMismatchAndKeepsSource) {
    auto [controller, mixer] = make_mixer(kStereo);
    SourcePtr mono = test::ramp(10, 1);

    EXPECT_EQ(controller->add(std::move(mono)), ErrorCode::FormatMismatch);
    ASSERT_NE(mono, nullptr);
    EXPECT_EQ(controller->active_slots(), 0u);

    SourcePtr empty;
    EXPECT_EQ(controller->add(std::move(empty)), ErrorCode::InvalidParameter);
}

TEST(MixerControllerTest, RejectsWhenFull) {
    MixerConfig config;
    config.max_slots = 2;
    auto [controller, mixer] = make_mixer(kMono, config);

    ASSERT_EQ(controller->add(test::ramp(10)), ErrorCode::Ok);
    ASSERT_EQ(controller->add(test::ramp(10)), ErrorCode::Ok);

    SourcePtr third = test::ramp(10);
    EXPECT_EQ(controller->add(std::move(third)), ErrorCode::MixerFull);
    EXPECT_NE(third, nullptr);
}

TEST(MixerControllerTest, CommandQueueFullReturnsSource) {
    MixerConfig config;
    config.command_capacity = 2;
    auto [controller, mixer] = make_mixer(kMono, config);

    // Nothing pulls the mixer, so commands pile up until the queue is full
    size_t accepted = 0;
    ErrorCode result = ErrorCode::Ok;
    SourcePtr source;
    while (result == ErrorCode::Ok && accepted < 64) {
        source = test::ramp(10);
        result = controller->add(std::move(source));
        if (result == ErrorCode::Ok) {
            ++accepted;
        }
    }

    EXPECT_EQ(result, ErrorCode::QueueFull);
    EXPECT_NE(source, nullptr);
    EXPECT_EQ(controller->active_slots(), accepted);

    test::pull_block(*mixer, 4);
    EXPECT_EQ(mixer->slot_count(), accepted);
}

TEST(MixerControllerTest, RemoveAndClear) {
    auto [controller, mixer] = make_mixer(kMono);
    SlotHandle a;
    SlotHandle b;
    ASSERT_EQ(controller->add(test::constant(1000, 0.25f), &a), ErrorCode::Ok);
    ASSERT_EQ(controller->add(test::constant(1000, 0.5f), &b), ErrorCode::Ok);
    test::pull_block(*mixer, 8);

    ASSERT_EQ(controller->remove(a), ErrorCode::Ok);
    auto block = test::pull_block(*mixer, 8);
    EXPECT_FLOAT_EQ(block[0], 0.5f);
    EXPECT_EQ(mixer->slot_count(), 1u);

    // Removing twice is harmless
    EXPECT_EQ(controller->remove(a), ErrorCode::Ok);
    EXPECT_EQ(controller->remove(SlotHandle{}), ErrorCode::InvalidParameter);
    EXPECT_EQ(controller->remove(SlotHandle{999}), ErrorCode::NotFound);

    ASSERT_EQ(controller->clear(), ErrorCode::Ok);
    block = test::pull_block(*mixer, 8);
    EXPECT_EQ(block[0], 0.0f);
    EXPECT_EQ(mixer->slot_count(), 0u);
    EXPECT_EQ(controller->active_slots(), 0u);

    auto events = drain_events(*controller);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].slot, a);
    EXPECT_EQ(events[1].slot, b);
    EXPECT_EQ(controller->collect_garbage(), 2u);
}

TEST(MixerControllerTest, FullGarbageQueueNeverReleasesOnAudioSide) {
    MixerConfig config;
    config.max_slots = 1;
    config.command_capacity = 2;
    auto [controller, mixer] = make_mixer(kMono, config);
    auto destroyed = std::make_shared<std::atomic<int>>(0);

    int added = 0;
    SourcePtr rejected;
    for (int round = 0; round < 8; ++round) {
        SourcePtr source = std::make_unique<test::CountedSource>(test::constant(1000, 0.5f), destroyed);
        SlotHandle handle;
        const ErrorCode result = controller->add(std::move(source), &handle);
        if (result != ErrorCode::Ok) {
            EXPECT_EQ(result, ErrorCode::MixerFull);
            rejected = std::move(source);
            break;
        }
        ++added;
        ASSERT_EQ(controller->remove(handle), ErrorCode::Ok);
        test::pull_block(*mixer, 8);
    }

    ASSERT_NE(rejected, nullptr);
    EXPECT_GT(added, 1);
    EXPECT_EQ(destroyed->load(), 0);
    EXPECT_EQ(controller->active_slots(), 1u);

    size_t released = 0;
    for (int tick = 0; tick < 4; ++tick) {
        released += controller->collect_garbage();
        test::pull_block(*mixer, 8);
    }
    released += controller->collect_garbage();
    EXPECT_EQ(released, static_cast<size_t>(added));
    EXPECT_EQ(destroyed->load(), added);
    EXPECT_EQ(controller->active_slots(), 0u);
}

TEST(MixerControllerTest, SlotAddedMidStreamStartsNextTick) {
    auto [controller, mixer] = make_mixer(kMono);
    test::pull_block(*mixer, 16);

    ASSERT_EQ(controller->add(std::make_unique<TakeDuration>(test::constant(100000, 0.5f), 1ms)), ErrorCode::Ok);
    auto block = test::pull_block(*mixer, 64);
    EXPECT_FLOAT_EQ(block[0], 0.5f);
    EXPECT_FLOAT_EQ(block[43], 0.5f); // 1 ms at 44.1 kHz = 44 frames
    EXPECT_EQ(block[44], 0.0f);
}

TEST(MixerControllerTest, AddsFromSeveralThreads) {
    MixerConfig config;
    config.max_slots = 256;
    config.command_capacity = 512;
    auto [controller, mixer] = make_mixer(kMono, config);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([ctrl = controller]() {
            for (int i = 0; i < 25; ++i) {
                EXPECT_EQ(ctrl->add(std::make_unique<Zero>(1, 44100)), ErrorCode::Ok);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    test::pull_block(*mixer, 4);
    EXPECT_EQ(mixer->slot_count(), 100u);
}

TEST(MixerFactoryTest, RejectsInvalidArguments) {
    EXPECT_THROW(make_mixer(StreamFormat{0, 44100, SampleFormat::F32}), std::invalid_argument);

    MixerConfig config;
    config.max_slots = 0;
    EXPECT_THROW(make_mixer(kMono, config), std::invalid_argument);
}
