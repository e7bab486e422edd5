#include <gtest/gtest.h>
#include "ChannelAdapter.hpp"
#include "RateAdapter.hpp"
#include "EncodingAdapter.hpp"
#include "Conversions.hpp"
#include "../TestHelper.hpp"
#include <cmath>
#include <utility>

using namespace pcmflow;

TEST(RateAdapterTest, OutputCountMatchesRatio) {
    const std::pair<SampleRate, SampleRate> ratios[] = {
        {44100, 48000}, {48000, 44100}, {22050, 44100}, {44100, 8000}, {8000, 44100}, {48000, 96000}
    };
    const size_t lengths[] = {1, 7, 100, 1000, 4410};

    for (auto [from, to] : ratios) {
        for (size_t frames : lengths) {
            RateAdapter adapter(test::ramp(frames, 2, from), to);
            EXPECT_EQ(adapter.format().sample_rate, to);

            const auto predicted = adapter.remaining_frames();
            const size_t produced = test::drain(adapter, 37).size() / 2;
            const double expected = std::ceil(static_cast<double>(frames) * to / from);

            EXPECT_LE(std::abs(static_cast<double>(produced) - expected), 1.0)
                << from << " -> " << to << " with " << frames << " frames";
            ASSERT_TRUE(predicted.has_value());
            EXPECT_LE(std::abs(static_cast<double>(*predicted) - static_cast<double>(produced)), 1.0);
            EXPECT_TRUE(adapter.is_exhausted());
        }
    }
}

TEST(RateAdapterTest, RemainingFramesMatchesDrainedCount) {
    const SampleRate rates[] = {8000, 11025, 22050, 44100, 48000, 96000};

    for (SampleRate from : rates) {
        for (SampleRate to : rates) {
            for (size_t frames = 1; frames <= 40; ++frames) {
                RateAdapter adapter(test::ramp(frames, 2, from), to);
                const auto predicted = adapter.remaining_frames();
                ASSERT_TRUE(predicted.has_value());
                EXPECT_EQ(*predicted, test::drain(adapter, 5).size() / 2)
                    << from << " -> " << to << " with " << frames << " frames";
            }
        }
    }
}

TEST(RateAdapterTest, RemainingFramesStaysExactMidStream) {
    const std::pair<SampleRate, SampleRate> ratios[] = {
        {8000, 48000}, {48000, 8000}, {44100, 48000}, {11025, 96000}
    };

    for (auto [from, to] : ratios) {
        RateAdapter adapter(test::ramp(313, 1, from), to);
        const size_t first = test::pull_block(adapter, 7).size();
        const auto predicted = adapter.remaining_frames();
        ASSERT_TRUE(predicted.has_value());

        const size_t rest = test::drain(adapter, 11).size();
        EXPECT_EQ(*predicted, rest) << from << " -> " << to;
        EXPECT_EQ(first + rest, static_cast<size_t>((313ull * to + from - 1) / from)) << from << " -> " << to;
    }
}

TEST(RateAdapterTest, SameRateIsIdentity) {
    RateAdapter adapter(test::ramp(500, 2, 44100), 44100);
    EXPECT_EQ(test::drain(adapter, 64), test::ramp_samples(500, 2));
}

TEST(RateAdapterTest, InterpolatesBetweenNeighbours) {
    RateAdapter adapter(std::make_unique<SamplesBuffer>(1, 1000, std::vector<Sample>{0.0f, 1.0f}), 2000);
    auto out = test::drain(adapter);

    // The last window is finished against the final frame
    ASSERT_EQ(out.size(), 4u);
    EXPECT_FLOAT_EQ(out[0], 0.0f);
    EXPECT_FLOAT_EQ(out[1], 0.5f);
    EXPECT_FLOAT_EQ(out[2], 1.0f);
    EXPECT_FLOAT_EQ(out[3], 1.0f);
}

TEST(RateAdapterTest, DownsamplingPicksFractionalPositions) {
    RateAdapter adapter(std::make_unique<SamplesBuffer>(1, 3000, std::vector<Sample>{0.0f, 0.1f, 0.2f, 0.3f, 0.4f, 0.5f}), 2000);
    auto out = test::drain(adapter);

    // Positions 0, 1.5, 3, 4.5
    ASSERT_EQ(out.size(), 4u);
    EXPECT_NEAR(out[0], 0.0f, 1e-6f);
    EXPECT_NEAR(out[1], 0.15f, 1e-6f);
    EXPECT_NEAR(out[2], 0.3f, 1e-6f);
    EXPECT_NEAR(out[3], 0.45f, 1e-6f);
}

TEST(RateAdapterTest, RejectsInvalidParameters) {
    EXPECT_THROW(RateAdapter(test::ramp(10), 0), std::invalid_argument);
    EXPECT_THROW(RateAdapter(nullptr, 44100), std::invalid_argument);
}

TEST(ChannelAdapterTest, UpmixDuplicates) {
    ChannelAdapter adapter(std::make_unique<SamplesBuffer>(1, 44100, std::vector<Sample>{0.1f, 0.2f}), 2);
    EXPECT_EQ(adapter.format().channels, 2);
    EXPECT_EQ(test::drain(adapter), (std::vector<Sample>{0.1f, 0.1f, 0.2f, 0.2f}));
}

TEST(ChannelAdapterTest, UpmixDistributesCyclically) {
    ChannelAdapter adapter(std::make_unique<SamplesBuffer>(2, 44100, std::vector<Sample>{0.1f, 0.2f}), 4);
    EXPECT_EQ(test::drain(adapter), (std::vector<Sample>{0.1f, 0.2f, 0.1f, 0.2f}));
}

TEST(ChannelAdapterTest, DownmixAverages) {
    ChannelAdapter stereo_to_mono(std::make_unique<SamplesBuffer>(2, 44100, std::vector<Sample>{0.2f, 0.4f, -1.0f, 1.0f}), 1);
    auto mono = test::drain(stereo_to_mono);
    ASSERT_EQ(mono.size(), 2u);
    EXPECT_FLOAT_EQ(mono[0], 0.3f);
    EXPECT_FLOAT_EQ(mono[1], 0.0f);

    ChannelAdapter six_to_two(std::make_unique<SamplesBuffer>(6, 44100, std::vector<Sample>{0.1f, 0.2f, 0.3f, 0.4f, 0.5f, 0.6f}), 2);
    auto stereo = test::drain(six_to_two);
    ASSERT_EQ(stereo.size(), 2u);
    EXPECT_FLOAT_EQ(stereo[0], (0.1f + 0.3f + 0.5f) / 3.0f);
    EXPECT_FLOAT_EQ(stereo[1], (0.2f + 0.4f + 0.6f) / 3.0f);
}

TEST(ChannelAdapterTest, LongPullsAreChunked) {
    ChannelAdapter adapter(test::ramp(3000, 1), 2);
    auto out = test::drain(adapter, 2048);
    ASSERT_EQ(out.size(), 6000u);
    const auto mono = test::ramp_samples(3000, 1);
    for (size_t f = 0; f < 3000; ++f) {
        ASSERT_FLOAT_EQ(out[f * 2], mono[f]);
        ASSERT_FLOAT_EQ(out[f * 2 + 1], mono[f]);
    }
}

TEST(EncodingAdapterTest, QuantizesToTargetGrid) {
    EncodingAdapter adapter(std::make_unique<SamplesBuffer>(1, 44100, std::vector<Sample>{0.3f, -0.7f}), SampleFormat::I8);
    EXPECT_EQ(adapter.format().encoding, SampleFormat::I8);

    auto out = test::drain(adapter);
    ASSERT_EQ(out.size(), 2u);
    for (Sample s : out) {
        EXPECT_FLOAT_EQ(s * 128.0f, std::round(s * 128.0f));
    }
    EXPECT_NEAR(out[0], 0.3f, 1.0f / 128.0f);
    EXPECT_NEAR(out[1], -0.7f, 1.0f / 128.0f);
}

TEST(EncodingAdapterTest, SameEncodingIsPassthrough) {
    EncodingAdapter adapter(test::ramp(100), SampleFormat::F32);
    EXPECT_EQ(test::drain(adapter), test::ramp_samples(100));
}

TEST(ConvertToTest, MatchingFormatReturnsSameSource) {
    SourcePtr source = test::ramp(10, 2, 48000);
    Source* raw = source.get();
    SourcePtr converted = convert_to(std::move(source), StreamFormat{2, 48000, SampleFormat::F32});
    EXPECT_EQ(converted.get(), raw);
}

TEST(ConvertToTest, ReachesTargetFormat) {
    const StreamFormat target{1, 44100, SampleFormat::I16};
    SourcePtr converted = convert_to(test::ramp(4800, 2, 48000), target);
    EXPECT_EQ(converted->format(), target);

    const size_t frames = test::drain(*converted).size();
    EXPECT_NEAR(static_cast<double>(frames), std::ceil(4800.0 * 44100.0 / 48000.0), 1.0);
}

TEST(ConvertToTest, AdapterOrderDoesNotChangeResult) {
    SourcePtr a = std::make_unique<RateAdapter>(std::make_unique<ChannelAdapter>(test::ramp(300, 1, 22050), 2), 44100);
    SourcePtr b = std::make_unique<ChannelAdapter>(std::make_unique<RateAdapter>(test::ramp(300, 1, 22050), 44100), 2);
    EXPECT_EQ(a->format(), b->format());

    auto out_a = test::drain(*a);
    auto out_b = test::drain(*b);
    ASSERT_EQ(out_a.size(), out_b.size());
    for (size_t i = 0; i < out_a.size(); ++i) {
        EXPECT_NEAR(out_a[i], out_b[i], 1e-6f);
    }
}
