/**
 * @file FadeOut.hpp
 * @brief Linear fade-out over a fixed duration.
 */

#ifndef PCMFLOW_FADE_OUT_HPP
#define PCMFLOW_FADE_OUT_HPP

#include "Source.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace pcmflow {

/**
 * @brief Ramps the gain from 1.0 to exactly 0.0 over @p duration.
 *
 * Frame k of a D-frame fade is scaled by 1 - k / D. After the ramp the
 * inner source keeps playing at zero gain until it ends.
 */
class FadeOut : public Source {
public:
    FadeOut(SourcePtr inner, std::chrono::nanoseconds duration)
        : inner_(std::move(inner))
        , elapsed_(0)
    {
        if (!inner_) {
            throw std::invalid_argument("FadeOut: inner source is null");
        }
        total_ = frames_for(duration, inner_->format().sample_rate);
    }

    StreamFormat format() const override { return inner_->format(); }

protected:
    size_t do_pull(std::span<Sample> output) override {
        const size_t channels = inner_->format().channels;
        const size_t frames = inner_->pull(output);

        for (size_t f = 0; f < frames; ++f) {
            float gain = 0.0f;
            if (elapsed_ < total_) {
                gain = static_cast<float>(1.0 - static_cast<double>(elapsed_) / static_cast<double>(total_));
                ++elapsed_;
            }
            for (size_t c = 0; c < channels; ++c) {
                output[f * channels + c] *= gain;
            }
        }
        return frames;
    }

    std::optional<uint64_t> frames_left() const override {
        return inner_->remaining_frames();
    }

private:
    SourcePtr inner_;
    uint64_t total_ = 0;
    uint64_t elapsed_;
};

} // namespace pcmflow

#endif // PCMFLOW_FADE_OUT_HPP
