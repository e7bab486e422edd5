/**
 * @file FadeIn.hpp
 * @brief Linear fade-in over a fixed duration.
 */

#ifndef PCMFLOW_FADE_IN_HPP
#define PCMFLOW_FADE_IN_HPP

#include "Source.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace pcmflow {

/**
 * @brief Ramps the gain from 0.0 to exactly 1.0 over @p duration, then holds 1.0.
 *
 * Frame k of a D-frame fade is scaled by k / D.
 */
class FadeIn : public Source {
public:
    FadeIn(SourcePtr inner, std::chrono::nanoseconds duration)
        : inner_(std::move(inner))
        , elapsed_(0)
    {
        if (!inner_) {
            throw std::invalid_argument("FadeIn: inner source is null");
        }
        total_ = frames_for(duration, inner_->format().sample_rate);
    }

    StreamFormat format() const override { return inner_->format(); }

protected:
    size_t do_pull(std::span<Sample> output) override {
        const size_t channels = inner_->format().channels;
        const size_t frames = inner_->pull(output);

        for (size_t f = 0; f < frames && elapsed_ < total_; ++f) {
            const float gain = static_cast<float>(static_cast<double>(elapsed_) / static_cast<double>(total_));
            for (size_t c = 0; c < channels; ++c) {
                output[f * channels + c] *= gain;
            }
            ++elapsed_;
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

#endif // PCMFLOW_FADE_IN_HPP
