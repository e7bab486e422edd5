/**
 * @file Amplify.hpp
 * @brief Gain stage with a live, atomically shared factor.
 */

#ifndef PCMFLOW_AMPLIFY_HPP
#define PCMFLOW_AMPLIFY_HPP

#include "Source.hpp"
#include "Parameter.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcmflow {

/**
 * @brief Multiplies every sample by a gain factor, clamped to -1.0..1.0.
 *
 * The factor is re-read on every pull, so a control-side store is heard
 * from the next block on.
 */
class Amplify : public Source {
public:
    Amplify(SourcePtr inner, float factor)
        : Amplify(std::move(inner), FloatParameter(factor))
    {}

    Amplify(SourcePtr inner, FloatParameter factor)
        : inner_(std::move(inner))
        , factor_(std::move(factor))
    {
        if (!inner_) {
            throw std::invalid_argument("Amplify: inner source is null");
        }
    }

    StreamFormat format() const override { return inner_->format(); }

    /**
     * @brief Handle sharing the live gain cell.
     */
    FloatParameter factor() const { return factor_; }

protected:
    size_t do_pull(std::span<Sample> output) override {
        const size_t frames = inner_->pull(output);
        const float gain = factor_.load();
        if (gain == 1.0f) {
            return frames;
        }

        const size_t count = frames * inner_->format().channels;
        for (size_t i = 0; i < count; ++i) {
            output[i] = std::clamp(output[i] * gain, -1.0f, 1.0f);
        }
        return frames;
    }

    std::optional<uint64_t> frames_left() const override {
        return inner_->remaining_frames();
    }

private:
    SourcePtr inner_;
    FloatParameter factor_;
};

} // namespace pcmflow

#endif // PCMFLOW_AMPLIFY_HPP
