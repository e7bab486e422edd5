/**
 * @file Speed.hpp
 * @brief Playback speed change (pitch and duration together).
 */

#ifndef PCMFLOW_SPEED_HPP
#define PCMFLOW_SPEED_HPP

#include "LinearInterpolator.hpp"
#include "Parameter.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pcmflow {

/**
 * @brief Resamples the inner source by a live factor while keeping its declared format.
 *
 * A factor of 2.0 consumes two input frames per output frame. The factor is
 * re-read on every pull; non-positive or non-finite values written at run
 * time are ignored and the last valid factor is kept.
 *
 * At exactly 1.0 frames are forwarded untouched with no read-ahead. Frames
 * the interpolator still holds from an earlier factor are handed out first.
 */
class Speed : public Source {
public:
    Speed(SourcePtr inner, float factor)
        : Speed(std::move(inner), FloatParameter(factor))
    {}

    Speed(SourcePtr inner, FloatParameter factor)
        : inner_(std::move(inner))
        , interpolator_(inner_ ? inner_->format().channels : 1, kFactorScale)
        , factor_(std::move(factor))
    {
        if (!inner_) {
            throw std::invalid_argument("Speed: inner source is null");
        }
        last_factor_ = factor_.load();
        if (!valid(last_factor_)) {
            throw std::invalid_argument("Speed: factor must be positive and finite");
        }
    }

    StreamFormat format() const override { return inner_->format(); }

    FloatParameter factor() const { return factor_; }

protected:
    size_t do_pull(std::span<Sample> output) override {
        const float requested = factor_.load();
        if (valid(requested)) {
            last_factor_ = requested;
        }
        if (last_factor_ == 1.0f) {
            const size_t channels = inner_->format().channels;
            size_t written = interpolator_.drain(output);
            if (written * channels < output.size()) {
                written += inner_->pull(output.subspan(written * channels));
            }
            return written;
        }
        return interpolator_.process(*inner_, output, step_num(last_factor_));
    }

    std::optional<uint64_t> frames_left() const override {
        if (last_factor_ == 1.0f) {
            const auto inner_left = inner_->remaining_frames();
            if (!inner_left) {
                return std::nullopt;
            }
            return *inner_left + interpolator_.held_frames();
        }
        return interpolator_.remaining(*inner_, step_num(last_factor_));
    }

private:
    static constexpr uint64_t kFactorScale = 1 << 16;
    static constexpr double kMaxFactor = 1024.0;

    static bool valid(float factor) {
        return std::isfinite(factor) && factor > 0.0f;
    }

    // Factor as a fraction over kFactorScale, clamped to [1/kFactorScale, kMaxFactor]
    static uint64_t step_num(float factor) {
        const double scaled = std::clamp(static_cast<double>(factor) * kFactorScale,
                                         1.0, kMaxFactor * kFactorScale);
        return static_cast<uint64_t>(std::llround(scaled));
    }

    SourcePtr inner_;
    LinearInterpolator interpolator_;
    FloatParameter factor_;
    float last_factor_ = 1.0f;
};

} // namespace pcmflow

#endif // PCMFLOW_SPEED_HPP
