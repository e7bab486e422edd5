/**
 * @file RateAdapter.hpp
 * @brief Sample rate converter (linear interpolation resampler).
 */

#ifndef PCMFLOW_RATE_ADAPTER_HPP
#define PCMFLOW_RATE_ADAPTER_HPP

#include "LinearInterpolator.hpp"
#include <numeric>
#include <stdexcept>
#include <utility>

namespace pcmflow {

/**
 * @brief Re-exposes the inner source at @p target_rate.
 *
 * Declares the target rate; channel count and encoding pass through.
 * When the rates already match, frames are forwarded untouched.
 */
class RateAdapter : public Source {
public:
    RateAdapter(SourcePtr inner, SampleRate target_rate)
        : inner_(std::move(inner))
        , interpolator_(inner_ ? inner_->format().channels : 1, reduced(inner_, target_rate).second)
    {
        if (!inner_) {
            throw std::invalid_argument("RateAdapter: inner source is null");
        }
        if (target_rate == 0) {
            throw std::invalid_argument("RateAdapter: target sample rate must be non-zero");
        }
        format_ = inner_->format();
        step_num_ = reduced(inner_, target_rate).first;
        passthrough_ = format_.sample_rate == target_rate;
        format_.sample_rate = target_rate;
    }

    StreamFormat format() const override { return format_; }

    /**
     * @brief Input frames consumed per output frame (from_rate / to_rate).
     */
    double step() const {
        return static_cast<double>(step_num_) / static_cast<double>(interpolator_.denominator());
    }

protected:
    size_t do_pull(std::span<Sample> output) override {
        if (passthrough_) {
            return inner_->pull(output);
        }
        return interpolator_.process(*inner_, output, step_num_);
    }

    std::optional<uint64_t> frames_left() const override {
        if (passthrough_) {
            return inner_->remaining_frames();
        }
        return interpolator_.remaining(*inner_, step_num_);
    }

private:
    // from_rate / to_rate in lowest terms; {1, 1} until the constructor has validated its input
    static std::pair<uint64_t, uint64_t> reduced(const SourcePtr& inner, SampleRate target_rate) {
        if (!inner || target_rate == 0 || inner->format().sample_rate == 0) {
            return {1, 1};
        }
        const uint64_t from = inner->format().sample_rate;
        const uint64_t to = target_rate;
        const uint64_t divisor = std::gcd(from, to);
        return {from / divisor, to / divisor};
    }

    SourcePtr inner_;
    LinearInterpolator interpolator_;
    StreamFormat format_;
    uint64_t step_num_ = 1;
    bool passthrough_ = true;
};

} // namespace pcmflow

#endif // PCMFLOW_RATE_ADAPTER_HPP
