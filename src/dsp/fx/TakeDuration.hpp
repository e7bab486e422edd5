/**
 * @file TakeDuration.hpp
 * @brief Truncates a source after a fixed duration.
 */

#ifndef PCMFLOW_TAKE_DURATION_HPP
#define PCMFLOW_TAKE_DURATION_HPP

#include "Source.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace pcmflow {

class TakeDuration : public Source {
public:
    TakeDuration(SourcePtr inner, std::chrono::nanoseconds duration)
        : inner_(std::move(inner))
    {
        if (!inner_) {
            throw std::invalid_argument("TakeDuration: inner source is null");
        }
        frames_left_ = frames_for(duration, inner_->format().sample_rate);
    }

    StreamFormat format() const override { return inner_->format(); }

protected:
    size_t do_pull(std::span<Sample> output) override {
        const size_t channels = inner_->format().channels;
        const size_t wanted = static_cast<size_t>(std::min<uint64_t>(frames_left_, output.size() / channels));
        if (wanted == 0) {
            return 0;
        }

        const size_t got = inner_->pull(output.first(wanted * channels));
        frames_left_ -= got;
        return got;
    }

    std::optional<uint64_t> frames_left() const override {
        const auto inner_left = inner_->remaining_frames();
        if (!inner_left) {
            return frames_left_;
        }
        return std::min(frames_left_, *inner_left);
    }

private:
    SourcePtr inner_;
    uint64_t frames_left_ = 0;
};

} // namespace pcmflow

#endif // PCMFLOW_TAKE_DURATION_HPP
