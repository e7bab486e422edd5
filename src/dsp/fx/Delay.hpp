/**
 * @file Delay.hpp
 * @brief Prepends silence before the first frame of the inner source.
 */

#ifndef PCMFLOW_DELAY_HPP
#define PCMFLOW_DELAY_HPP

#include "Source.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace pcmflow {

/**
 * @brief Emits @p duration of silence, measured in frames of the inner format, then the inner source.
 */
class Delay : public Source {
public:
    Delay(SourcePtr inner, std::chrono::nanoseconds duration)
        : inner_(std::move(inner))
    {
        if (!inner_) {
            throw std::invalid_argument("Delay: inner source is null");
        }
        silence_left_ = frames_for(duration, inner_->format().sample_rate);
    }

    StreamFormat format() const override { return inner_->format(); }

protected:
    size_t do_pull(std::span<Sample> output) override {
        const size_t channels = inner_->format().channels;
        const size_t frames = output.size() / channels;

        const size_t silent = static_cast<size_t>(std::min<uint64_t>(silence_left_, frames));
        std::fill_n(output.begin(), silent * channels, 0.0f);
        silence_left_ -= silent;

        if (silent == frames) {
            return frames;
        }
        return silent + inner_->pull(output.subspan(silent * channels));
    }

    std::optional<uint64_t> frames_left() const override {
        const auto inner_left = inner_->remaining_frames();
        if (!inner_left) {
            return std::nullopt;
        }
        return silence_left_ + *inner_left;
    }

private:
    SourcePtr inner_;
    uint64_t silence_left_ = 0;
};

} // namespace pcmflow

#endif // PCMFLOW_DELAY_HPP
