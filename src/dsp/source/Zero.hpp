/**
 * @file Zero.hpp
 * @brief Silence generators: finite or infinite silence, and the empty source.
 */

#ifndef PCMFLOW_ZERO_HPP
#define PCMFLOW_ZERO_HPP

#include "Source.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcmflow {

/**
 * @brief Produces silence, forever or for a fixed number of frames.
 */
class Zero : public Source {
public:
    /**
     * @param frames Total frames to emit; std::nullopt for an infinite source.
     */
    Zero(ChannelCount channels, SampleRate sample_rate, std::optional<uint64_t> frames = std::nullopt)
        : format_{channels, sample_rate, SampleFormat::F32}
        , remaining_(frames)
    {
        if (!format_.is_valid()) {
            throw std::invalid_argument("Zero: channels and sample rate must be non-zero");
        }
    }

    StreamFormat format() const override { return format_; }

protected:
    size_t do_pull(std::span<Sample> output) override {
        size_t frames = output.size() / format_.channels;
        if (remaining_) {
            frames = static_cast<size_t>(std::min<uint64_t>(frames, *remaining_));
            *remaining_ -= frames;
        }
        std::fill_n(output.begin(), frames * format_.channels, 0.0f);
        return frames;
    }

    std::optional<uint64_t> frames_left() const override { return remaining_; }

private:
    StreamFormat format_;
    std::optional<uint64_t> remaining_;
};

/**
 * @brief A source that is exhausted from the start.
 */
class Empty : public Source {
public:
    explicit Empty(const StreamFormat& format = StreamFormat{})
        : format_(format)
    {
        if (!format_.is_valid()) {
            throw std::invalid_argument("Empty: channels and sample rate must be non-zero");
        }
    }

    StreamFormat format() const override { return format_; }

protected:
    size_t do_pull(std::span<Sample> /* output */) override { return 0; }
    std::optional<uint64_t> frames_left() const override { return 0; }

private:
    StreamFormat format_;
};

} // namespace pcmflow

#endif // PCMFLOW_ZERO_HPP
