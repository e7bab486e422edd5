/**
 * @file SamplesBuffer.hpp
 * @brief In-memory source over interleaved float samples.
 */

#ifndef PCMFLOW_SAMPLES_BUFFER_HPP
#define PCMFLOW_SAMPLES_BUFFER_HPP

#include "Source.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace pcmflow {

/**
 * @brief Plays back a vector of interleaved samples once.
 */
class SamplesBuffer : public Source {
public:
    /**
     * @param channels Interleaved channel count (> 0).
     * @param sample_rate Frames per second (> 0).
     * @param samples Interleaved data; size must be a whole number of frames.
     */
    SamplesBuffer(ChannelCount channels, SampleRate sample_rate, std::vector<Sample> samples)
        : format_{channels, sample_rate, SampleFormat::F32}
        , samples_(std::move(samples))
        , position_(0)
    {
        if (!format_.is_valid()) {
            throw std::invalid_argument("SamplesBuffer: channels and sample rate must be non-zero");
        }
        if (samples_.size() % channels != 0) {
            throw std::invalid_argument("SamplesBuffer: sample count is not a whole number of frames");
        }
    }

    StreamFormat format() const override { return format_; }

protected:
    size_t do_pull(std::span<Sample> output) override {
        const size_t available = samples_.size() - position_;
        const size_t count = std::min(available, output.size());
        std::copy_n(samples_.begin() + static_cast<std::ptrdiff_t>(position_), count, output.begin());
        position_ += count;
        return count / format_.channels;
    }

    std::optional<uint64_t> frames_left() const override {
        return (samples_.size() - position_) / format_.channels;
    }

private:
    StreamFormat format_;
    std::vector<Sample> samples_;
    size_t position_;
};

} // namespace pcmflow

#endif // PCMFLOW_SAMPLES_BUFFER_HPP
