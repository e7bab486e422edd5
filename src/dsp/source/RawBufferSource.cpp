/**
 * @file RawBufferSource.cpp
 * @brief Implementation of the raw PCM byte source.
 */

#include "RawBufferSource.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcmflow {

RawBufferSource::RawBufferSource(const StreamFormat& format, std::vector<std::byte> bytes)
    : format_(format)
    , bytes_(std::move(bytes))
    , sample_size_(bytes_per_sample(format.encoding))
    , position_(0)
{
    if (!format_.is_valid()) {
        throw std::invalid_argument("RawBufferSource: channels and sample rate must be non-zero");
    }
    if (bytes_.size() % format_.bytes_per_frame() != 0) {
        throw std::invalid_argument("RawBufferSource: byte count is not a whole number of frames");
    }
}

size_t RawBufferSource::do_pull(std::span<Sample> output) {
    const size_t available_samples = (bytes_.size() - position_) / sample_size_;
    const size_t count = std::min(available_samples, output.size());

    for (size_t i = 0; i < count; ++i) {
        output[i] = decode_sample(bytes_.data() + position_, format_.encoding);
        position_ += sample_size_;
    }
    return count / format_.channels;
}

std::optional<uint64_t> RawBufferSource::frames_left() const {
    return (bytes_.size() - position_) / format_.bytes_per_frame();
}

} // namespace pcmflow
