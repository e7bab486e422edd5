/**
 * @file RawBufferSource.hpp
 * @brief Source over interleaved PCM bytes in any supported encoding.
 *
 * This is the shape decoder output takes at the boundary: raw interleaved
 * frames plus a truthful format.
 */

#ifndef PCMFLOW_RAW_BUFFER_SOURCE_HPP
#define PCMFLOW_RAW_BUFFER_SOURCE_HPP

#include "Source.hpp"
#include <cstddef>
#include <vector>

namespace pcmflow {

/**
 * @brief Decodes host-endian PCM bytes into pipeline samples on demand.
 *
 * The declared format keeps the byte encoding, so a mixer running at a
 * different encoding needs an EncodingAdapter in front of it.
 */
class RawBufferSource : public Source {
public:
    /**
     * @throws std::invalid_argument if the format is invalid or @p bytes is not a whole number of frames.
     */
    RawBufferSource(const StreamFormat& format, std::vector<std::byte> bytes);

    StreamFormat format() const override { return format_; }

protected:
    size_t do_pull(std::span<Sample> output) override;
    std::optional<uint64_t> frames_left() const override;

private:
    StreamFormat format_;
    std::vector<std::byte> bytes_;
    size_t sample_size_;
    size_t position_;
};

} // namespace pcmflow

#endif // PCMFLOW_RAW_BUFFER_SOURCE_HPP
