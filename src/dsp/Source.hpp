/**
 * @file Source.hpp
 * @brief Base class for every producer of interleaved audio frames (Pull Model).
 *
 * Decoders, generators, conversion adapters, effects, queues and the mixer
 * all implement this contract, so they compose into an ownership tree where
 * each adapter owns exactly one inner source.
 */

#ifndef PCMFLOW_SOURCE_HPP
#define PCMFLOW_SOURCE_HPP

#include "StreamFormat.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace pcmflow {

/**
 * @brief Lazy, single-pass sequence of interleaved frames with a constant format.
 *
 * Key rules:
 * - pull() only ever writes whole frames.
 * - Writing fewer frames than requested means the source is exhausted.
 * - Once exhausted, a source stays exhausted (enforced here, not by subclasses).
 * - pull() never blocks on I/O and never allocates.
 */
class Source {
public:
    virtual ~Source() = default;

    /**
     * @brief Pull up to output.size() / channels frames into @p output.
     *
     * Trailing samples that do not form a whole frame are left untouched.
     *
     * @return Number of frames written.
     */
    size_t pull(std::span<Sample> output) {
        if (exhausted_) {
            return 0;
        }

        const size_t channels = format().channels;
        const size_t requested = output.size() / channels;
        if (requested == 0) {
            return 0;
        }

        const size_t written = do_pull(output.first(requested * channels));
        if (written < requested) {
            exhausted_ = true;
        }
        return written;
    }

    /**
     * @brief Produce the next frame, or report exhaustion.
     *
     * @param frame Destination of at least channels samples.
     * @return false once the source is exhausted.
     */
    bool next_frame(std::span<Sample> frame) {
        const size_t channels = format().channels;
        if (frame.size() < channels) {
            return false;
        }
        return pull(frame.first(channels)) == 1;
    }

    /**
     * @brief Format of the frames produced by this source.
     */
    virtual StreamFormat format() const = 0;

    /**
     * @brief Number of frames left, if known. Zero once exhausted.
     */
    std::optional<uint64_t> remaining_frames() const {
        if (exhausted_) {
            return 0;
        }
        return frames_left();
    }

    bool is_exhausted() const { return exhausted_; }

protected:
    /**
     * @brief Fill @p output (a whole number of frames) and return frames written.
     */
    virtual size_t do_pull(std::span<Sample> output) = 0;

    /**
     * @brief Remaining frame count if known, std::nullopt for unknown or unbounded.
     */
    virtual std::optional<uint64_t> frames_left() const = 0;

private:
    bool exhausted_ = false;
};

using SourcePtr = std::unique_ptr<Source>;

} // namespace pcmflow

#endif // PCMFLOW_SOURCE_HPP
