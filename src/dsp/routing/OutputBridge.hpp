/**
 * @file OutputBridge.hpp
 * @brief Fills hardware period buffers from the mixer output.
 */

#ifndef PCMFLOW_OUTPUT_BRIDGE_HPP
#define PCMFLOW_OUTPUT_BRIDGE_HPP

#include "Source.hpp"
#include "PerformanceProfiler.hpp"
#include <atomic>
#include <cstddef>
#include <span>
#include <vector>

namespace pcmflow {

/**
 * @brief The only component that runs inside the hardware deadline.
 *
 * render() pulls exactly the requested number of frames from the root
 * source, encodes them to the device encoding in place, and pads any
 * shortfall with encoded silence. It never allocates, blocks or throws.
 */
class OutputBridge {
public:
    /**
     * @param root Mixer output (or any source) at the device channel count and rate.
     * @param device Negotiated device format.
     * @param max_block_frames Scratch size; longer periods are rendered in pieces.
     * @throws std::invalid_argument on a null root, a channel/rate mismatch or a zero block size.
     */
    OutputBridge(SourcePtr root, const StreamFormat& device, size_t max_block_frames);

    /**
     * @brief Render @p frames frames into @p output.
     *
     * Frames that do not fit in @p output are not written.
     *
     * @return Frames that came from the root source; the rest is silence.
     */
    size_t render(std::span<std::byte> output, size_t frames);

    const StreamFormat& device_format() const { return device_; }

    /**
     * @brief Total silence frames inserted because the root came up short.
     */
    uint64_t underrun_frames() const { return underrun_frames_.load(std::memory_order_relaxed); }

    const PerformanceProfiler& profiler() const { return profiler_; }

private:
    SourcePtr root_;
    StreamFormat device_;
    size_t max_block_frames_;
    std::vector<Sample> scratch_;
    std::atomic<uint64_t> underrun_frames_{0};
    PerformanceProfiler profiler_;
};

} // namespace pcmflow

#endif // PCMFLOW_OUTPUT_BRIDGE_HPP
