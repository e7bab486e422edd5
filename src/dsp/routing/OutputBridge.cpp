/**
 * @file OutputBridge.cpp
 */

#include "OutputBridge.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcmflow {

OutputBridge::OutputBridge(SourcePtr root, const StreamFormat& device, size_t max_block_frames)
    : root_(std::move(root))
    , device_(device)
    , max_block_frames_(max_block_frames)
{
    if (!root_) {
        throw std::invalid_argument("OutputBridge: root source is null");
    }
    if (!device_.is_valid() || max_block_frames_ == 0) {
        throw std::invalid_argument("OutputBridge: invalid device format or block size");
    }

    const StreamFormat source = root_->format();
    if (source.channels != device_.channels || source.sample_rate != device_.sample_rate) {
        throw std::invalid_argument("OutputBridge: root " + to_string(source)
                                    + " does not match device " + to_string(device_));
    }
    scratch_.resize(max_block_frames_ * device_.channels);
}

size_t OutputBridge::render(std::span<std::byte> output, size_t frames) {
    profiler_.start();

    const size_t channels = device_.channels;
    const size_t sample_bytes = bytes_per_sample(device_.encoding);
    const size_t frame_bytes = channels * sample_bytes;
    frames = std::min(frames, output.size() / frame_bytes);

    size_t produced = 0;
    size_t done = 0;
    std::byte* dest = output.data();

    while (done < frames) {
        const size_t chunk = std::min(max_block_frames_, frames - done);
        std::span<Sample> scratch(scratch_.data(), chunk * channels);

        const size_t got = root_->pull(scratch);
        produced += got;

        const size_t samples = got * channels;
        for (size_t i = 0; i < samples; ++i) {
            encode_sample(scratch[i], device_.encoding, dest);
            dest += sample_bytes;
        }
        done += got;

        if (got < chunk) {
            break;
        }
    }

    // Underrun: pad with the encoding's silence
    const size_t missing = frames - done;
    if (missing > 0) {
        const size_t samples = missing * channels;
        for (size_t i = 0; i < samples; ++i) {
            encode_silence(device_.encoding, dest);
            dest += sample_bytes;
        }
        underrun_frames_.fetch_add(missing, std::memory_order_relaxed);
        AudioLogger::instance().log_event("UNDERRUN", static_cast<float>(missing));
    }

    profiler_.stop();
#if PCMFLOW_ENABLE_PROFILING
    AudioLogger::instance().log_event("RENDER_US", static_cast<float>(profiler_.elapsed().count()) / 1000.0f);
    const auto period = std::chrono::duration_cast<std::chrono::nanoseconds>(duration_for(frames, device_.sample_rate));
    if (profiler_.exceeds_budget(period)) {
        AudioLogger::instance().log_event("OVER_BUDGET", static_cast<float>(frames));
    }
#endif
    return produced;
}

} // namespace pcmflow
