/**
 * @file NullDriver.cpp
 */

#include "NullDriver.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace pcmflow::hal {

NullDriver::NullDriver(const StreamFormat& format, size_t block_size, bool paced)
    : format_(format)
    , block_size_(block_size)
    , paced_(paced)
{}

NullDriver::~NullDriver() {
    stop();
}

bool NullDriver::open() {
    if (!format_.is_valid() || block_size_ == 0) {
        std::cerr << "NULL: Invalid format " << to_string(format_) << " / block size " << block_size_ << std::endl;
        return false;
    }
    open_ = true;
    return true;
}

bool NullDriver::start() {
    if (running_) return true;
    if (!open_ && !open()) {
        return false;
    }

    running_ = true;
    if (paced_) {
        processing_thread_ = std::thread(&NullDriver::thread_loop, this);
    }
    return true;
}

void NullDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
}

void NullDriver::render(std::span<std::byte> output, size_t frames) {
    const size_t frame_bytes = format_.bytes_per_frame();
    frames = std::min(frames, output.size() / frame_bytes);

    if (callback_) {
        callback_(output.first(frames * frame_bytes), frames);
    } else {
        std::byte* dest = output.data();
        const size_t sample_bytes = bytes_per_sample(format_.encoding);
        for (size_t i = 0; i < frames * format_.channels; ++i) {
            encode_silence(format_.encoding, dest);
            dest += sample_bytes;
        }
    }
    blocks_rendered_.fetch_add(1, std::memory_order_acq_rel);
}

void NullDriver::thread_loop() {
    std::vector<std::byte> buffer(block_size_ * format_.bytes_per_frame());
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        duration_for(block_size_, format_.sample_rate));
    auto next = std::chrono::steady_clock::now();

    while (running_) {
        render(std::span<std::byte>(buffer), block_size_);
        next += period;
        std::this_thread::sleep_until(next);
    }
}

} // namespace pcmflow::hal
