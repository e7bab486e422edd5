/**
 * @file PrefetchSource.cpp
 * @brief Worker thread and real-time drain of the prefetch ring.
 */

#include "PrefetchSource.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace pcmflow {

PrefetchSource::PrefetchSource(SourcePtr inner, size_t capacity_frames, size_t chunk_frames)
    : format_(inner ? inner->format() : StreamFormat{})
    , inner_(std::move(inner))
    , consumed_frames_(0)
    , chunk_frames_(chunk_frames)
    , ring_(capacity_frames * format_.channels)
    , status_(std::make_shared<PrefetchStatus>())
{
    if (!inner_) {
        throw std::invalid_argument("PrefetchSource: inner source is null");
    }
    if (capacity_frames == 0 || chunk_frames == 0) {
        throw std::invalid_argument("PrefetchSource: capacity and chunk size must be non-zero");
    }
    total_frames_ = inner_->remaining_frames();
    worker_ = std::thread(&PrefetchSource::worker_loop, this);
}

PrefetchSource::~PrefetchSource() {
    stop_requested_.store(true, std::memory_order_release);
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool PrefetchSource::wait_for_prefill(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const size_t channels = format_.channels;
    while (!status_->finished()) {
        // A ring that cannot take one more chunk counts as prefilled
        if (ring_.free_space() < chunk_frames_ * channels) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

void PrefetchSource::worker_loop() {
    const size_t channels = format_.channels;
    std::vector<Sample> chunk(chunk_frames_ * channels);

    while (!stop_requested_.load(std::memory_order_acquire)) {
        if (ring_.free_space() < chunk.size()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }

        size_t frames = 0;
        try {
            frames = inner_->pull(std::span<Sample>(chunk));
        } catch (const std::exception& e) {
            std::cerr << "[PrefetchSource] Inner source failed: " << e.what() << std::endl;
            status_->set_error(e.what());
            break;
        }

        // Free space was checked above and only this thread pushes
        for (size_t i = 0; i < frames * channels; ++i) {
            if (!ring_.push(chunk[i])) {
                break;
            }
        }

        if (frames < chunk_frames_) {
            break;
        }
    }

    status_->finished_.store(true, std::memory_order_release);
}

size_t PrefetchSource::do_pull(std::span<Sample> output) {
    const size_t channels = format_.channels;
    const size_t requested = output.size() / channels;
    size_t written = 0;
    size_t underruns = 0;

    for (; written < requested; ++written) {
        // Read the flag before the size so every sample pushed before it is visible
        const bool producer_done = status_->finished();
        if (ring_.size() < channels) {
            if (producer_done) {
                break;
            }
            std::fill_n(output.begin() + static_cast<std::ptrdiff_t>(written * channels), channels, 0.0f);
            ++underruns;
            continue;
        }
        for (size_t c = 0; c < channels; ++c) {
            Sample& slot = output[written * channels + c];
            if (!ring_.try_pop(slot)) {
                slot = 0.0f;
            }
        }
    }

    if (underruns > 0) {
        status_->underrun_frames_.fetch_add(underruns, std::memory_order_relaxed);
        AudioLogger::instance().log_event("PREFETCH_UNDERRUN", static_cast<float>(underruns));
    }
    consumed_frames_ += written - underruns;
    return written;
}

std::optional<uint64_t> PrefetchSource::frames_left() const {
    if (!total_frames_) {
        return std::nullopt;
    }
    return *total_frames_ > consumed_frames_ ? *total_frames_ - consumed_frames_ : 0;
}

} // namespace pcmflow
