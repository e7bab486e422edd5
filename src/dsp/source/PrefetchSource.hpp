/**
 * @file PrefetchSource.hpp
 * @brief Moves a blocking source (typically a decoder) onto a background thread.
 */

#ifndef PCMFLOW_PREFETCH_SOURCE_HPP
#define PCMFLOW_PREFETCH_SOURCE_HPP

#include "Source.hpp"
#include "SpscQueue.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace pcmflow {

/**
 * @brief Out-of-band state of a PrefetchSource, readable from the control side.
 *
 * Stays valid after the source itself has been moved into the audio graph
 * and destroyed.
 */
class PrefetchStatus {
public:
    bool finished() const { return finished_.load(std::memory_order_acquire); }
    bool failed() const { return failed_.load(std::memory_order_acquire); }
    uint64_t underrun_frames() const { return underrun_frames_.load(std::memory_order_relaxed); }

    std::string error_message() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_message_;
    }

private:
    friend class PrefetchSource;

    void set_error(const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            error_message_ = message;
        }
        failed_.store(true, std::memory_order_release);
    }

    std::atomic<bool> finished_{false};
    std::atomic<bool> failed_{false};
    std::atomic<uint64_t> underrun_frames_{0};
    mutable std::mutex mutex_;
    std::string error_message_;
};

/**
 * @brief Drains a bounded ring that a worker thread fills from the inner source.
 *
 * The inner source may block or throw; both happen on the worker thread.
 * An exception from the inner source ends the stream and is reported through
 * PrefetchStatus. If the ring runs dry before the worker has finished, pull()
 * emits silence frames instead of waiting.
 *
 * Destruction joins the worker, so the object must be destroyed on the
 * control side (the mixer hands retired sources back for that).
 */
class PrefetchSource : public Source {
public:
    /**
     * @param inner Source to read from the worker thread.
     * @param capacity_frames Ring capacity in frames (> 0).
     * @param chunk_frames Frames read from @p inner per worker iteration (> 0).
     */
    explicit PrefetchSource(SourcePtr inner, size_t capacity_frames = 8192, size_t chunk_frames = 512);
    ~PrefetchSource() override;

    PrefetchSource(const PrefetchSource&) = delete;
    PrefetchSource& operator=(const PrefetchSource&) = delete;

    StreamFormat format() const override { return format_; }

    std::shared_ptr<const PrefetchStatus> status() const { return status_; }

    /**
     * @brief Block the calling (control) thread until the ring is full or the inner source ended.
     *
     * @return false on timeout.
     */
    bool wait_for_prefill(std::chrono::milliseconds timeout) const;

protected:
    size_t do_pull(std::span<Sample> output) override;
    std::optional<uint64_t> frames_left() const override;

private:
    void worker_loop();

    StreamFormat format_;
    SourcePtr inner_;
    std::optional<uint64_t> total_frames_;
    uint64_t consumed_frames_;
    size_t chunk_frames_;
    SpscQueue<Sample> ring_;
    std::shared_ptr<PrefetchStatus> status_;
    std::atomic<bool> stop_requested_{false};
    std::thread worker_;
};

} // namespace pcmflow

#endif // PCMFLOW_PREFETCH_SOURCE_HPP
