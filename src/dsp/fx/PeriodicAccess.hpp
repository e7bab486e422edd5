/**
 * @file PeriodicAccess.hpp
 * @brief Calls a hook on the inner source every N frames.
 */

#ifndef PCMFLOW_PERIODIC_ACCESS_HPP
#define PCMFLOW_PERIODIC_ACCESS_HPP

#include "Source.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <stdexcept>

namespace pcmflow {

/**
 * @brief Invokes @p callback with the inner source before frame 0, N, 2N, ...
 *
 * Samples pass through unchanged. The callback runs on the audio thread,
 * so it must not block or allocate.
 */
class PeriodicAccess : public Source {
public:
    using Callback = std::function<void(Source& inner)>;

    PeriodicAccess(SourcePtr inner, uint64_t period_frames, Callback callback)
        : inner_(std::move(inner))
        , period_(period_frames)
        , until_next_(0)
        , callback_(std::move(callback))
    {
        validate();
    }

    PeriodicAccess(SourcePtr inner, std::chrono::nanoseconds period, Callback callback)
        : inner_(std::move(inner))
        , period_(0)
        , until_next_(0)
        , callback_(std::move(callback))
    {
        if (inner_) {
            period_ = frames_for(period, inner_->format().sample_rate);
        }
        validate();
    }

    StreamFormat format() const override { return inner_->format(); }

protected:
    size_t do_pull(std::span<Sample> output) override {
        const size_t channels = inner_->format().channels;
        const size_t frames = output.size() / channels;
        size_t done = 0;

        while (done < frames) {
            if (until_next_ == 0) {
                callback_(*inner_);
                until_next_ = period_;
            }

            const size_t wanted = static_cast<size_t>(std::min<uint64_t>(until_next_, frames - done));
            const size_t got = inner_->pull(output.subspan(done * channels, wanted * channels));
            done += got;
            until_next_ -= got;

            if (got < wanted) {
                break;
            }
        }
        return done;
    }

    std::optional<uint64_t> frames_left() const override {
        return inner_->remaining_frames();
    }

private:
    void validate() const {
        if (!inner_) {
            throw std::invalid_argument("PeriodicAccess: inner source is null");
        }
        if (period_ == 0) {
            throw std::invalid_argument("PeriodicAccess: period must be at least one frame");
        }
        if (!callback_) {
            throw std::invalid_argument("PeriodicAccess: callback is empty");
        }
    }

    SourcePtr inner_;
    uint64_t period_;
    uint64_t until_next_;
    Callback callback_;
};

} // namespace pcmflow

#endif // PCMFLOW_PERIODIC_ACCESS_HPP
