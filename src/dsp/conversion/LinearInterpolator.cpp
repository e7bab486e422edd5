/**
 * @file LinearInterpolator.cpp
 * @brief Implementation of the shared interpolation core.
 */

#include "LinearInterpolator.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace pcmflow {

LinearInterpolator::LinearInterpolator(ChannelCount channels, uint64_t denominator)
    : channels_(channels)
    , denominator_(denominator)
    , prev_(channels, 0.0f)
    , next_(channels, 0.0f)
    , position_(0)
    , primed_(false)
    , has_next_(false)
    , inner_done_(false)
    , finished_(false)
{
    if (denominator_ == 0) {
        throw std::invalid_argument("LinearInterpolator: denominator must be non-zero");
    }
}

bool LinearInterpolator::prime(Source& inner) {
    primed_ = true;
    if (!inner.next_frame(prev_)) {
        finished_ = true;
        return false;
    }
    load_next(inner);
    return true;
}

void LinearInterpolator::load_next(Source& inner) {
    has_next_ = inner.next_frame(next_);
    if (!has_next_) {
        inner_done_ = true;
        // Finish the window against the last available frame
        std::copy(prev_.begin(), prev_.end(), next_.begin());
    }
}

size_t LinearInterpolator::process(Source& inner, std::span<Sample> output, uint64_t step_num) {
    if (finished_) {
        return 0;
    }
    if (!primed_ && !prime(inner)) {
        return 0;
    }
    if (!has_next_ && !inner_done_) {
        // A partial drain() left the window one frame short
        load_next(inner);
    }

    const size_t frames = output.size() / channels_;
    for (size_t frame = 0; frame < frames; ++frame) {
        Sample* out = output.data() + frame * channels_;
        if (position_ == 0) {
            std::copy(prev_.begin(), prev_.end(), out);
        } else {
            const Sample t = static_cast<Sample>(static_cast<double>(position_) / static_cast<double>(denominator_));
            for (size_t c = 0; c < channels_; ++c) {
                out[c] = prev_[c] + (next_[c] - prev_[c]) * t;
            }
        }

        position_ += step_num;
        while (position_ >= denominator_) {
            if (!has_next_) {
                finished_ = true;
                return frame + 1;
            }
            position_ -= denominator_;
            std::swap(prev_, next_);
            load_next(inner);
        }
    }
    return frames;
}

std::optional<uint64_t> LinearInterpolator::remaining(const Source& inner, uint64_t step_num) const {
    if (finished_) {
        return 0;
    }
    const auto inner_left = inner.remaining_frames();
    if (!inner_left) {
        return std::nullopt;
    }

    // Output positions sit at position_ + k * step_num and stay below the
    // last available input frame plus one.
    const uint64_t available = *inner_left + held_frames();
    const uint64_t span = available * denominator_;
    if (span <= position_) {
        return 0;
    }
    return (span - position_ + step_num - 1) / step_num;
}

size_t LinearInterpolator::drain(std::span<Sample> output) {
    const size_t frames = output.size() / channels_;
    size_t written = 0;
    while (written < frames && held_frames() > 0) {
        std::copy(prev_.begin(), prev_.end(), output.data() + written * channels_);
        ++written;
        if (has_next_) {
            std::swap(prev_, next_);
            has_next_ = false;
        } else {
            primed_ = false;
        }
    }
    if (held_frames() == 0) {
        primed_ = false;
        has_next_ = false;
        position_ = 0;
    }
    return written;
}

size_t LinearInterpolator::held_frames() const {
    if (!primed_ || finished_) {
        return 0;
    }
    return has_next_ ? 2 : 1;
}

} // namespace pcmflow
