/**
 * @file TrackPosition.hpp
 * @brief Counts the frames a source has delivered.
 */

#ifndef PCMFLOW_TRACK_POSITION_HPP
#define PCMFLOW_TRACK_POSITION_HPP

#include "Source.hpp"
#include "Parameter.hpp"
#include <stdexcept>

namespace pcmflow {

/**
 * @brief Passes frames through and adds their count to a shared counter.
 *
 * The counter can be read from the control thread to report playback position.
 */
class TrackPosition : public Source {
public:
    TrackPosition(SourcePtr inner, CounterParameter frames_played)
        : inner_(std::move(inner))
        , frames_played_(std::move(frames_played))
    {
        if (!inner_) {
            throw std::invalid_argument("TrackPosition: inner source is null");
        }
    }

    explicit TrackPosition(SourcePtr inner)
        : TrackPosition(std::move(inner), CounterParameter(0))
    {}

    StreamFormat format() const override { return inner_->format(); }

    CounterParameter frames_played() const { return frames_played_; }

    std::chrono::duration<double> position() const {
        return duration_for(frames_played_.load(), inner_->format().sample_rate);
    }

protected:
    size_t do_pull(std::span<Sample> output) override {
        const size_t got = inner_->pull(output);
        if (got > 0) {
            frames_played_.fetch_add(got);
        }
        return got;
    }

    std::optional<uint64_t> frames_left() const override {
        return inner_->remaining_frames();
    }

private:
    SourcePtr inner_;
    CounterParameter frames_played_;
};

} // namespace pcmflow

#endif // PCMFLOW_TRACK_POSITION_HPP
