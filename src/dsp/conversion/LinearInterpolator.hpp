/**
 * @file LinearInterpolator.hpp
 * @brief Fractional-cursor linear interpolation over the frames of a source.
 */

#ifndef PCMFLOW_LINEAR_INTERPOLATOR_HPP
#define PCMFLOW_LINEAR_INTERPOLATOR_HPP

#include "Source.hpp"
#include <vector>

namespace pcmflow {

/**
 * @brief Synthesizes output frames between the two input frames around a fractional cursor.
 *
 * The cursor is an exact fraction over a fixed denominator. Each output frame
 * advances it by @p step_num / denominator input frames, so a step of A/B
 * converts rate A to rate B, and a step of 2/1 plays twice as fast. Only two
 * input frames are held at any time.
 *
 * When the inner source runs out, the window is finished against the last
 * available frame; N input frames therefore yield
 * ceil(N * denominator / step_num) output frames.
 */
class LinearInterpolator {
public:
    LinearInterpolator(ChannelCount channels, uint64_t denominator);

    /**
     * @brief Fill @p output with interpolated frames read from @p inner.
     *
     * @return Frames written; fewer than requested once the input is used up.
     */
    size_t process(Source& inner, std::span<Sample> output, uint64_t step_num);

    /**
     * @brief Output frames left at @p step_num, given what @p inner reports.
     */
    std::optional<uint64_t> remaining(const Source& inner, uint64_t step_num) const;

    /**
     * @brief Hand back the input frames still held in the window, in order.
     *
     * Copies as many held frames as fit in @p output and forgets them. Once
     * the window is empty the cursor is reset, and the next process() primes
     * from the inner source again.
     *
     * @return Frames written.
     */
    size_t drain(std::span<Sample> output);

    /**
     * @brief Input frames read from the source but not yet handed out.
     */
    size_t held_frames() const;

    uint64_t denominator() const { return denominator_; }
    bool finished() const { return finished_; }

private:
    bool prime(Source& inner);
    void load_next(Source& inner);

    size_t channels_;
    uint64_t denominator_;
    std::vector<Sample> prev_;
    std::vector<Sample> next_;
    uint64_t position_;   // cursor between prev_ and next_, in 1/denominator_ input frames
    bool primed_;
    bool has_next_;   // next_ holds a real input frame rather than a copy of prev_
    bool inner_done_;
    bool finished_;
};

} // namespace pcmflow

#endif // PCMFLOW_LINEAR_INTERPOLATOR_HPP
