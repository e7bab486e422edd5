/**
 * @file StreamFormat.hpp
 * @brief Channel count, sample rate and encoding of a stream.
 */

#ifndef PCMFLOW_STREAM_FORMAT_HPP
#define PCMFLOW_STREAM_FORMAT_HPP

#include "Sample.hpp"
#include <chrono>
#include <cmath>
#include <ostream>
#include <string>

namespace pcmflow {

/**
 * @brief Format advertised by every source. Constant for the lifetime of the source.
 */
struct StreamFormat {
    ChannelCount channels = 2;
    SampleRate sample_rate = 44100;
    SampleFormat encoding = SampleFormat::F32;

    bool is_valid() const {
        return channels > 0 && sample_rate > 0;
    }

    size_t bytes_per_frame() const {
        return static_cast<size_t>(channels) * bytes_per_sample(encoding);
    }

    bool operator==(const StreamFormat&) const = default;
};

/**
 * @brief Number of frames spanning @p duration at @p sample_rate, rounded to nearest.
 */
inline uint64_t frames_for(std::chrono::nanoseconds duration, SampleRate sample_rate) {
    if (duration.count() <= 0) {
        return 0;
    }
    const double frames = static_cast<double>(duration.count()) * sample_rate / 1e9;
    return static_cast<uint64_t>(std::llround(frames));
}

/**
 * @brief Playback time of @p frames at @p sample_rate.
 */
inline std::chrono::duration<double> duration_for(uint64_t frames, SampleRate sample_rate) {
    return std::chrono::duration<double>(static_cast<double>(frames) / sample_rate);
}

inline std::string to_string(const StreamFormat& format) {
    return std::to_string(format.channels) + "ch/" + std::to_string(format.sample_rate) + "Hz/"
        + to_string(format.encoding);
}

inline std::ostream& operator<<(std::ostream& os, const StreamFormat& format) {
    return os << to_string(format);
}

} // namespace pcmflow

#endif // PCMFLOW_STREAM_FORMAT_HPP
