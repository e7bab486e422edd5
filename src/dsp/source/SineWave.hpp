/**
 * @file SineWave.hpp
 * @brief Infinite sine tone using rotor-based generation.
 */

#ifndef PCMFLOW_SINE_WAVE_HPP
#define PCMFLOW_SINE_WAVE_HPP

#include "Source.hpp"
#include <cmath>
#include <stdexcept>
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace pcmflow {

/**
 * @brief Sine tone written identically to every channel.
 *
 * Uses a complex rotor (x, y) that rotates around the unit circle, with
 * periodic normalization to prevent floating-point drift.
 */
class SineWave : public Source {
public:
    SineWave(double frequency, SampleRate sample_rate, ChannelCount channels = 1, float amplitude = 1.0f)
        : format_{channels, sample_rate, SampleFormat::F32}
        , amplitude_(amplitude)
        , x_(1.0)
        , y_(0.0)
        , sample_count_(0)
    {
        if (!format_.is_valid()) {
            throw std::invalid_argument("SineWave: channels and sample rate must be non-zero");
        }
        if (!(frequency > 0.0)) {
            throw std::invalid_argument("SineWave: frequency must be positive");
        }
        const double angle_per_sample = 2.0 * M_PI * frequency / sample_rate;
        cos_step_ = std::cos(angle_per_sample);
        sin_step_ = std::sin(angle_per_sample);
    }

    StreamFormat format() const override { return format_; }

protected:
    static constexpr int NORMALIZE_INTERVAL = 1024;

    size_t do_pull(std::span<Sample> output) override {
        const size_t channels = format_.channels;
        const size_t frames = output.size() / channels;
        for (size_t f = 0; f < frames; ++f) {
            const Sample value = static_cast<Sample>(y_) * amplitude_;
            for (size_t c = 0; c < channels; ++c) {
                output[f * channels + c] = value;
            }
            advance();
        }
        return frames;
    }

    std::optional<uint64_t> frames_left() const override { return std::nullopt; }

private:
    void advance() {
        const double next_x = x_ * cos_step_ - y_ * sin_step_;
        const double next_y = x_ * sin_step_ + y_ * cos_step_;
        x_ = next_x;
        y_ = next_y;

        if (++sample_count_ >= NORMALIZE_INTERVAL) {
            const double magnitude = std::sqrt(x_ * x_ + y_ * y_);
            if (magnitude > 0.0) {
                x_ /= magnitude;
                y_ /= magnitude;
            }
            sample_count_ = 0;
        }
    }

    StreamFormat format_;
    float amplitude_;
    double x_;           // Rotor x component
    double y_;           // Rotor y component (output: sin = y)
    double cos_step_;
    double sin_step_;
    int sample_count_;
};

} // namespace pcmflow

#endif // PCMFLOW_SINE_WAVE_HPP
