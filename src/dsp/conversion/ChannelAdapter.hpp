/**
 * @file ChannelAdapter.hpp
 * @brief Maps N input channels to M output channels per frame.
 */

#ifndef PCMFLOW_CHANNEL_ADAPTER_HPP
#define PCMFLOW_CHANNEL_ADAPTER_HPP

#include "Source.hpp"
#include <vector>

namespace pcmflow {

/**
 * @brief Fixed-rule channel count converter.
 *
 * Upmix: output channel c takes input channel c mod N (mono is duplicated
 * to every output, stereo alternates L/R).
 * Downmix: output channel c is the average of every input channel i with
 * i mod M == c (stereo to mono is (L + R) / 2).
 */
class ChannelAdapter : public Source {
public:
    static constexpr size_t CHUNK_FRAMES = 256;

    ChannelAdapter(SourcePtr inner, ChannelCount target_channels);

    StreamFormat format() const override { return format_; }

protected:
    size_t do_pull(std::span<Sample> output) override;
    std::optional<uint64_t> frames_left() const override;

private:
    void map_frame(const Sample* in, Sample* out) const;

    SourcePtr inner_;
    StreamFormat format_;
    size_t in_channels_;
    bool passthrough_;
    std::vector<Sample> scratch_;
    std::vector<float> downmix_scale_;  // 1 / contributors, per output channel
};

} // namespace pcmflow

#endif // PCMFLOW_CHANNEL_ADAPTER_HPP
