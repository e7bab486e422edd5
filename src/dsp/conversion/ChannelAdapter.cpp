/**
 * @file ChannelAdapter.cpp
 * @brief Channel up/down-mixing rules.
 */

#include "ChannelAdapter.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcmflow {

ChannelAdapter::ChannelAdapter(SourcePtr inner, ChannelCount target_channels)
    : inner_(std::move(inner))
{
    if (!inner_) {
        throw std::invalid_argument("ChannelAdapter: inner source is null");
    }
    if (target_channels == 0) {
        throw std::invalid_argument("ChannelAdapter: target channel count must be non-zero");
    }

    format_ = inner_->format();
    in_channels_ = format_.channels;
    passthrough_ = in_channels_ == target_channels;
    format_.channels = target_channels;

    if (!passthrough_) {
        scratch_.assign(CHUNK_FRAMES * in_channels_, 0.0f);
        downmix_scale_.assign(target_channels, 0.0f);
        for (size_t i = 0; i < in_channels_; ++i) {
            downmix_scale_[i % target_channels] += 1.0f;
        }
        for (auto& scale : downmix_scale_) {
            scale = scale > 0.0f ? 1.0f / scale : 0.0f;
        }
    }
}

void ChannelAdapter::map_frame(const Sample* in, Sample* out) const {
    const size_t out_channels = format_.channels;

    if (out_channels > in_channels_) {
        for (size_t c = 0; c < out_channels; ++c) {
            out[c] = in[c % in_channels_];
        }
        return;
    }

    std::fill_n(out, out_channels, 0.0f);
    for (size_t i = 0; i < in_channels_; ++i) {
        out[i % out_channels] += in[i];
    }
    for (size_t c = 0; c < out_channels; ++c) {
        out[c] *= downmix_scale_[c];
    }
}

size_t ChannelAdapter::do_pull(std::span<Sample> output) {
    if (passthrough_) {
        return inner_->pull(output);
    }

    const size_t out_channels = format_.channels;
    const size_t frames = output.size() / out_channels;
    size_t done = 0;

    while (done < frames) {
        const size_t wanted = std::min(CHUNK_FRAMES, frames - done);
        const size_t got = inner_->pull(std::span<Sample>(scratch_.data(), wanted * in_channels_));

        for (size_t f = 0; f < got; ++f) {
            map_frame(scratch_.data() + f * in_channels_, output.data() + (done + f) * out_channels);
        }
        done += got;

        if (got < wanted) {
            break;
        }
    }
    return done;
}

std::optional<uint64_t> ChannelAdapter::frames_left() const {
    return inner_->remaining_frames();
}

} // namespace pcmflow
