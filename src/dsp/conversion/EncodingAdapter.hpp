/**
 * @file EncodingAdapter.hpp
 * @brief Re-declares a source in another sample encoding.
 */

#ifndef PCMFLOW_ENCODING_ADAPTER_HPP
#define PCMFLOW_ENCODING_ADAPTER_HPP

#include "Source.hpp"
#include <stdexcept>

namespace pcmflow {

/**
 * @brief Stateless per-sample conversion through the sample model.
 *
 * Every sample is snapped to the grid of @p target, so downstream consumers
 * see exactly the values the target encoding can represent.
 */
class EncodingAdapter : public Source {
public:
    EncodingAdapter(SourcePtr inner, SampleFormat target)
        : inner_(std::move(inner))
    {
        if (!inner_) {
            throw std::invalid_argument("EncodingAdapter: inner source is null");
        }
        format_ = inner_->format();
        passthrough_ = format_.encoding == target;
        format_.encoding = target;
    }

    StreamFormat format() const override { return format_; }

protected:
    size_t do_pull(std::span<Sample> output) override {
        const size_t frames = inner_->pull(output);
        if (!passthrough_) {
            const size_t count = frames * format_.channels;
            for (size_t i = 0; i < count; ++i) {
                output[i] = quantize(output[i], format_.encoding);
            }
        }
        return frames;
    }

    std::optional<uint64_t> frames_left() const override {
        return inner_->remaining_frames();
    }

private:
    SourcePtr inner_;
    StreamFormat format_;
    bool passthrough_ = true;
};

} // namespace pcmflow

#endif // PCMFLOW_ENCODING_ADAPTER_HPP
