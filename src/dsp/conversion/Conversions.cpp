/**
 * @file Conversions.cpp
 * @brief Adapter stacking for convert_to().
 */

#include "Conversions.hpp"
#include "ChannelAdapter.hpp"
#include "EncodingAdapter.hpp"
#include "RateAdapter.hpp"
#include <stdexcept>

namespace pcmflow {

SourcePtr convert_to(SourcePtr source, const StreamFormat& target) {
    if (!source) {
        throw std::invalid_argument("convert_to: source is null");
    }
    if (!target.is_valid()) {
        throw std::invalid_argument("convert_to: target format is invalid");
    }

    const StreamFormat current = source->format();
    if (current == target) {
        return source;
    }

    const bool downmix = target.channels < current.channels;

    if (downmix) {
        source = std::make_unique<ChannelAdapter>(std::move(source), target.channels);
    }
    if (current.sample_rate != target.sample_rate) {
        source = std::make_unique<RateAdapter>(std::move(source), target.sample_rate);
    }
    if (!downmix && current.channels != target.channels) {
        source = std::make_unique<ChannelAdapter>(std::move(source), target.channels);
    }
    if (current.encoding != target.encoding) {
        source = std::make_unique<EncodingAdapter>(std::move(source), target.encoding);
    }
    return source;
}

} // namespace pcmflow
