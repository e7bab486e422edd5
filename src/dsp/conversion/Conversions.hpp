/**
 * @file Conversions.hpp
 * @brief Normalizes any source to a target stream format.
 */

#ifndef PCMFLOW_CONVERSIONS_HPP
#define PCMFLOW_CONVERSIONS_HPP

#include "Source.hpp"

namespace pcmflow {

/**
 * @brief Wrap @p source in the channel, rate and encoding adapters needed to reach @p target.
 *
 * Returns @p source itself when it already matches. Downmixing happens
 * before resampling and upmixing after, so the resampler always runs on
 * the smaller channel count.
 *
 * @throws std::invalid_argument if @p source is null or @p target is invalid.
 */
SourcePtr convert_to(SourcePtr source, const StreamFormat& target);

} // namespace pcmflow

#endif // PCMFLOW_CONVERSIONS_HPP
