/**
 * @file Sample.hpp
 * @brief Sample encodings and the conversion rules between them.
 *
 * The pipeline carries every encoding as a normalized float in -1.0..1.0.
 * Integer encodings map onto that range symmetrically around zero; unsigned
 * encodings are offset by their midpoint first.
 */

#ifndef PCMFLOW_SAMPLE_HPP
#define PCMFLOW_SAMPLE_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace pcmflow {

/**
 * @brief Value of a single sample in the internal pipeline.
 *
 * Silence is 0.0; the expected amplitude range is -1.0..1.0. Values outside
 * that range are clipped when converted to another encoding.
 */
using Sample = float;

using ChannelCount = uint16_t;
using SampleRate = uint32_t;

/**
 * @brief Closed set of PCM sample encodings.
 */
enum class SampleFormat {
    U8,
    I8,
    U16,
    I16,
    I32,
    U32,
    F32,
    F64
};

size_t bytes_per_sample(SampleFormat format);
bool is_float(SampleFormat format);
const char* to_string(SampleFormat format);
std::optional<SampleFormat> sample_format_from_string(std::string_view name);

/**
 * @brief Distance between two adjacent representable values, in normalized units.
 */
double quantization_step(SampleFormat format);

/**
 * @brief Per-type mapping between a native PCM type and the normalized range.
 */
template<typename T>
struct SampleTraits;

namespace detail {

template<typename T>
struct SignedTraits {
    static constexpr double scale = static_cast<double>(std::numeric_limits<T>::max()) + 1.0;

    static double to_normalized(T value) {
        return static_cast<double>(value) / scale;
    }

    static T from_normalized(double value) {
        if (std::isnan(value)) return T{0};
        const double scaled = std::round(std::clamp(value, -1.0, 1.0) * scale);
        const double clipped = std::clamp(scaled,
                                          static_cast<double>(std::numeric_limits<T>::min()),
                                          static_cast<double>(std::numeric_limits<T>::max()));
        return static_cast<T>(clipped);
    }

    static constexpr T silence() { return T{0}; }
};

template<typename T>
struct UnsignedTraits {
    static constexpr double midpoint = static_cast<double>(std::numeric_limits<T>::max() / 2) + 1.0;

    static double to_normalized(T value) {
        return (static_cast<double>(value) - midpoint) / midpoint;
    }

    static T from_normalized(double value) {
        if (std::isnan(value)) return silence();
        const double scaled = std::round(std::clamp(value, -1.0, 1.0) * midpoint + midpoint);
        const double clipped = std::clamp(scaled, 0.0, static_cast<double>(std::numeric_limits<T>::max()));
        return static_cast<T>(clipped);
    }

    static constexpr T silence() { return static_cast<T>(std::numeric_limits<T>::max() / 2 + 1); }
};

} // namespace detail

template<> struct SampleTraits<int8_t> : detail::SignedTraits<int8_t> {
    static constexpr SampleFormat format = SampleFormat::I8;
};
template<> struct SampleTraits<int16_t> : detail::SignedTraits<int16_t> {
    static constexpr SampleFormat format = SampleFormat::I16;
};
template<> struct SampleTraits<int32_t> : detail::SignedTraits<int32_t> {
    static constexpr SampleFormat format = SampleFormat::I32;
};
template<> struct SampleTraits<uint8_t> : detail::UnsignedTraits<uint8_t> {
    static constexpr SampleFormat format = SampleFormat::U8;
};
template<> struct SampleTraits<uint16_t> : detail::UnsignedTraits<uint16_t> {
    static constexpr SampleFormat format = SampleFormat::U16;
};
template<> struct SampleTraits<uint32_t> : detail::UnsignedTraits<uint32_t> {
    static constexpr SampleFormat format = SampleFormat::U32;
};

template<> struct SampleTraits<float> {
    static constexpr SampleFormat format = SampleFormat::F32;
    static double to_normalized(float value) { return static_cast<double>(value); }
    static float from_normalized(double value) { return static_cast<float>(value); }
    static constexpr float silence() { return 0.0f; }
};

template<> struct SampleTraits<double> {
    static constexpr SampleFormat format = SampleFormat::F64;
    static double to_normalized(double value) { return value; }
    static double from_normalized(double value) { return value; }
    static constexpr double silence() { return 0.0; }
};

/**
 * @brief Convert one sample between two native types through the float intermediate.
 */
template<typename To, typename From>
To sample_cast(From value) {
    return SampleTraits<To>::from_normalized(SampleTraits<From>::to_normalized(value));
}

/**
 * @brief Convert one sample stored in @p input (encoded as @p from) into @p output (encoded as @p to).
 *
 * Both pointers address host-endian storage of at least bytes_per_sample() bytes.
 */
void convert_sample(const std::byte* input, SampleFormat from, std::byte* output, SampleFormat to);

/**
 * @brief Decode one stored sample into the pipeline representation.
 */
Sample decode_sample(const std::byte* input, SampleFormat format);

/**
 * @brief Encode one pipeline sample into storage of the given encoding.
 */
void encode_sample(Sample sample, SampleFormat format, std::byte* output);

/**
 * @brief Write the encoding's silence value (zero or midpoint).
 */
void encode_silence(SampleFormat format, std::byte* output);

/**
 * @brief Snap a pipeline sample onto the grid of representable values of @p format.
 */
Sample quantize(Sample sample, SampleFormat format);

/**
 * @brief Saturating sum of two samples.
 */
inline Sample mix_samples(Sample a, Sample b) {
    return std::clamp(a + b, -1.0f, 1.0f);
}

} // namespace pcmflow

#endif // PCMFLOW_SAMPLE_HPP
