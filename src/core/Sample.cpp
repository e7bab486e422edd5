/**
 * @file Sample.cpp
 * @brief Runtime dispatch over SampleFormat for the sample model.
 */

#include "Sample.hpp"
#include <cctype>
#include <cfloat>
#include <cstring>
#include <string>

namespace pcmflow {

namespace {

template<typename T>
double load_normalized(const std::byte* input) {
    T value;
    std::memcpy(&value, input, sizeof(T));
    return SampleTraits<T>::to_normalized(value);
}

template<typename T>
void store_normalized(double value, std::byte* output) {
    const T native = SampleTraits<T>::from_normalized(value);
    std::memcpy(output, &native, sizeof(T));
}

template<typename T>
void store_silence(std::byte* output) {
    const T native = SampleTraits<T>::silence();
    std::memcpy(output, &native, sizeof(T));
}

double load(const std::byte* input, SampleFormat format) {
    switch (format) {
        case SampleFormat::U8:  return load_normalized<uint8_t>(input);
        case SampleFormat::I8:  return load_normalized<int8_t>(input);
        case SampleFormat::U16: return load_normalized<uint16_t>(input);
        case SampleFormat::I16: return load_normalized<int16_t>(input);
        case SampleFormat::I32: return load_normalized<int32_t>(input);
        case SampleFormat::U32: return load_normalized<uint32_t>(input);
        case SampleFormat::F32: return load_normalized<float>(input);
        case SampleFormat::F64: return load_normalized<double>(input);
    }
    return 0.0;
}

void store(double value, SampleFormat format, std::byte* output) {
    switch (format) {
        case SampleFormat::U8:  store_normalized<uint8_t>(value, output); break;
        case SampleFormat::I8:  store_normalized<int8_t>(value, output); break;
        case SampleFormat::U16: store_normalized<uint16_t>(value, output); break;
        case SampleFormat::I16: store_normalized<int16_t>(value, output); break;
        case SampleFormat::I32: store_normalized<int32_t>(value, output); break;
        case SampleFormat::U32: store_normalized<uint32_t>(value, output); break;
        case SampleFormat::F32: store_normalized<float>(value, output); break;
        case SampleFormat::F64: store_normalized<double>(value, output); break;
    }
}

} // namespace

size_t bytes_per_sample(SampleFormat format) {
    switch (format) {
        case SampleFormat::U8:
        case SampleFormat::I8:
            return 1;
        case SampleFormat::U16:
        case SampleFormat::I16:
            return 2;
        case SampleFormat::I32:
        case SampleFormat::U32:
        case SampleFormat::F32:
            return 4;
        case SampleFormat::F64:
            return 8;
    }
    return 0;
}

bool is_float(SampleFormat format) {
    return format == SampleFormat::F32 || format == SampleFormat::F64;
}

const char* to_string(SampleFormat format) {
    switch (format) {
        case SampleFormat::U8:  return "u8";
        case SampleFormat::I8:  return "i8";
        case SampleFormat::U16: return "u16";
        case SampleFormat::I16: return "i16";
        case SampleFormat::I32: return "i32";
        case SampleFormat::U32: return "u32";
        case SampleFormat::F32: return "f32";
        case SampleFormat::F64: return "f64";
    }
    return "unknown";
}

std::optional<SampleFormat> sample_format_from_string(std::string_view name) {
    std::string lower(name);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    static constexpr SampleFormat all[] = {
        SampleFormat::U8, SampleFormat::I8, SampleFormat::U16, SampleFormat::I16,
        SampleFormat::I32, SampleFormat::U32, SampleFormat::F32, SampleFormat::F64
    };
    for (SampleFormat format : all) {
        if (lower == to_string(format)) {
            return format;
        }
    }
    return std::nullopt;
}

double quantization_step(SampleFormat format) {
    switch (format) {
        case SampleFormat::F32: return static_cast<double>(FLT_EPSILON);
        case SampleFormat::F64: return DBL_EPSILON;
        default:
            // N-bit integers cover -1..1 in 2^N steps
            return 1.0 / std::ldexp(1.0, static_cast<int>(bytes_per_sample(format) * 8 - 1));
    }
}

void convert_sample(const std::byte* input, SampleFormat from, std::byte* output, SampleFormat to) {
    if (from == to) {
        std::memcpy(output, input, bytes_per_sample(from));
        return;
    }
    store(load(input, from), to, output);
}

Sample decode_sample(const std::byte* input, SampleFormat format) {
    return static_cast<Sample>(load(input, format));
}

void encode_sample(Sample sample, SampleFormat format, std::byte* output) {
    store(static_cast<double>(sample), format, output);
}

void encode_silence(SampleFormat format, std::byte* output) {
    switch (format) {
        case SampleFormat::U8:  store_silence<uint8_t>(output); break;
        case SampleFormat::I8:  store_silence<int8_t>(output); break;
        case SampleFormat::U16: store_silence<uint16_t>(output); break;
        case SampleFormat::I16: store_silence<int16_t>(output); break;
        case SampleFormat::I32: store_silence<int32_t>(output); break;
        case SampleFormat::U32: store_silence<uint32_t>(output); break;
        case SampleFormat::F32: store_silence<float>(output); break;
        case SampleFormat::F64: store_silence<double>(output); break;
    }
}

Sample quantize(Sample sample, SampleFormat format) {
    if (format == SampleFormat::F32) {
        return sample;
    }
    std::byte storage[8];
    encode_sample(sample, format, storage);
    return decode_sample(storage, format);
}

} // namespace pcmflow
