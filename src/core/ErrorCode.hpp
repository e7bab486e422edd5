/**
 * @file ErrorCode.hpp
 * @brief Error codes returned to the control side at registration time.
 */

#ifndef PCMFLOW_ERROR_CODE_HPP
#define PCMFLOW_ERROR_CODE_HPP

namespace pcmflow {

enum class ErrorCode {
    Ok = 0,
    InvalidParameter,
    FormatMismatch,
    MixerFull,
    QueueFull,
    NoDevice,
    DeviceError,
    NotFound
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:               return "Ok";
        case ErrorCode::InvalidParameter: return "InvalidParameter";
        case ErrorCode::FormatMismatch:   return "FormatMismatch";
        case ErrorCode::MixerFull:        return "MixerFull";
        case ErrorCode::QueueFull:        return "QueueFull";
        case ErrorCode::NoDevice:         return "NoDevice";
        case ErrorCode::DeviceError:      return "DeviceError";
        case ErrorCode::NotFound:         return "NotFound";
    }
    return "Unknown";
}

} // namespace pcmflow

#endif // PCMFLOW_ERROR_CODE_HPP
