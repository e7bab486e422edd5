/**
 * @file AudioBridge.cpp
 * @brief C-compatible API bridge for output streams and sinks.
 */

#include "CInterface.h"
#include "OutputStream.hpp"
#include "EngineConfig.hpp"
#include "NullDriver.hpp"
#include "RawBufferSource.hpp"
#include "SineWave.hpp"
#include "TakeDuration.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <vector>

// Handle type discrimination for tag-based safety
enum class HandleType {
    Stream,
    Sink
};

struct HandleBase {
    HandleType type;
    explicit HandleBase(HandleType t) : type(t) {}
    virtual ~HandleBase() = default;
};

// Internal handle structures (hidden from C API)
struct StreamHandleImpl : public HandleBase {
    std::unique_ptr<pcmflow::OutputStream> stream;
    size_t sink_queue_capacity;

    StreamHandleImpl(std::unique_ptr<pcmflow::OutputStream> s, size_t queue_capacity)
        : HandleBase(HandleType::Stream)
        , stream(std::move(s))
        , sink_queue_capacity(queue_capacity)
    {
    }
};

struct SinkHandleImpl : public HandleBase {
    std::unique_ptr<pcmflow::Sink> sink;

    explicit SinkHandleImpl(std::unique_ptr<pcmflow::Sink> s)
        : HandleBase(HandleType::Sink)
        , sink(std::move(s))
    {
    }
};

namespace {

int to_c_error(pcmflow::ErrorCode code) {
    switch (code) {
        case pcmflow::ErrorCode::Ok:               return PCM_OK;
        case pcmflow::ErrorCode::InvalidParameter: return PCM_ERR_INVALID;
        case pcmflow::ErrorCode::FormatMismatch:   return PCM_ERR_FORMAT;
        case pcmflow::ErrorCode::MixerFull:        return PCM_ERR_MIXER_FULL;
        case pcmflow::ErrorCode::QueueFull:        return PCM_ERR_QUEUE_FULL;
        case pcmflow::ErrorCode::NoDevice:         return PCM_ERR_NO_DEVICE;
        case pcmflow::ErrorCode::DeviceError:      return PCM_ERR_DEVICE;
        case pcmflow::ErrorCode::NotFound:         return PCM_ERR_NOT_FOUND;
    }
    return PCM_ERR_INVALID;
}

bool to_sample_format(int value, pcmflow::SampleFormat& out) {
    switch (value) {
        case PCM_FORMAT_U8:  out = pcmflow::SampleFormat::U8;  return true;
        case PCM_FORMAT_I8:  out = pcmflow::SampleFormat::I8;  return true;
        case PCM_FORMAT_U16: out = pcmflow::SampleFormat::U16; return true;
        case PCM_FORMAT_I16: out = pcmflow::SampleFormat::I16; return true;
        case PCM_FORMAT_I32: out = pcmflow::SampleFormat::I32; return true;
        case PCM_FORMAT_U32: out = pcmflow::SampleFormat::U32; return true;
        case PCM_FORMAT_F32: out = pcmflow::SampleFormat::F32; return true;
        case PCM_FORMAT_F64: out = pcmflow::SampleFormat::F64; return true;
        default: return false;
    }
}

StreamHandleImpl* as_stream(void* handle) {
    if (!handle) return nullptr;
    auto* base = static_cast<HandleBase*>(handle);
    if (base->type != HandleType::Stream) return nullptr;
    return static_cast<StreamHandleImpl*>(base);
}

SinkHandleImpl* as_sink(void* handle) {
    if (!handle) return nullptr;
    auto* base = static_cast<HandleBase*>(handle);
    if (base->type != HandleType::Sink) return nullptr;
    auto* impl = static_cast<SinkHandleImpl*>(base);
    return impl->sink ? impl : nullptr;
}

int append(SinkHandleImpl* impl, pcmflow::SourcePtr source) {
    return to_c_error(impl->sink->append(std::move(source)));
}

} // namespace

extern "C" {

PcmStreamHandle pcm_stream_open_null(unsigned int channels, unsigned int sample_rate,
                                     int sample_format, size_t block_size) {
    pcmflow::SampleFormat encoding;
    if (!to_sample_format(sample_format, encoding)) return nullptr;

    try {
        const pcmflow::StreamFormat format{static_cast<pcmflow::ChannelCount>(channels), sample_rate, encoding};
        auto driver = std::make_unique<pcmflow::hal::NullDriver>(format, block_size, false);

        pcmflow::ErrorCode error = pcmflow::ErrorCode::Ok;
        auto stream = pcmflow::OutputStream::open(std::move(driver), pcmflow::MixerConfig{}, &error);
        if (!stream) {
            std::cerr << "[Bridge] Null stream open failed: " << pcmflow::to_string(error) << std::endl;
            return nullptr;
        }
        return static_cast<PcmStreamHandle>(new StreamHandleImpl(std::move(stream), pcmflow::EngineConfig{}.sink_queue_capacity));
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] " << e.what() << std::endl;
        return nullptr;
    }
}

PcmStreamHandle pcm_stream_open_default(const char* config_path) {
    try {
        pcmflow::EngineConfig config;
        if (config_path && !pcmflow::ConfigStore::load_from_file(config, config_path)) {
            return nullptr;
        }

        pcmflow::ErrorCode error = pcmflow::ErrorCode::Ok;
        auto stream = pcmflow::OutputStream::open_default(config, &error);
        if (!stream) {
            std::cerr << "[Bridge] Default stream open failed: " << pcmflow::to_string(error) << std::endl;
            return nullptr;
        }
        return static_cast<PcmStreamHandle>(new StreamHandleImpl(std::move(stream), config.sink_queue_capacity));
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] " << e.what() << std::endl;
        return nullptr;
    }
}

void pcm_stream_destroy(PcmStreamHandle handle) {
    if (auto* impl = as_stream(handle)) {
        delete impl;
    }
}

int pcm_stream_render(PcmStreamHandle handle, void* output, size_t output_bytes, size_t frames) {
    auto* impl = as_stream(handle);
    if (!impl || !output) return PCM_ERR_INVALID;

    auto* driver = dynamic_cast<pcmflow::hal::NullDriver*>(&impl->stream->driver());
    if (!driver) return PCM_ERR_DEVICE;

    const size_t frame_bytes = driver->format().bytes_per_frame();
    frames = std::min(frames, output_bytes / frame_bytes);
    driver->render(std::span<std::byte>(static_cast<std::byte*>(output), output_bytes), frames);
    return static_cast<int>(frames);
}

PcmSinkHandle pcm_sink_create(PcmStreamHandle stream) {
    auto* impl = as_stream(stream);
    if (!impl) return nullptr;

    try {
        pcmflow::ErrorCode error = pcmflow::ErrorCode::Ok;
        auto sink = pcmflow::Sink::connect(impl->stream->mixer(), impl->sink_queue_capacity, &error);
        if (!sink) {
            std::cerr << "[Bridge] Sink creation failed: " << pcmflow::to_string(error) << std::endl;
            return nullptr;
        }
        return static_cast<PcmSinkHandle>(new SinkHandleImpl(std::move(sink)));
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] " << e.what() << std::endl;
        return nullptr;
    }
}

void pcm_sink_destroy(PcmSinkHandle handle) {
    if (auto* impl = as_sink(handle)) {
        delete impl;
    }
}

int pcm_sink_append_pcm(PcmSinkHandle handle, const void* data, size_t bytes,
                        unsigned int channels, unsigned int sample_rate, int sample_format) {
    auto* impl = as_sink(handle);
    if (!impl || !data || bytes == 0) return PCM_ERR_INVALID;

    pcmflow::SampleFormat encoding;
    if (!to_sample_format(sample_format, encoding)) return PCM_ERR_INVALID;

    try {
        std::vector<std::byte> copy(bytes);
        std::memcpy(copy.data(), data, bytes);

        const pcmflow::StreamFormat format{static_cast<pcmflow::ChannelCount>(channels), sample_rate, encoding};
        return append(impl, std::make_unique<pcmflow::RawBufferSource>(format, std::move(copy)));
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] " << e.what() << std::endl;
        return PCM_ERR_INVALID;
    }
}

int pcm_sink_append_sine(PcmSinkHandle handle, double frequency, double duration_seconds, float amplitude) {
    auto* impl = as_sink(handle);
    if (!impl || duration_seconds <= 0.0) return PCM_ERR_INVALID;

    try {
        const pcmflow::StreamFormat mix = impl->sink->format();
        pcmflow::SourcePtr tone = std::make_unique<pcmflow::SineWave>(frequency, mix.sample_rate, mix.channels, amplitude);
        const auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::duration<double>(duration_seconds));
        return append(impl, std::make_unique<pcmflow::TakeDuration>(std::move(tone), duration));
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] " << e.what() << std::endl;
        return PCM_ERR_INVALID;
    }
}

int pcm_sink_skip(PcmSinkHandle handle) {
    auto* impl = as_sink(handle);
    if (!impl) return PCM_ERR_INVALID;
    return to_c_error(impl->sink->skip());
}

int pcm_sink_stop(PcmSinkHandle handle) {
    auto* impl = as_sink(handle);
    if (!impl) return PCM_ERR_INVALID;
    return to_c_error(impl->sink->stop());
}

int pcm_sink_pause(PcmSinkHandle handle) {
    auto* impl = as_sink(handle);
    if (!impl) return PCM_ERR_INVALID;
    impl->sink->pause();
    return PCM_OK;
}

int pcm_sink_resume(PcmSinkHandle handle) {
    auto* impl = as_sink(handle);
    if (!impl) return PCM_ERR_INVALID;
    impl->sink->resume();
    return PCM_OK;
}

int pcm_sink_set_volume(PcmSinkHandle handle, float volume) {
    auto* impl = as_sink(handle);
    if (!impl) return PCM_ERR_INVALID;
    return to_c_error(impl->sink->set_volume(volume));
}

int pcm_sink_set_speed(PcmSinkHandle handle, float speed) {
    auto* impl = as_sink(handle);
    if (!impl) return PCM_ERR_INVALID;
    return to_c_error(impl->sink->set_speed(speed));
}

int pcm_sink_is_playing(PcmSinkHandle handle) {
    auto* impl = as_sink(handle);
    if (!impl) return PCM_ERR_INVALID;
    return impl->sink->is_playing() ? 1 : 0;
}

int pcm_sink_len(PcmSinkHandle handle) {
    auto* impl = as_sink(handle);
    if (!impl) return PCM_ERR_INVALID;
    return static_cast<int>(impl->sink->len());
}

int pcm_sink_get_position(PcmSinkHandle handle, double* seconds) {
    auto* impl = as_sink(handle);
    if (!impl || !seconds) return PCM_ERR_INVALID;
    *seconds = impl->sink->position().count();
    return PCM_OK;
}

} // extern "C"
