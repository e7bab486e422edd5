#include "OutputStream.hpp"
#include "AlsaDriver.hpp"
#include <iostream>

namespace pcmflow {

OutputStream::~OutputStream() {
    if (driver_) {
        driver_->stop();
    }
}

std::unique_ptr<OutputStream> OutputStream::open(std::unique_ptr<hal::AudioDriver> driver,
                                                 const MixerConfig& config, ErrorCode* error) {
    auto report = [error](ErrorCode code) {
        if (error) {
            *error = code;
        }
    };

    if (!driver) {
        report(ErrorCode::InvalidParameter);
        return nullptr;
    }
    if (!driver->open()) {
        std::cerr << "[OutputStream] Cannot open output device" << std::endl;
        report(ErrorCode::NoDevice);
        return nullptr;
    }

    const StreamFormat device = driver->format();
    const StreamFormat mix_format{device.channels, device.sample_rate, SampleFormat::F32};

    std::unique_ptr<OutputStream> stream(new OutputStream());
    try {
        auto [controller, mixer] = make_mixer(mix_format, config);
        stream->mixer_ = std::move(controller);
        stream->bridge_ = std::make_unique<OutputBridge>(std::move(mixer), device, config.max_block_frames);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[OutputStream] " << e.what() << std::endl;
        report(ErrorCode::InvalidParameter);
        return nullptr;
    }

    OutputBridge* bridge = stream->bridge_.get();
    driver->set_render_callback([bridge](std::span<std::byte> output, size_t frames) {
        bridge->render(output, frames);
    });

    stream->driver_ = std::move(driver);
    if (!stream->driver_->start()) {
        std::cerr << "[OutputStream] Cannot start output device" << std::endl;
        report(ErrorCode::DeviceError);
        return nullptr;
    }

    std::cout << "[OutputStream] Running at " << device << ", block " << stream->driver_->block_size()
              << " frames" << std::endl;
    report(ErrorCode::Ok);
    return stream;
}

std::unique_ptr<OutputStream> OutputStream::open_default(const EngineConfig& config, ErrorCode* error) {
    const ErrorCode valid = config.validate();
    if (valid != ErrorCode::Ok) {
        if (error) {
            *error = valid;
        }
        return nullptr;
    }

    auto driver = std::make_unique<hal::AlsaDriver>(config.device_stream_format(), config.block_size, config.device);
    return open(std::move(driver), config.mixer_config(), error);
}

std::unique_ptr<Sink> play(OutputStream& stream, SourcePtr&& source, ErrorCode* error) {
    auto sink = Sink::connect(stream.mixer(), 64, error);
    if (!sink) {
        return nullptr;
    }

    const ErrorCode result = sink->append(std::move(source));
    if (error) {
        *error = result;
    }
    if (result != ErrorCode::Ok) {
        return nullptr;
    }
    return sink;
}

} // namespace pcmflow
