/**
 * @file main.cpp
 * @brief Demo: plays a short programme of test tones through the default device.
 *
 * Usage: pcmflow_demo [config.json]
 * Without an ALSA device the programme runs against a paced null driver.
 */

#include <iostream>
#include <chrono>
#include <thread>
#include "OutputStream.hpp"
#include "EngineConfig.hpp"
#include "NullDriver.hpp"
#include "Logger.hpp"
#include "SineWave.hpp"
#include "PrefetchSource.hpp"
#include "TakeDuration.hpp"
#include "FadeIn.hpp"
#include "FadeOut.hpp"
#include "Delay.hpp"

using namespace pcmflow;
using namespace std::chrono_literals;

static SourcePtr tone(double freq, SampleRate rate, std::chrono::nanoseconds length) {
    SourcePtr source = std::make_unique<SineWave>(freq, rate, 1, 0.4f);
    source = std::make_unique<TakeDuration>(std::move(source), length);
    source = std::make_unique<FadeIn>(std::move(source), 20ms);
    return source;
}

static std::unique_ptr<OutputStream> open_stream(const EngineConfig& config) {
    ErrorCode error = ErrorCode::Ok;
    auto stream = OutputStream::open_default(config, &error);
    if (stream) {
        return stream;
    }

    std::cerr << "Default device unavailable (" << to_string(error) << "), using null driver" << std::endl;
    auto driver = std::make_unique<hal::NullDriver>(config.device_stream_format(), config.block_size, true);
    return OutputStream::open(std::move(driver), config.mixer_config(), &error);
}

int main(int argc, char* argv[]) {
    EngineConfig config;
    if (argc > 1 && !ConfigStore::load_from_file(config, argv[1])) {
        return 1;
    }

    auto stream = open_stream(config);
    if (!stream) {
        std::cerr << "Could not open any output stream" << std::endl;
        return 1;
    }
    const SampleRate rate = stream->format().sample_rate;

    ErrorCode error = ErrorCode::Ok;
    auto sink = Sink::connect(stream->mixer(), config.sink_queue_capacity, &error);
    if (!sink) {
        std::cerr << "Could not create sink: " << to_string(error) << std::endl;
        return 1;
    }

    std::cout << "=== Gapless queue: C E G ===" << std::endl;
    for (double freq : {261.63, 329.63, 392.00}) {
        error = sink->append(tone(freq, rate, 400ms));
        if (error != ErrorCode::Ok) {
            std::cerr << "append failed: " << to_string(error) << std::endl;
        }
    }
    sink->sleep_until_end();

    std::cout << "=== Prefetched tone at double speed, half volume ===" << std::endl;
    auto prefetched = std::make_unique<PrefetchSource>(tone(440.0, rate, 1s), config.prefetch_capacity_frames);
    if (!prefetched->wait_for_prefill(200ms)) {
        std::cerr << "prefetch did not fill in time" << std::endl;
    }
    if (sink->set_speed(2.0f) != ErrorCode::Ok || sink->set_volume(0.5f) != ErrorCode::Ok) {
        std::cerr << "transport update rejected" << std::endl;
    }
    error = sink->append(std::move(prefetched));
    if (error != ErrorCode::Ok) {
        std::cerr << "append failed: " << to_string(error) << std::endl;
    }
    sink->sleep_until_end();
    if (sink->set_speed(1.0f) != ErrorCode::Ok || sink->set_volume(1.0f) != ErrorCode::Ok) {
        std::cerr << "transport update rejected" << std::endl;
    }

    std::cout << "=== Overlapping sinks ===" << std::endl;
    SourcePtr late = std::make_unique<Delay>(tone(659.25, rate, 600ms), 300ms);
    auto second = play(*stream, std::make_unique<FadeOut>(std::move(late), 900ms), &error);
    if (!second) {
        std::cerr << "play failed: " << to_string(error) << std::endl;
    }
    error = sink->append(tone(523.25, rate, 900ms));
    if (error != ErrorCode::Ok) {
        std::cerr << "append failed: " << to_string(error) << std::endl;
    }
    sink->sleep_until_end();
    if (second && !second->sleep_until_end(2s)) {
        std::cerr << "overlapping tone still playing" << std::endl;
    }

    std::cout << "Underrun frames: " << stream->bridge().underrun_frames() << std::endl;
    std::cout << "Telemetry:" << std::endl;
    AudioLogger::instance().flush(std::cout);
    return 0;
}
