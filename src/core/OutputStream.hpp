/**
 * @file OutputStream.hpp
 * @brief An opened output device with a running mixer behind it.
 */

#ifndef PCMFLOW_OUTPUT_STREAM_HPP
#define PCMFLOW_OUTPUT_STREAM_HPP

#include "AudioDriver.hpp"
#include "EngineConfig.hpp"
#include "Mixer.hpp"
#include "OutputBridge.hpp"
#include "Sink.hpp"
#include <memory>

namespace pcmflow {

/**
 * @brief Owns the driver, the output bridge and the mixer it pulls from.
 *
 * The mixer runs at the device channel count and sample rate with F32
 * samples; the bridge encodes to the device encoding. Destroying the
 * stream stops the driver before anything it calls into is released.
 */
class OutputStream {
public:
    ~OutputStream();

    OutputStream(const OutputStream&) = delete;
    OutputStream& operator=(const OutputStream&) = delete;

    /**
     * @brief Open @p driver, build the mixer for its negotiated format and start it.
     *
     * @param error Receives NoDevice if the device cannot be opened,
     *              DeviceError if it cannot be started (may be null).
     */
    static std::unique_ptr<OutputStream> open(std::unique_ptr<hal::AudioDriver> driver,
                                              const MixerConfig& config = {},
                                              ErrorCode* error = nullptr);

    /**
     * @brief Open the ALSA device named in @p config.
     */
    static std::unique_ptr<OutputStream> open_default(const EngineConfig& config = {},
                                                      ErrorCode* error = nullptr);

    std::shared_ptr<MixerController> mixer() const { return mixer_; }

    /**
     * @brief Negotiated device format.
     */
    StreamFormat format() const { return driver_->format(); }

    hal::AudioDriver& driver() { return *driver_; }
    const OutputBridge& bridge() const { return *bridge_; }

private:
    OutputStream() = default;

    std::shared_ptr<MixerController> mixer_;
    std::unique_ptr<OutputBridge> bridge_;
    std::unique_ptr<hal::AudioDriver> driver_;
};

/**
 * @brief Open a sink on @p stream and append @p source to it.
 *
 * @return The playing sink, or null with @p error set. On failure the caller
 *         keeps @p source.
 */
std::unique_ptr<Sink> play(OutputStream& stream, SourcePtr&& source, ErrorCode* error = nullptr);

} // namespace pcmflow

#endif // PCMFLOW_OUTPUT_STREAM_HPP
