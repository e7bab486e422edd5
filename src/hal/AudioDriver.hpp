/**
 * @file AudioDriver.hpp
 * @brief Abstract base class for audio output drivers.
 *
 * Hardware/OS audio code stays behind this interface, strictly separated
 * from the mixing pipeline.
 */

#ifndef PCMFLOW_AUDIO_DRIVER_HPP
#define PCMFLOW_AUDIO_DRIVER_HPP

#include "StreamFormat.hpp"
#include <cstddef>
#include <functional>
#include <span>

namespace pcmflow::hal {

/**
 * @brief Output device that periodically asks for one period of interleaved frames.
 */
class AudioDriver {
public:
    /**
     * @brief Fill @p output with @p frames frames in the negotiated format().
     */
    using RenderCallback = std::function<void(std::span<std::byte> output, size_t frames)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Open the device and negotiate the stream format.
     *
     * @return true if the device is ready; format() and block_size() are valid afterwards.
     */
    virtual bool open() = 0;

    /**
     * @brief Start the period thread. Opens the device first if needed.
     */
    virtual bool start() = 0;

    virtual void stop() = 0;

    /**
     * @brief Install the period callback. Call before start().
     */
    virtual void set_render_callback(RenderCallback callback) = 0;

    /**
     * @brief Negotiated format (the requested one before open()).
     */
    virtual StreamFormat format() const = 0;

    /**
     * @brief Frames per period.
     */
    virtual size_t block_size() const = 0;
};

} // namespace pcmflow::hal

#endif // PCMFLOW_AUDIO_DRIVER_HPP
