/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#ifndef PCMFLOW_ALSA_DRIVER_HPP
#define PCMFLOW_ALSA_DRIVER_HPP

#include "AudioDriver.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pcmflow::hal {

/**
 * @brief ALSA playback through interleaved read/write access.
 *
 * open() asks for the requested encoding and falls back to S32_LE, then
 * S16_LE. Rate, channel count and period size are negotiated with the
 * *_near calls, so format() may differ from what was requested.
 */
class AlsaDriver : public AudioDriver {
public:
    /**
     * @param requested Requested channels, rate and encoding.
     * @param block_size Requested period size (frames per interrupt).
     * @param device ALSA device name.
     */
    AlsaDriver(const StreamFormat& requested = StreamFormat{}, size_t block_size = 512,
               const std::string& device = "default");
    ~AlsaDriver() override;

    bool open() override;
    bool start() override;
    void stop() override;
    void set_render_callback(RenderCallback callback) override { callback_ = std::move(callback); }
    StreamFormat format() const override { return format_; }
    size_t block_size() const override { return block_size_; }

private:
    void thread_loop();
    bool setup_pcm();
    void recover_pcm(int err);
    void close_pcm();

    snd_pcm_t* pcm_handle_;
    std::string device_name_;
    StreamFormat format_;
    size_t block_size_;
    RenderCallback callback_;
    std::atomic<bool> running_;
    std::thread processing_thread_;
    std::vector<std::byte> interleaved_buffer_;
};

/**
 * @brief ALSA little-endian format for an encoding.
 */
snd_pcm_format_t to_alsa_format(SampleFormat format);

} // namespace pcmflow::hal

#endif // PCMFLOW_ALSA_DRIVER_HPP
