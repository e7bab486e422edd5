/**
 * @file NullDriver.hpp
 * @brief Driver without hardware, for tests and headless rendering.
 */

#ifndef PCMFLOW_NULL_DRIVER_HPP
#define PCMFLOW_NULL_DRIVER_HPP

#include "AudioDriver.hpp"
#include <atomic>
#include <thread>
#include <vector>

namespace pcmflow::hal {

/**
 * @brief Accepts whatever format it is given and renders on demand.
 *
 * render() runs the callback synchronously on the caller's thread. When
 * paced, start() spawns a thread that renders one block per period
 * duration and discards the result.
 */
class NullDriver : public AudioDriver {
public:
    NullDriver(const StreamFormat& format = StreamFormat{}, size_t block_size = 512, bool paced = false);
    ~NullDriver() override;

    bool open() override;
    bool start() override;
    void stop() override;
    void set_render_callback(RenderCallback callback) override { callback_ = std::move(callback); }
    StreamFormat format() const override { return format_; }
    size_t block_size() const override { return block_size_; }

    /**
     * @brief Render @p frames frames into @p output (silence without a callback).
     */
    void render(std::span<std::byte> output, size_t frames);

    uint64_t blocks_rendered() const { return blocks_rendered_.load(std::memory_order_acquire); }
    bool is_running() const { return running_.load(std::memory_order_acquire); }

private:
    void thread_loop();

    StreamFormat format_;
    size_t block_size_;
    bool paced_;
    bool open_ = false;
    RenderCallback callback_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> blocks_rendered_{0};
    std::thread processing_thread_;
};

} // namespace pcmflow::hal

#endif // PCMFLOW_NULL_DRIVER_HPP
