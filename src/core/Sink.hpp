/**
 * @file Sink.hpp
 * @brief Control-side playback handle: a queue of sources plus transport controls.
 */

#ifndef PCMFLOW_SINK_HPP
#define PCMFLOW_SINK_HPP

#include "Mixer.hpp"
#include "SourcesQueue.hpp"
#include "Parameter.hpp"
#include <chrono>
#include <memory>
#include <mutex>

namespace pcmflow {

/**
 * @brief Plays sources one after another through a single mixer slot.
 *
 * The slot holds Amplify(Pausable(SourcesQueue)), and every appended source
 * is wrapped in its own Speed stage before it is queued. Volume, speed and
 * pause are atomic parameters read on every tick; queue operations travel
 * through the queue's command channel.
 *
 * Dropping a Sink stops its playback unless detach() was called.
 */
class Sink {
public:
    ~Sink();

    Sink(const Sink&) = delete;
    Sink& operator=(const Sink&) = delete;

    /**
     * @brief Create a sink and install its slot in @p mixer.
     *
     * @param error Receives the registration result (may be null).
     * @return The sink, or null when the slot could not be registered.
     */
    static std::unique_ptr<Sink> connect(std::shared_ptr<MixerController> mixer,
                                         size_t queue_capacity = 64,
                                         ErrorCode* error = nullptr);

    /**
     * @brief Convert @p source to the mixer format and enqueue it.
     *
     * Plays immediately when the sink is idle. After stop() the slot is
     * installed again. The source is moved from only on ErrorCode::Ok.
     */
    ErrorCode append(SourcePtr&& source);

    /**
     * @brief As append(), and on success @p finished receives a flag that
     * turns true once this source has played out or been dropped.
     */
    ErrorCode append_with_signal(SourcePtr&& source, FlagParameter* finished);

    ErrorCode skip();

    /**
     * @brief Clear the queue and remove the mixer slot.
     */
    ErrorCode stop();

    /**
     * @brief Drop the current and pending sources but keep the slot.
     */
    ErrorCode clear();

    void pause();
    void resume();
    bool is_paused() const { return paused_.load(); }

    ErrorCode set_volume(float volume);
    float volume() const { return volume_.load(); }

    /**
     * @brief Playback speed factor. Rejects non-positive and non-finite values.
     */
    ErrorCode set_speed(float speed);
    float speed() const { return speed_.load(); }

    /**
     * @brief Mixer format every appended source is converted to.
     */
    StreamFormat format() const { return mixer_->format(); }

    bool is_playing() const;
    bool empty() const { return len() == 0; }
    size_t len() const;

    /**
     * @brief Position inside the current source, in source time.
     */
    std::chrono::duration<double> position() const;

    /**
     * @brief Block until the queue runs dry.
     *
     * @return false if @p timeout elapsed first.
     */
    bool sleep_until_end(std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

    /**
     * @brief Keep playing after this handle is destroyed.
     */
    void detach() { detached_ = true; }

    /**
     * @brief Number of sources that finished on their own since the previous call.
     */
    uint64_t poll_finished();

private:
    Sink(std::shared_ptr<MixerController> mixer, size_t queue_capacity);

    ErrorCode install();
    ErrorCode enqueue(SourcePtr&& source, FlagParameter* finished);
    void collect_garbage();

    std::shared_ptr<MixerController> mixer_;
    std::shared_ptr<SourcesQueueInput> input_;
    SlotHandle slot_;
    const size_t queue_capacity_;

    FloatParameter volume_{1.0f};
    FloatParameter speed_{1.0f};
    FlagParameter paused_{false};
    CounterParameter position_{0};

    bool detached_ = false;
    mutable std::mutex mutex_;
};

} // namespace pcmflow

#endif // PCMFLOW_SINK_HPP
