/**
 * @file SourcesQueue.hpp
 * @brief Gapless FIFO of sources played back-to-back from one mixer slot.
 */

#ifndef PCMFLOW_SOURCES_QUEUE_HPP
#define PCMFLOW_SOURCES_QUEUE_HPP

#include "Source.hpp"
#include "ErrorCode.hpp"
#include "Parameter.hpp"
#include "SpscQueue.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace pcmflow {

namespace detail {

/**
 * @brief A queued source and the flag raised when the queue lets go of it.
 */
struct Track {
    SourcePtr source;
    std::optional<FlagParameter> done;
};

struct QueueCommand {
    enum class Type { Append, Skip, Clear };

    Type type = Type::Append;
    Track track;
};

struct QueueShared {
    QueueShared(const StreamFormat& fmt, size_t cap, bool keep_alive, CounterParameter pos);

    const StreamFormat format;
    const size_t capacity;
    FlagParameter keep_alive_if_empty;

    SpscQueue<QueueCommand> commands;
    SpscQueue<Track> garbage;

    std::atomic<size_t> sound_count{0};     // current + pending
    std::atomic<size_t> outstanding{0};     // appended and not yet collected, never above capacity
    std::atomic<uint64_t> tracks_finished{0};
    CounterParameter position;              // frames of the current track, reset on promotion
};

} // namespace detail

/**
 * @brief Audio-thread side of the queue.
 *
 * When the current source comes up short, the next pending source is
 * promoted inside the same pull, so consecutive tracks are sample-adjacent.
 * While idle it emits silence if keep-alive is set, otherwise it exhausts.
 *
 * Retired sources go back to the control side through the garbage queue.
 * If that queue is full they wait in a local list reserved up front and are
 * handed back on a later pull; nothing is destroyed here.
 */
class SourcesQueue : public Source {
public:
    explicit SourcesQueue(std::shared_ptr<detail::QueueShared> shared);

    StreamFormat format() const override { return shared_->format; }

protected:
    size_t do_pull(std::span<Sample> output) override;
    std::optional<uint64_t> frames_left() const override;

private:
    void apply_commands();
    bool promote();
    void retire(detail::Track& track);
    bool flush_deferred();

    std::shared_ptr<detail::QueueShared> shared_;
    detail::Track current_;
    SpscQueue<detail::Track> pending_;
    std::vector<detail::Track> deferred_;
};

/**
 * @brief Control-side handle of a SourcesQueue.
 */
class SourcesQueueInput {
public:
    explicit SourcesQueueInput(std::shared_ptr<detail::QueueShared> shared);

    /**
     * @brief Enqueue a source. It is moved from only when ErrorCode::Ok is returned.
     *
     * Finished sources count against the capacity until they are collected;
     * append collects them first.
     */
    ErrorCode append(SourcePtr&& source);

    /**
     * @brief Enqueue a source and hand back a flag that turns true once the
     * queue is done with it.
     *
     * The flag is raised from the audio thread when the source ends, or when
     * it is dropped by skip() or clear(). On failure @p finished is left
     * untouched and the source is not moved from.
     */
    ErrorCode append_with_signal(SourcePtr&& source, FlagParameter* finished);

    /**
     * @brief Drop the current source; the next one starts at the following tick.
     */
    ErrorCode skip();

    /**
     * @brief Drop the current and every pending source.
     */
    ErrorCode clear();

    /**
     * @brief Sources not yet finished, the current one included.
     */
    size_t len() const { return shared_->sound_count.load(std::memory_order_acquire); }
    bool empty() const { return len() == 0; }

    /**
     * @brief True when append() would find room, after collecting finished sources.
     */
    bool has_room();

    /**
     * @brief Emit silence while idle instead of exhausting. Takes effect on the next tick.
     */
    void set_keep_alive_if_empty(bool keep_alive) { shared_->keep_alive_if_empty.store(keep_alive); }
    bool keep_alive_if_empty() const { return shared_->keep_alive_if_empty.load(); }

    /**
     * @brief Tracks finished naturally since the previous call.
     */
    uint64_t take_finished() { return shared_->tracks_finished.exchange(0, std::memory_order_acq_rel); }

    size_t collect_garbage();

    StreamFormat format() const { return shared_->format; }

private:
    ErrorCode push_track(detail::Track&& track);
    size_t collect_locked();

    std::shared_ptr<detail::QueueShared> shared_;
    std::mutex mutex_;
};

using QueuePair = std::pair<std::shared_ptr<SourcesQueueInput>, std::unique_ptr<SourcesQueue>>;

/**
 * @brief Create a connected queue.
 *
 * @param position Counter the audio side resets to zero each time a track starts.
 * @throws std::invalid_argument on an invalid format or zero capacity.
 */
QueuePair make_queue(const StreamFormat& format, size_t capacity, bool keep_alive_if_empty,
                     CounterParameter position = CounterParameter(0));

} // namespace pcmflow

#endif // PCMFLOW_SOURCES_QUEUE_HPP
