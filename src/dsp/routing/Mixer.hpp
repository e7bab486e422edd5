/**
 * @file Mixer.hpp
 * @brief Dynamic summing mixer split into a real-time side and a control side.
 *
 * The Mixer is a Source pulled by the output bridge. The MixerController is
 * the control-side handle: it validates sources and sends them to the mixer
 * through a bounded lock-free command queue. The mixer answers with events
 * and hands retired sources back for destruction outside the audio thread.
 */

#ifndef PCMFLOW_MIXER_HPP
#define PCMFLOW_MIXER_HPP

#include "Source.hpp"
#include "ErrorCode.hpp"
#include "SpscQueue.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace pcmflow {

struct MixerConfig {
    size_t max_slots = 64;
    size_t command_capacity = 256;
    uint32_t drain_ticks = 0;        ///< Silent ticks a naturally exhausted slot stays registered.
    bool keep_alive_if_empty = true; ///< Emit silence instead of exhausting when no slot is active.
    size_t max_block_frames = 1024;  ///< Scratch size; longer pulls are mixed in chunks.
};

/**
 * @brief Opaque reference to a mixer input slot. Id 0 is never issued.
 */
struct SlotHandle {
    uint64_t id = 0;

    bool valid() const { return id != 0; }
    bool operator==(const SlotHandle&) const = default;
};

enum class SlotState {
    Active,   ///< Pulled every tick.
    Draining, ///< Exhausted; contributes silence until drain_ticks elapse.
    Removed   ///< Purged at the start of the next tick.
};

struct MixerEvent {
    enum class Type {
        SlotFinished, ///< The slot's source exhausted naturally.
        SlotRemoved   ///< The slot was purged; its source is waiting in the garbage queue.
    };

    Type type = Type::SlotFinished;
    SlotHandle slot;
};

namespace detail {

struct MixerCommand {
    enum class Type { Add, Remove, Clear };

    Type type = Type::Add;
    uint64_t slot = 0;
    SourcePtr source;
};

/**
 * @brief State shared by one Mixer and its MixerController.
 */
struct MixerShared {
    MixerShared(const StreamFormat& fmt, const MixerConfig& cfg);

    const StreamFormat format;
    const MixerConfig config;

    SpscQueue<MixerCommand> commands; // control -> audio
    SpscQueue<MixerEvent> events;     // audio -> control
    SpscQueue<SourcePtr> garbage;     // audio -> control, retired sources

    std::atomic<size_t> slot_count{0};
    std::atomic<uint64_t> ticks{0};
};

} // namespace detail

/**
 * @brief Real-time side: sums every active slot, clamps, and never allocates.
 *
 * Each pull is one tick:
 * 1. Apply pending commands in order.
 * 2. Advance draining slots; those whose grace period ran out become Removed.
 * 3. Purge Removed slots (stable compaction, no reallocation).
 * 4. Mix active slots. A slot that comes up short becomes Draining.
 */
class Mixer : public Source {
public:
    explicit Mixer(std::shared_ptr<detail::MixerShared> shared);

    StreamFormat format() const override { return shared_->format; }

    /**
     * @brief Slots currently held by the audio side. Audio thread only.
     */
    size_t slot_count() const { return slots_.size(); }

protected:
    size_t do_pull(std::span<Sample> output) override;
    std::optional<uint64_t> frames_left() const override;

private:
    struct Slot {
        uint64_t id = 0;
        SourcePtr source;
        SlotState state = SlotState::Active;
        uint32_t drain_left = 0;
    };

    void apply_commands();
    void advance_draining();
    void purge_removed();
    void emit(MixerEvent::Type type, uint64_t id);

    std::shared_ptr<detail::MixerShared> shared_;
    std::vector<Slot> slots_;
    std::vector<Sample> scratch_;
};

/**
 * @brief Control-side handle of a mixer. Safe to share between control threads.
 */
class MixerController {
public:
    explicit MixerController(std::shared_ptr<detail::MixerShared> shared);

    /**
     * @brief Register a source as a new slot.
     *
     * The source is moved from only when ErrorCode::Ok is returned; on any
     * error the caller still owns it.
     *
     * @param source Source whose format equals format().
     * @param handle Receives the slot handle on success (may be null).
     */
    ErrorCode add(SourcePtr&& source, SlotHandle* handle = nullptr);

    /**
     * @brief Mark a slot Removed at the next tick. Unknown or already removed slots are ignored.
     */
    ErrorCode remove(SlotHandle handle);

    /**
     * @brief Remove every slot at the next tick.
     */
    ErrorCode clear();

    std::optional<MixerEvent> poll_event();

    /**
     * @brief Destroy sources the mixer has retired. Returns how many were released.
     */
    size_t collect_garbage();

    StreamFormat format() const { return shared_->format; }
    const MixerConfig& config() const { return shared_->config; }

    /**
     * @brief Registered slots not yet purged, including pending additions.
     */
    size_t active_slots() const { return shared_->slot_count.load(std::memory_order_acquire); }

    /**
     * @brief Number of ticks the mixer has completed.
     */
    uint64_t ticks() const { return shared_->ticks.load(std::memory_order_acquire); }

private:
    ErrorCode push_command(detail::MixerCommand&& command);

    std::shared_ptr<detail::MixerShared> shared_;
    std::mutex producer_mutex_;
    std::mutex consumer_mutex_;
    uint64_t next_id_ = 1;
};

using MixerPair = std::pair<std::shared_ptr<MixerController>, std::unique_ptr<Mixer>>;

/**
 * @brief Create a connected controller/mixer pair.
 *
 * @throws std::invalid_argument if the format is invalid or a capacity is zero.
 */
MixerPair make_mixer(const StreamFormat& format, const MixerConfig& config = {});

} // namespace pcmflow

#endif // PCMFLOW_MIXER_HPP
