/**
 * @file Mixer.cpp
 * @brief Mixer tick and controller command path.
 */

#include "Mixer.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcmflow {

namespace detail {

MixerShared::MixerShared(const StreamFormat& fmt, const MixerConfig& cfg)
    : format(fmt)
    , config(cfg)
    , commands(cfg.command_capacity)
    , events(cfg.max_slots * 2 + cfg.command_capacity)
    , garbage(cfg.max_slots + cfg.command_capacity)
{}

} // namespace detail

// --- Mixer (audio thread) ---

Mixer::Mixer(std::shared_ptr<detail::MixerShared> shared)
    : shared_(std::move(shared))
{
    if (!shared_) {
        throw std::invalid_argument("Mixer: shared state is null");
    }
    slots_.reserve(shared_->config.max_slots);
    scratch_.resize(shared_->config.max_block_frames * shared_->format.channels);
}

size_t Mixer::do_pull(std::span<Sample> output) {
    apply_commands();
    advance_draining();
    purge_removed();

    const size_t channels = shared_->format.channels;
    const size_t frames = output.size() / channels;
    const size_t block = shared_->config.max_block_frames;

    std::fill(output.begin(), output.end(), 0.0f);

    bool any_active = false;
    size_t produced = 0;

    for (size_t offset = 0; offset < frames; offset += block) {
        const size_t chunk = std::min(block, frames - offset);
        std::span<Sample> dest = output.subspan(offset * channels, chunk * channels);
        std::span<Sample> scratch(scratch_.data(), chunk * channels);

        for (auto& slot : slots_) {
            if (slot.state != SlotState::Active) {
                continue;
            }
            any_active = true;

            const size_t got = slot.source->pull(scratch);
            const size_t count = got * channels;
            for (size_t i = 0; i < count; ++i) {
                dest[i] += scratch[i];
            }

            produced = std::max(produced, offset + got);

            if (got < chunk) {
                slot.state = SlotState::Draining;
                slot.drain_left = shared_->config.drain_ticks;
                emit(MixerEvent::Type::SlotFinished, slot.id);
            }
        }
    }

    // Master Safety Clamp
    for (Sample& sample : output) {
        sample = std::clamp(sample, -1.0f, 1.0f);
    }

    shared_->ticks.fetch_add(1, std::memory_order_acq_rel);

    if (shared_->config.keep_alive_if_empty) {
        return frames;
    }
    if (!any_active) {
        // Draining slots still hold the stream open for their grace ticks.
        const bool draining = std::any_of(slots_.begin(), slots_.end(), [](const Slot& s) {
            return s.state == SlotState::Draining;
        });
        return draining ? frames : 0;
    }
    return produced;
}

std::optional<uint64_t> Mixer::frames_left() const {
    if (shared_->config.keep_alive_if_empty || slots_.empty()) {
        return std::nullopt;
    }

    uint64_t longest = 0;
    for (const auto& slot : slots_) {
        if (slot.state != SlotState::Active) {
            continue;
        }
        const auto left = slot.source->remaining_frames();
        if (!left) {
            return std::nullopt;
        }
        longest = std::max(longest, *left);
    }
    return longest;
}

void Mixer::apply_commands() {
    detail::MixerCommand command;
    while (shared_->commands.try_pop(command)) {
        switch (command.type) {
            case detail::MixerCommand::Type::Add:
                if (slots_.size() >= shared_->config.max_slots) {
                    // slot_count admits at most max_slots, so this is never reached in
                    // practice. The source goes out through purge_removed like any other.
                    AudioLogger::instance().log_event("SLOT_OVERFLOW", static_cast<float>(command.slot));
                    slots_.push_back(Slot{command.slot, std::move(command.source), SlotState::Removed, 0});
                    break;
                }
                slots_.push_back(Slot{command.slot, std::move(command.source), SlotState::Active, 0});
                break;

            case detail::MixerCommand::Type::Remove:
                for (auto& slot : slots_) {
                    if (slot.id == command.slot) {
                        slot.state = SlotState::Removed;
                        break;
                    }
                }
                break;

            case detail::MixerCommand::Type::Clear:
                for (auto& slot : slots_) {
                    slot.state = SlotState::Removed;
                }
                break;
        }
    }
}

void Mixer::advance_draining() {
    for (auto& slot : slots_) {
        if (slot.state != SlotState::Draining) {
            continue;
        }
        if (slot.drain_left == 0) {
            slot.state = SlotState::Removed;
        } else {
            --slot.drain_left;
        }
    }
}

void Mixer::purge_removed() {
    size_t write = 0;
    size_t purged = 0;

    for (size_t read = 0; read < slots_.size(); ++read) {
        Slot& slot = slots_[read];
        if (slot.state == SlotState::Removed) {
            if (shared_->garbage.push(std::move(slot.source))) {
                emit(MixerEvent::Type::SlotRemoved, slot.id);
                ++purged;
                continue;
            }
            // Garbage queue is full: keep the tombstone and retry next tick.
            AudioLogger::instance().log_message("Mixer", "GC_FULL");
        }
        if (write != read) {
            slots_[write] = std::move(slot);
        }
        ++write;
    }

    if (purged > 0) {
        slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(write), slots_.end());
        shared_->slot_count.fetch_sub(purged, std::memory_order_acq_rel);
    }
}

void Mixer::emit(MixerEvent::Type type, uint64_t id) {
    if (!shared_->events.push(MixerEvent{type, SlotHandle{id}})) {
        AudioLogger::instance().log_event("EVT_DROP", static_cast<float>(id));
    }
}

// --- MixerController (control threads) ---

MixerController::MixerController(std::shared_ptr<detail::MixerShared> shared)
    : shared_(std::move(shared))
{
    if (!shared_) {
        throw std::invalid_argument("MixerController: shared state is null");
    }
}

ErrorCode MixerController::add(SourcePtr&& source, SlotHandle* handle) {
    if (!source) {
        return ErrorCode::InvalidParameter;
    }
    if (source->format() != shared_->format) {
        return ErrorCode::FormatMismatch;
    }

    std::lock_guard<std::mutex> lock(producer_mutex_);

    if (shared_->slot_count.load(std::memory_order_acquire) >= shared_->config.max_slots) {
        return ErrorCode::MixerFull;
    }

    const uint64_t id = next_id_;
    detail::MixerCommand command{detail::MixerCommand::Type::Add, id, std::move(source)};

    shared_->slot_count.fetch_add(1, std::memory_order_acq_rel);
    if (!shared_->commands.push(std::move(command))) {
        shared_->slot_count.fetch_sub(1, std::memory_order_acq_rel);
        source = std::move(command.source);
        return ErrorCode::QueueFull;
    }

    ++next_id_;
    if (handle) {
        *handle = SlotHandle{id};
    }
    return ErrorCode::Ok;
}

ErrorCode MixerController::remove(SlotHandle handle) {
    if (!handle.valid()) {
        return ErrorCode::InvalidParameter;
    }

    std::lock_guard<std::mutex> lock(producer_mutex_);
    if (handle.id >= next_id_) {
        return ErrorCode::NotFound;
    }
    return push_command(detail::MixerCommand{detail::MixerCommand::Type::Remove, handle.id, nullptr});
}

ErrorCode MixerController::clear() {
    std::lock_guard<std::mutex> lock(producer_mutex_);
    return push_command(detail::MixerCommand{detail::MixerCommand::Type::Clear, 0, nullptr});
}

ErrorCode MixerController::push_command(detail::MixerCommand&& command) {
    if (!shared_->commands.push(std::move(command))) {
        return ErrorCode::QueueFull;
    }
    return ErrorCode::Ok;
}

std::optional<MixerEvent> MixerController::poll_event() {
    std::lock_guard<std::mutex> lock(consumer_mutex_);
    return shared_->events.pop();
}

size_t MixerController::collect_garbage() {
    std::lock_guard<std::mutex> lock(consumer_mutex_);
    size_t released = 0;
    SourcePtr retired;
    while (shared_->garbage.try_pop(retired)) {
        retired.reset();
        ++released;
    }
    return released;
}

MixerPair make_mixer(const StreamFormat& format, const MixerConfig& config) {
    if (!format.is_valid()) {
        throw std::invalid_argument("make_mixer: invalid stream format " + to_string(format));
    }
    if (config.max_slots == 0 || config.command_capacity == 0 || config.max_block_frames == 0) {
        throw std::invalid_argument("make_mixer: capacities must be non-zero");
    }

    auto shared = std::make_shared<detail::MixerShared>(format, config);
    return MixerPair(std::make_shared<MixerController>(shared), std::make_unique<Mixer>(shared));
}

} // namespace pcmflow
