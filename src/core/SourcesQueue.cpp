/**
 * @file SourcesQueue.cpp
 */

#include "SourcesQueue.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcmflow {

namespace detail {

QueueShared::QueueShared(const StreamFormat& fmt, size_t cap, bool keep_alive, CounterParameter pos)
    : format(fmt)
    , capacity(cap)
    , keep_alive_if_empty(keep_alive)
    , commands(cap + 16)
    , garbage(cap * 2 + 16)
    , position(std::move(pos))
{}

} // namespace detail

SourcesQueue::SourcesQueue(std::shared_ptr<detail::QueueShared> shared)
    : shared_(std::move(shared))
    , pending_(shared_ ? shared_->capacity : 1)
{
    if (!shared_) {
        throw std::invalid_argument("SourcesQueue: shared state is null");
    }
    deferred_.reserve(shared_->capacity);
}

size_t SourcesQueue::do_pull(std::span<Sample> output) {
    flush_deferred();
    apply_commands();

    const size_t channels = shared_->format.channels;
    const size_t frames = output.size() / channels;
    size_t done = 0;

    while (done < frames) {
        if (!current_.source && !promote()) {
            break;
        }

        const size_t wanted = frames - done;
        const size_t got = current_.source->pull(output.subspan(done * channels, wanted * channels));
        done += got;

        if (got < wanted) {
            retire(current_);
            shared_->sound_count.fetch_sub(1, std::memory_order_acq_rel);
            shared_->tracks_finished.fetch_add(1, std::memory_order_acq_rel);
        }
    }

    if (done < frames && shared_->keep_alive_if_empty.load()) {
        std::fill(output.begin() + static_cast<std::ptrdiff_t>(done * channels), output.end(), 0.0f);
        return frames;
    }
    return done;
}

std::optional<uint64_t> SourcesQueue::frames_left() const {
    if (shared_->keep_alive_if_empty.load() || !pending_.empty()) {
        return std::nullopt;
    }
    if (!current_.source) {
        return shared_->commands.empty() ? std::optional<uint64_t>(0) : std::nullopt;
    }
    return current_.source->remaining_frames();
}

void SourcesQueue::apply_commands() {
    detail::QueueCommand command;
    while (shared_->commands.try_pop(command)) {
        switch (command.type) {
            case detail::QueueCommand::Type::Append:
                if (!pending_.push(std::move(command.track))) {
                    AudioLogger::instance().log_message("Queue", "PENDING_FULL");
                    retire(command.track);
                    shared_->sound_count.fetch_sub(1, std::memory_order_acq_rel);
                    break;
                }
                if (!current_.source) {
                    promote();
                }
                break;

            case detail::QueueCommand::Type::Skip:
                if (current_.source) {
                    retire(current_);
                    shared_->sound_count.fetch_sub(1, std::memory_order_acq_rel);
                    promote();
                }
                break;

            case detail::QueueCommand::Type::Clear: {
                size_t dropped = 0;
                if (current_.source) {
                    retire(current_);
                    ++dropped;
                }
                detail::Track pending;
                while (pending_.try_pop(pending)) {
                    retire(pending);
                    ++dropped;
                }
                shared_->sound_count.fetch_sub(dropped, std::memory_order_acq_rel);
                break;
            }
        }
    }
}

bool SourcesQueue::promote() {
    if (!pending_.try_pop(current_)) {
        return false;
    }
    shared_->position.store(0);
    return true;
}

void SourcesQueue::retire(detail::Track& track) {
    if (!track.source) {
        return;
    }
    if (track.done) {
        track.done->store(true);
    }
    if (flush_deferred() && shared_->garbage.push(std::move(track))) {
        return;
    }
    AudioLogger::instance().log_message("Queue", "GC_FULL");
    // Reserved to capacity, and no more than capacity sources are outstanding
    deferred_.push_back(std::move(track));
    track = detail::Track{};
}

bool SourcesQueue::flush_deferred() {
    size_t handed = 0;
    while (handed < deferred_.size() && shared_->garbage.push(std::move(deferred_[handed]))) {
        ++handed;
    }
    deferred_.erase(deferred_.begin(), deferred_.begin() + static_cast<std::ptrdiff_t>(handed));
    return deferred_.empty();
}

SourcesQueueInput::SourcesQueueInput(std::shared_ptr<detail::QueueShared> shared)
    : shared_(std::move(shared))
{
    if (!shared_) {
        throw std::invalid_argument("SourcesQueueInput: shared state is null");
    }
}

ErrorCode SourcesQueueInput::append(SourcePtr&& source) {
    if (!source) {
        return ErrorCode::InvalidParameter;
    }
    if (source->format() != shared_->format) {
        return ErrorCode::FormatMismatch;
    }

    detail::Track track{std::move(source), std::nullopt};
    const ErrorCode result = push_track(std::move(track));
    if (result != ErrorCode::Ok) {
        source = std::move(track.source);
    }
    return result;
}

ErrorCode SourcesQueueInput::append_with_signal(SourcePtr&& source, FlagParameter* finished) {
    if (!source || !finished) {
        return ErrorCode::InvalidParameter;
    }
    if (source->format() != shared_->format) {
        return ErrorCode::FormatMismatch;
    }

    FlagParameter flag(false);
    detail::Track track{std::move(source), flag};
    const ErrorCode result = push_track(std::move(track));
    if (result != ErrorCode::Ok) {
        source = std::move(track.source);
        return result;
    }
    *finished = flag;
    return ErrorCode::Ok;
}

ErrorCode SourcesQueueInput::push_track(detail::Track&& track) {
    std::lock_guard<std::mutex> lock(mutex_);
    collect_locked();
    if (shared_->outstanding.load(std::memory_order_acquire) >= shared_->capacity) {
        return ErrorCode::QueueFull;
    }

    detail::QueueCommand command{detail::QueueCommand::Type::Append, std::move(track)};
    shared_->sound_count.fetch_add(1, std::memory_order_acq_rel);
    shared_->outstanding.fetch_add(1, std::memory_order_acq_rel);
    if (!shared_->commands.push(std::move(command))) {
        shared_->sound_count.fetch_sub(1, std::memory_order_acq_rel);
        shared_->outstanding.fetch_sub(1, std::memory_order_acq_rel);
        track = std::move(command.track);
        return ErrorCode::QueueFull;
    }
    return ErrorCode::Ok;
}

ErrorCode SourcesQueueInput::skip() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!shared_->commands.push(detail::QueueCommand{detail::QueueCommand::Type::Skip, {}})) {
        return ErrorCode::QueueFull;
    }
    return ErrorCode::Ok;
}

ErrorCode SourcesQueueInput::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!shared_->commands.push(detail::QueueCommand{detail::QueueCommand::Type::Clear, {}})) {
        return ErrorCode::QueueFull;
    }
    return ErrorCode::Ok;
}

bool SourcesQueueInput::has_room() {
    std::lock_guard<std::mutex> lock(mutex_);
    collect_locked();
    return shared_->outstanding.load(std::memory_order_acquire) < shared_->capacity;
}

size_t SourcesQueueInput::collect_garbage() {
    std::lock_guard<std::mutex> lock(mutex_);
    return collect_locked();
}

size_t SourcesQueueInput::collect_locked() {
    size_t released = 0;
    detail::Track retired;
    while (shared_->garbage.try_pop(retired)) {
        retired = detail::Track{};
        shared_->outstanding.fetch_sub(1, std::memory_order_acq_rel);
        ++released;
    }
    return released;
}

QueuePair make_queue(const StreamFormat& format, size_t capacity, bool keep_alive_if_empty,
                     CounterParameter position) {
    if (!format.is_valid()) {
        throw std::invalid_argument("make_queue: invalid stream format " + to_string(format));
    }
    if (capacity == 0) {
        throw std::invalid_argument("make_queue: capacity must be non-zero");
    }

    auto shared = std::make_shared<detail::QueueShared>(format, capacity, keep_alive_if_empty, std::move(position));
    return QueuePair(std::make_shared<SourcesQueueInput>(shared), std::make_unique<SourcesQueue>(shared));
}

} // namespace pcmflow
