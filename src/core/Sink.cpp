/**
 * @file Sink.cpp
 */

#include "Sink.hpp"
#include "Conversions.hpp"
#include "Amplify.hpp"
#include "Pausable.hpp"
#include "Speed.hpp"
#include "TrackPosition.hpp"
#include <cmath>
#include <iostream>
#include <thread>

namespace pcmflow {

Sink::Sink(std::shared_ptr<MixerController> mixer, size_t queue_capacity)
    : mixer_(std::move(mixer))
    , queue_capacity_(queue_capacity)
{}

Sink::~Sink() {
    if (detached_) {
        return;
    }
    const ErrorCode result = stop();
    if (result != ErrorCode::Ok) {
        std::cerr << "[Sink] Failed to stop on destruction: " << to_string(result) << std::endl;
    }
}

std::unique_ptr<Sink> Sink::connect(std::shared_ptr<MixerController> mixer, size_t queue_capacity,
                                    ErrorCode* error) {
    auto report = [error](ErrorCode code) {
        if (error) {
            *error = code;
        }
    };

    if (!mixer || queue_capacity == 0) {
        report(ErrorCode::InvalidParameter);
        return nullptr;
    }

    std::unique_ptr<Sink> sink(new Sink(std::move(mixer), queue_capacity));
    const ErrorCode result = sink->install();
    report(result);
    if (result != ErrorCode::Ok) {
        sink->detach();
        return nullptr;
    }
    return sink;
}

ErrorCode Sink::install() {
    auto [input, queue] = make_queue(mixer_->format(), queue_capacity_, true, position_);

    SourcePtr chain = std::make_unique<Pausable>(std::move(queue), paused_);
    chain = std::make_unique<Amplify>(std::move(chain), volume_);

    SlotHandle slot;
    const ErrorCode result = mixer_->add(std::move(chain), &slot);
    if (result != ErrorCode::Ok) {
        return result;
    }

    input_ = std::move(input);
    slot_ = slot;
    return ErrorCode::Ok;
}

ErrorCode Sink::append(SourcePtr&& source) {
    return enqueue(std::move(source), nullptr);
}

ErrorCode Sink::append_with_signal(SourcePtr&& source, FlagParameter* finished) {
    if (!finished) {
        return ErrorCode::InvalidParameter;
    }
    return enqueue(std::move(source), finished);
}

ErrorCode Sink::enqueue(SourcePtr&& source, FlagParameter* finished) {
    if (!source) {
        return ErrorCode::InvalidParameter;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    collect_garbage();

    if (!input_) {
        const ErrorCode result = install();
        if (result != ErrorCode::Ok) {
            return result;
        }
    }
    if (!input_->has_room()) {
        return ErrorCode::QueueFull;
    }

    // Position counts source frames, so it sits under the speed stage
    SourcePtr track = std::make_unique<TrackPosition>(convert_to(std::move(source), mixer_->format()),
                                                      position_);
    track = std::make_unique<Speed>(std::move(track), speed_);

    const ErrorCode result = finished ? input_->append_with_signal(std::move(track), finished)
                                      : input_->append(std::move(track));
    if (result != ErrorCode::Ok) {
        std::cerr << "[Sink] Dropped source on append: " << to_string(result) << std::endl;
    }
    return result;
}

ErrorCode Sink::skip() {
    std::lock_guard<std::mutex> lock(mutex_);
    collect_garbage();
    if (!input_) {
        return ErrorCode::Ok;
    }
    return input_->skip();
}

ErrorCode Sink::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!input_) {
        return ErrorCode::Ok;
    }

    ErrorCode result = input_->clear();
    const ErrorCode removed = mixer_->remove(slot_);
    if (result == ErrorCode::Ok) {
        result = removed;
    }

    collect_garbage();
    input_.reset();
    slot_ = SlotHandle{};
    position_.store(0);
    return result;
}

ErrorCode Sink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    collect_garbage();
    if (!input_) {
        return ErrorCode::Ok;
    }
    return input_->clear();
}

void Sink::pause() {
    paused_.store(true);
}

void Sink::resume() {
    paused_.store(false);
}

ErrorCode Sink::set_volume(float volume) {
    if (!std::isfinite(volume)) {
        return ErrorCode::InvalidParameter;
    }
    volume_.store(volume);
    return ErrorCode::Ok;
}

ErrorCode Sink::set_speed(float speed) {
    if (!std::isfinite(speed) || speed <= 0.0f) {
        return ErrorCode::InvalidParameter;
    }
    speed_.store(speed);
    return ErrorCode::Ok;
}

bool Sink::is_playing() const {
    return !is_paused() && len() > 0;
}

size_t Sink::len() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return input_ ? input_->len() : 0;
}

std::chrono::duration<double> Sink::position() const {
    return duration_for(position_.load(), mixer_->format().sample_rate);
}

bool Sink::sleep_until_end(std::chrono::milliseconds timeout) {
    const bool bounded = timeout != std::chrono::milliseconds::max();
    const auto deadline = std::chrono::steady_clock::now() + (bounded ? timeout : std::chrono::milliseconds(0));

    while (len() > 0) {
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            collect_garbage();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

uint64_t Sink::poll_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    collect_garbage();
    return input_ ? input_->take_finished() : 0;
}

void Sink::collect_garbage() {
    if (input_) {
        input_->collect_garbage();
    }
    mixer_->collect_garbage();
}

} // namespace pcmflow
