/**
 * @file Logger.hpp
 * @brief Real-time safe telemetry logger drained from the control thread.
 */

#ifndef PCMFLOW_LOGGER_HPP
#define PCMFLOW_LOGGER_HPP

#include "SpscQueue.hpp"
#include <chrono>
#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>

namespace pcmflow {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type = Type::Message;
    char tag[32] = {};      // Category or Tag
    float value = 0.0f;     // Numeric value (for Type::Event)
    char message[64] = {};  // Static message (for Type::Message)
    uint64_t timestamp = 0; // Steady clock, nanoseconds
};

/**
 * @brief Singleton Logger for Audio Thread telemetry.
 *
 * The audio thread pushes fixed-size entries; a background thread pops and
 * prints them. Entries are dropped when the ring is full.
 */
class AudioLogger {
public:
    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    // Audio Thread Methods (RT-Safe)
    void log_message(const char* tag, const char* msg) {
        LogEntry entry;
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp = now_ns();
        ring_buffer_.push(std::move(entry));
    }

    void log_event(const char* tag, float value) {
        LogEntry entry;
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp = now_ns();
        ring_buffer_.push(std::move(entry));
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        return ring_buffer_.pop();
    }

    /**
     * @brief Drain every pending entry to @p os. Returns the number printed.
     */
    size_t flush(std::ostream& os) {
        size_t count = 0;
        while (auto entry = pop_entry()) {
            os << "[" << entry->tag << "] ";
            if (entry->type == LogEntry::Type::Message) {
                os << entry->message;
            } else {
                os << entry->value;
            }
            os << '\n';
            ++count;
        }
        os.flush();
        return count;
    }

private:
    AudioLogger() : ring_buffer_(1024) {}

    static uint64_t now_ns() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    }

    SpscQueue<LogEntry> ring_buffer_;
};

} // namespace pcmflow

#endif // PCMFLOW_LOGGER_HPP
