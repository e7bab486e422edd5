/**
 * @file SpscQueue.hpp
 * @brief Bounded lock-free single-producer single-consumer queue.
 *
 * Storage is allocated once at construction; push and pop never allocate,
 * so the queue can be used on either side of the real-time boundary.
 */

#ifndef PCMFLOW_SPSC_QUEUE_HPP
#define PCMFLOW_SPSC_QUEUE_HPP

#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace pcmflow {

/**
 * @brief A lock-free, single-producer single-consumer ring buffer.
 *
 * Capacity is rounded up to a power of two. One slot is kept free to
 * distinguish full from empty, so usable capacity is that value minus one.
 * Items are moved in and out, so move-only types are supported.
 */
template<typename T>
class SpscQueue {
public:
    explicit SpscQueue(size_t capacity)
        : buffer_(round_up(capacity + 1))
        , mask_(buffer_.size() - 1)
    {}

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /**
     * @brief Push an item. Producer side only.
     *
     * @return false if the queue is full; @p item is left untouched in that case.
     */
    bool push(T&& item) {
        const size_t h = head_.load(std::memory_order_relaxed);
        const size_t t = tail_.load(std::memory_order_acquire);

        if (((h + 1) & mask_) == t) {
            return false; // Full
        }

        buffer_[h] = std::move(item);
        head_.store((h + 1) & mask_, std::memory_order_release);
        return true;
    }

    bool push(const T& item) {
        T copy = item;
        return push(std::move(copy));
    }

    /**
     * @brief Pop the oldest item. Consumer side only.
     */
    std::optional<T> pop() {
        const size_t t = tail_.load(std::memory_order_relaxed);
        const size_t h = head_.load(std::memory_order_acquire);

        if (t == h) {
            return std::nullopt; // Empty
        }

        std::optional<T> item(std::move(buffer_[t]));
        buffer_[t] = T{};
        tail_.store((t + 1) & mask_, std::memory_order_release);
        return item;
    }

    /**
     * @brief Pop into @p out without constructing an optional.
     */
    bool try_pop(T& out) {
        const size_t t = tail_.load(std::memory_order_relaxed);
        const size_t h = head_.load(std::memory_order_acquire);

        if (t == h) {
            return false;
        }

        out = std::move(buffer_[t]);
        buffer_[t] = T{};
        tail_.store((t + 1) & mask_, std::memory_order_release);
        return true;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    /**
     * @brief Number of queued items. Exact only when called from one of the two endpoints.
     */
    size_t size() const {
        const size_t h = head_.load(std::memory_order_acquire);
        const size_t t = tail_.load(std::memory_order_acquire);
        return (h - t) & mask_;
    }

    size_t capacity() const { return mask_; }

    size_t free_space() const { return capacity() - size(); }

private:
    static size_t round_up(size_t value) {
        size_t result = 2;
        while (result < value) {
            result <<= 1;
        }
        return result;
    }

    std::vector<T> buffer_;
    const size_t mask_;
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

} // namespace pcmflow

#endif // PCMFLOW_SPSC_QUEUE_HPP
