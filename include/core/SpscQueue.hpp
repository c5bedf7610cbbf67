#pragma once

#include <atomic>
#include <array>
#include <optional>
#include <cstddef>

namespace core {

/**
 * Single-Producer-Single-Consumer (SPSC) lock-free ring buffer.
 * Carries frames from the stream driver to one compositor worker.
 *
 * Uses std::atomic with acquire/release semantics; one slot is kept empty to
 * tell "full" from "empty", so at most Capacity - 1 items are stored.
 *
 * @tparam T Element type (move-only types are fine)
 * @tparam Capacity Size of the ring buffer
 */
template<typename T, size_t Capacity>
class SpscQueue {
    static_assert(Capacity >= 2, "SpscQueue needs at least two slots");

public:
    SpscQueue() : head_(0), tail_(0) {}

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /**
     * Pushes an item, moving from it on success. Returns false (item untouched) if full.
     * Thread-safety: producer thread only.
     */
    bool try_push(T& item) {
        const size_t current_tail = tail_.load(std::memory_order_relaxed);
        const size_t next_tail = (current_tail + 1) % Capacity;

        if (next_tail == head_.load(std::memory_order_acquire)) {
            return false;
        }

        buffer_[current_tail] = std::move(item);
        tail_.store(next_tail, std::memory_order_release);
        return true;
    }

    bool try_push(T&& item) {
        return try_push(item);
    }

    /**
     * Pops an item, std::nullopt if empty.
     * Thread-safety: consumer thread only.
     */
    std::optional<T> try_pop() {
        const size_t current_head = head_.load(std::memory_order_relaxed);

        if (current_head == tail_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }

        std::optional<T> item(std::move(buffer_[current_head]));
        buffer_[current_head] = T{};
        head_.store((current_head + 1) % Capacity, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    bool full() const {
        const size_t next_tail = (tail_.load(std::memory_order_acquire) + 1) % Capacity;
        return next_tail == head_.load(std::memory_order_acquire);
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        if (tail >= head) return tail - head;
        return Capacity + tail - head;
    }

    static constexpr size_t capacity() { return Capacity - 1; }

private:
    // Separate cache lines for head and tail to avoid false sharing
    static constexpr size_t CACHE_LINE_SIZE = 64;

    alignas(CACHE_LINE_SIZE) std::atomic<size_t> head_;
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail_;

    std::array<T, Capacity> buffer_;
};

} // namespace core
