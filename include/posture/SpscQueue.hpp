#pragma once

#include <atomic>
#include <array>
#include <optional>
#include <cstddef>

namespace posture {

/**
 * Bounded single-producer/single-consumer queue linking the pipeline roles
 * (input → processing → notification).
 *
 * Read and write positions are free-running counters; the slot is the
 * counter modulo Capacity, so all Capacity slots are usable and size() is
 * exact. A full queue refuses the push and counts it as dropped. Producers
 * never block.
 *
 * @tparam T Element type, moved in and out
 * @tparam Capacity Maximum number of queued items
 */
template<typename T, size_t Capacity>
class SpscQueue {
    static_assert(Capacity >= 1, "SpscQueue needs at least one slot");

public:
    SpscQueue() = default;

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /**
     * Producer thread only.
     * @return false when full; the item is discarded and counted
     */
    bool try_push(T item) {
        const size_t write = writePos_.load(std::memory_order_relaxed);
        if (write - readPos_.load(std::memory_order_acquire) == Capacity) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        slots_[write % Capacity] = std::move(item);
        writePos_.store(write + 1, std::memory_order_release);
        return true;
    }

    // Consumer thread only
    std::optional<T> try_pop() {
        const size_t read = readPos_.load(std::memory_order_relaxed);
        if (read == writePos_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }

        std::optional<T> item(std::move(slots_[read % Capacity]));
        readPos_.store(read + 1, std::memory_order_release);
        return item;
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] size_t size() const {
        const size_t read = readPos_.load(std::memory_order_acquire);
        return writePos_.load(std::memory_order_acquire) - read;
    }

    [[nodiscard]] size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    static constexpr size_t capacity() { return Capacity; }

private:
    // Keep the two positions on separate cache lines
    static constexpr size_t CACHE_LINE_SIZE = 64;

    alignas(CACHE_LINE_SIZE) std::atomic<size_t> readPos_{0};
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> writePos_{0};
    std::atomic<size_t> dropped_{0};

    std::array<T, Capacity> slots_{};
};

} // namespace posture
