#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <utility>

// Single-Producer / Single-Consumer ring buffer for raw venue frames.
// - CapacityPow2 must be a power-of-two (e.g., 4096).
// - SPSC: exactly one producer thread calls try_push,
//         exactly one consumer thread calls try_pop.
// - Slots live on the heap so large rings do not bloat the owning feed.
template <typename T, std::size_t CapacityPow2>
class SpscRing {
    static_assert(CapacityPow2 >= 2, "Capacity must hold at least one element");
    static_assert((CapacityPow2 & (CapacityPow2 - 1)) == 0, "Capacity must be power of two");

public:
    SpscRing() : buf_(std::make_unique<T[]>(CapacityPow2)), head_(0), tail_(0) {}

    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    // Producer: returns false if full (caller decides policy, the value is left intact)
    bool try_push(T&& v) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & mask_;
        if (next == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        buf_[head] = std::move(v);
        head_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer: returns false if empty
    bool try_pop(T& out) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            return false;
        }
        out = std::move(buf_[tail]);
        buf_[tail] = T{};
        tail_.store((tail + 1) & mask_, std::memory_order_release);
        return true;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    // Approximate when producer and consumer are both active.
    std::size_t size() const {
        const std::size_t head = head_.load(std::memory_order_acquire);
        const std::size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail) & mask_;
    }

    std::size_t capacity() const { return CapacityPow2 - 1; } // one slot unused to disambiguate full/empty

private:
    static constexpr std::size_t mask_ = CapacityPow2 - 1;
    std::unique_ptr<T[]> buf_;
    std::atomic<std::size_t> head_; // producer writes
    std::atomic<std::size_t> tail_; // consumer writes
};
