#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

// Backpressure policy when a bounded queue is full
enum class Backpressure {
    DropNewest,   // reject the incoming element
    DropOldest,   // evict the stalest element, then push the incoming one
};

// Multi-producer bounded FIFO. push() never blocks; overflow is resolved by the
// configured Backpressure policy and counted in dropped().
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity, Backpressure bp = Backpressure::DropOldest)
        : capacity_(capacity == 0 ? 1 : capacity), backpressure_(bp) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Returns false if an element was dropped to honour the capacity.
    bool push(T v) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lk(m_);
            if (closed_) return false;
            if (q_.size() >= capacity_) {
                dropped = true;
                dropped_.fetch_add(1, std::memory_order_relaxed);
                if (backpressure_ == Backpressure::DropNewest) return false;
                q_.pop_front();
            }
            q_.push_back(std::move(v));
        }
        cv_.notify_one();
        return !dropped;
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lk(m_);
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    // Waits up to `timeout` for an element. Returns false on timeout or when
    // the queue is closed and drained.
    template <class Rep, class Period>
    bool pop_wait(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(m_);
        if (!cv_.wait_for(lk, timeout, [this] { return closed_ || !q_.empty(); })) {
            return false;
        }
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(m_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }
    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    const std::size_t capacity_;
    const Backpressure backpressure_;

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_{false};
    std::atomic<std::uint64_t> dropped_{0};
};
