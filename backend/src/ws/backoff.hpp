#pragma once
#include <algorithm>
#include <chrono>

// Exponential reconnect delay: initial, doubling, capped. reset() after a
// successful connect starts the sequence over.
class ReconnectBackoff {
public:
    using ms = std::chrono::milliseconds;

    explicit ReconnectBackoff(ms initial = ms(500), ms max = ms(30000))
        : initial_(initial), max_(std::max(initial, max)), next_(initial) {}

    // Delay to wait now; the following call returns twice as much (up to max).
    ms next() {
        ms cur = next_;
        next_ = std::min(max_, next_ * 2);
        return cur;
    }

    void reset() { next_ = initial_; }

    ms peek() const { return next_; }

private:
    ms initial_;
    ms max_;
    ms next_;
};
