#pragma once
#include <condition_variable>
#include <cstdint>
#include <mutex>

// Hands out tickets in state order and runs callbacks in ticket order.
//
// take() is called while the caller still holds the lock that orders its
// state changes; run() is called after that lock is released and blocks until
// every earlier ticket has run. Callbacks can therefore take other locks
// without holding the state lock, and still observe changes in the order
// they were made. Every ticket taken must be passed to run() exactly once.
class TurnSequencer {
public:
    std::uint64_t take() noexcept { return next_++; } // caller serializes take()

    template <class Fn>
    void run(std::uint64_t ticket, Fn&& fn) {
        {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [&] { return serving_ == ticket; });
        }
        struct Advance {
            TurnSequencer& s;
            ~Advance() {
                {
                    std::lock_guard<std::mutex> lk(s.m_);
                    ++s.serving_;
                }
                s.cv_.notify_all();
            }
        } advance{*this};
        fn();
    }

private:
    std::uint64_t next_{0};

    std::mutex m_;
    std::condition_variable cv_;
    std::uint64_t serving_{0};
};
