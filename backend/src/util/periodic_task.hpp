#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

// Runs `fn` on its own thread every `interval` until stop().
// stop() wakes the thread immediately instead of waiting out the interval.
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn)
        : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {}

    ~PeriodicTask() { stop(); }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start() {
        if (running_.exchange(true)) return;
        th_ = std::thread([this] { loop(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lk(m_);
            running_.store(false);
        }
        cv_.notify_all();
        if (th_.joinable()) th_.join();
    }

private:
    void loop() {
        std::unique_lock<std::mutex> lk(m_);
        while (running_.load()) {
            if (cv_.wait_for(lk, interval_, [this] { return !running_.load(); })) break;
            lk.unlock();
            try {
                fn_();
            } catch (const std::exception& e) {
                std::cerr << "[" << name_ << "] task error: " << e.what() << std::endl;
            }
            lk.lock();
        }
    }

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> fn_;

    std::mutex m_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::thread th_;
};
