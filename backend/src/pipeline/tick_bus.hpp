#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "md/tick.hpp"
#include "util/bounded_queue.hpp"

// Fan-out of canonical ticks to independent readers.
// Each reader owns a bounded queue and a consumer thread, so a slow reader
// never delays the others. publish() preserves per-publisher order for every
// reader. Readers are registered before start(); the set is fixed afterwards.
class TickBus {
public:
    using Handler = std::function<void(const Tick&)>;

    struct ReaderStats {
        std::string name;
        std::uint64_t delivered{0};
        std::uint64_t dropped{0};
        std::size_t depth{0};
    };

    explicit TickBus(std::size_t queue_capacity = 1 << 16)
        : capacity_(queue_capacity) {}

    ~TickBus() { stop(); }

    TickBus(const TickBus&) = delete;
    TickBus& operator=(const TickBus&) = delete;

    void add_reader(std::string name, Handler h) {
        if (running_.load()) {
            std::cerr << "[bus] add_reader(" << name << ") after start ignored" << std::endl;
            return;
        }
        auto r = std::make_unique<Reader>(std::move(name), std::move(h), capacity_);
        readers_.push_back(std::move(r));
    }

    void start() {
        if (running_.exchange(true)) return;
        for (auto& r : readers_) {
            Reader* rp = r.get();
            rp->th = std::thread([rp] { run_reader(*rp); });
        }
    }

    // Closes every queue, lets readers drain what is already queued, joins.
    void stop() {
        if (!running_.exchange(false)) return;
        for (auto& r : readers_) r->q.close();
        for (auto& r : readers_) {
            if (r->th.joinable()) r->th.join();
        }
    }

    void publish(TickPtr t) {
        if (!t) return;
        for (auto& r : readers_) r->q.push(t);
    }

    void publish(const Tick& t) { publish(std::make_shared<const Tick>(t)); }

    std::vector<ReaderStats> stats() const {
        std::vector<ReaderStats> out;
        out.reserve(readers_.size());
        for (const auto& r : readers_) {
            out.push_back({r->name, r->delivered.load(std::memory_order_relaxed), r->q.dropped(), r->q.size()});
        }
        return out;
    }

private:
    struct Reader {
        Reader(std::string n, Handler h, std::size_t cap)
            : name(std::move(n)), handler(std::move(h)), q(cap, Backpressure::DropOldest) {}
        std::string name;
        Handler handler;
        BoundedQueue<TickPtr> q;
        std::thread th;
        std::atomic<std::uint64_t> delivered{0};
    };

    static void run_reader(Reader& r) {
        TickPtr t;
        for (;;) {
            if (!r.q.pop_wait(t, std::chrono::milliseconds(100))) {
                if (r.q.closed() && r.q.size() == 0) break;
                continue;
            }
            try {
                r.handler(*t);
            } catch (const std::exception& e) {
                std::cerr << "[bus:" << r.name << "] handler error: " << e.what() << std::endl;
            }
            r.delivered.fetch_add(1, std::memory_order_relaxed);
            t.reset();
        }
    }

    std::size_t capacity_;
    std::vector<std::unique_ptr<Reader>> readers_;
    std::atomic<bool> running_{false};
};
