#pragma once
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "util/spsc_ring.hpp"
#include "pipeline/venue_feed_iface.hpp"
#include "md/tick_parser.hpp"

// VenueFeed is parameterized by concrete Ws type and concrete Parser type.
// Each VenueFeed owns:
//  - a WS connector covering all of the venue's symbols (producer thread in ws_thread_)
//  - an SPSC ring for raw messages
//  - a consumer thread that parses frames into canonical ticks and hands them to the sink
//
// Ordering: frames are parsed in receipt order, so ticks from one connection
// reach the sink in the order the exchange sent them.
// Link state: the WS thread pushes an empty marker frame into the ring on
// every reconnect; the consumer flags the next tick it produces `after_gap`.
// A full ring drops the incoming frame (the producer may not pop).
template <typename WsT, typename ParserT, std::size_t QueuePow2 = 4096>
class VenueFeed final : public IVenueFeed {
public:
    VenueFeed(std::string venue_name, TickSink sink)
    : venue_(std::move(venue_name))
    , sink_(std::move(sink))
    , running_(false) {}

    ~VenueFeed() override { stop(); }

    void start_ws(const std::vector<std::string>& venue_symbols, unsigned short port) override {
        if (running_.exchange(true)) return;

        ws_ = std::make_unique<WsT>(
            venue_symbols,
            [this](const std::string& raw) {
                frames_.fetch_add(1, std::memory_order_relaxed);
                if (raw.empty()) return; // the empty frame is reserved for the gap marker
                std::string msg(raw);
                if (!queue_.try_push(std::move(msg))) {
                    dropped_.fetch_add(1, std::memory_order_relaxed);
                }
            },
            [this](bool up) { on_link(up); });

        // Start consumer thread (one per venue)
        consumer_ = std::thread([this] { consume_loop(); });

        // Start the WS on its own thread
        ws_thread_ = std::thread([this, port] { ws_->start(port); });
    }

    void stop() override {
        if (!running_.exchange(false)) return;
        if (ws_) ws_->stop();
        if (ws_thread_.joinable()) ws_thread_.join();
        if (consumer_.joinable()) consumer_.join();
        stale_.store(true, std::memory_order_relaxed);
    }

    const std::string& venue() const override { return venue_; }
    bool stale() const override { return stale_.load(std::memory_order_relaxed); }

    FeedStats stats() const override {
        FeedStats s;
        s.venue = venue_;
        s.frames = frames_.load(std::memory_order_relaxed);
        s.ticks = ticks_.load(std::memory_order_relaxed);
        s.malformed = malformed_.load(std::memory_order_relaxed);
        s.dropped = dropped_.load(std::memory_order_relaxed);
        s.reconnects = reconnects_.load(std::memory_order_relaxed);
        s.stale = stale_.load(std::memory_order_relaxed);
        return s;
    }

    // Not for use while the consumer thread is running.
    void ingest(const std::string& raw) override {
        std::vector<Tick> buf;
        handle(replay_parser_, buf, raw);
    }

private:
    void on_link(bool up) {
        if (up) {
            stale_.store(false, std::memory_order_relaxed);
            if (ever_up_) {
                reconnects_.fetch_add(1, std::memory_order_relaxed);
                std::string marker;
                if (!queue_.try_push(std::move(marker))) {
                    // Ring full: the gap flag is raised directly instead.
                    gap_pending_.store(true, std::memory_order_relaxed);
                }
            }
            ever_up_ = true;
        } else {
            stale_.store(true, std::memory_order_relaxed);
            std::cerr << "[feed] " << venue_ << " link down; marked stale" << std::endl;
        }
    }

    void handle(ParserT& parser, std::vector<Tick>& ticks, const std::string& raw) {
        if (raw.empty()) {
            gap_pending_.store(true, std::memory_order_relaxed);
            return;
        }
        ticks.clear();
        const ParseResult r = parser.parse(raw, ticks);
        if (r == ParseResult::Malformed) {
            const auto n = malformed_.fetch_add(1, std::memory_order_relaxed) + 1;
            if ((n & (n - 1)) == 0) { // 1, 2, 4, 8... keeps the log readable under a flood
                std::cerr << "[feed] " << venue_ << " malformed frame #" << n << ": "
                          << raw.substr(0, 160) << std::endl;
            }
        }
        for (auto& t : ticks) {
            if (gap_pending_.exchange(false, std::memory_order_relaxed)) t.after_gap = true;
            ticks_.fetch_add(1, std::memory_order_relaxed);
            if (sink_) sink_(std::make_shared<const Tick>(std::move(t)));
        }
    }

    /*
     * Main consumer loop: try_pop from queue, parse, forward ticks.
    */
    void consume_loop() {
        ParserT parser;
        std::vector<Tick> ticks;
        std::string raw;

        while (running_.load(std::memory_order_relaxed)) {
            if (!queue_.try_pop(raw)) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                continue;
            }
            handle(parser, ticks, raw);
        }

        // drain on shutdown
        while (queue_.try_pop(raw)) {
            handle(parser, ticks, raw);
        }
    }

    // Identity
    std::string venue_;
    TickSink sink_;

    // Per-venue components
    SpscRing<std::string, QueuePow2> queue_;
    std::unique_ptr<WsT> ws_;
    std::thread ws_thread_;
    std::thread consumer_;
    std::atomic<bool> running_;

    ParserT replay_parser_;

    bool ever_up_{false}; // WS thread only
    std::atomic<bool> stale_{true};
    std::atomic<bool> gap_pending_{false};

    std::atomic<std::uint64_t> frames_{0};
    std::atomic<std::uint64_t> ticks_{0};
    std::atomic<std::uint64_t> malformed_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> reconnects_{0};
};
