#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pipeline/venue_feed_iface.hpp"
#include "venues/venue_api.hpp"
#include "venues/venue_factory.hpp"

// Owns one live feed per venue. Each feed covers every configured pair that
// venue supports and delivers ticks into the shared sink (the tick bus).
class FeedManager {
public:
    // Represents a venue, and its API instance for use in FeedManager
    struct VenueRuntime {
        std::string name;
        const VenueFactory* factory{nullptr};
        std::unique_ptr<IVenueApi> api;
    };

    // FeedManager config option
    struct Options {
        // Period of the "[feed] stats" log line; zero disables it.
        std::chrono::seconds stats_interval{std::chrono::seconds(60)};
    };

    FeedManager(std::vector<VenueRuntime> venues,
                std::vector<std::string> canonical_pairs)
        : FeedManager(std::move(venues), std::move(canonical_pairs), Options{}) {}

    FeedManager(std::vector<VenueRuntime> venues,
                std::vector<std::string> canonical_pairs,
                Options opts)
        : venues_(std::move(venues)),
          canonical_pairs_(std::move(canonical_pairs)),
          opts_(std::move(opts)) {
        build_support_index();
    }

    ~FeedManager() { shutdown(); }

    // Starts one feed per venue that supports at least one configured pair.
    void start_all(TickSink sink) {
        std::lock_guard<std::mutex> lk(m_);
        if (!feeds_.empty()) return;

        for (const auto& venue : venues_) {
            auto sit = pairs_by_venue_.find(venue.name);
            if (sit == pairs_by_venue_.end() || sit->second.empty()) {
                std::cout << "[feed] Venue '" << venue.name
                          << "' supports none of the configured pairs; not started."
                          << std::endl;
                continue;
            }

            auto feed = venue.factory->make_feed
                ? venue.factory->make_feed(sink)
                : nullptr;
            if (!feed) {
                std::cerr << "[setup] Venue '" << venue.name
                          << "' failed to create feed; skipping."
                          << std::endl;
                continue;
            }

            std::vector<std::string> venue_symbols;
            venue_symbols.reserve(sit->second.size());
            for (const auto& pair : sit->second) {
                venue_symbols.push_back(venue.factory->to_venue_symbol
                    ? venue.factory->to_venue_symbol(pair)
                    : pair);
            }
            feed->start_ws(venue_symbols, venue.factory->port);
            feeds_.push_back(feed);

            std::cout << "[feed] Venue '" << venue.name << "' streaming "
                      << venue_symbols.size() << " pair(s)." << std::endl;
        }

        if (opts_.stats_interval > std::chrono::seconds::zero() && !feeds_.empty()) {
            running_.store(true, std::memory_order_relaxed);
            stats_thread_ = std::thread([this] { stats_loop(); });
        }
    }

    std::vector<FeedStats> stats() const {
        std::lock_guard<std::mutex> lk(m_);
        std::vector<FeedStats> out;
        out.reserve(feeds_.size());
        for (const auto& f : feeds_) out.push_back(f->stats());
        return out;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(wait_m_);
            running_.store(false, std::memory_order_relaxed);
        }
        wait_cv_.notify_all();
        if (stats_thread_.joinable()) stats_thread_.join();

        std::vector<std::shared_ptr<IVenueFeed>> to_stop;
        {
            std::lock_guard<std::mutex> lk(m_);
            to_stop.swap(feeds_);
        }
        for (auto& feed : to_stop) {
            if (feed) feed->stop();
        }
    }

private:
    void build_support_index() {
        for (const auto& pair : canonical_pairs_) {
            bool any = false;
            for (const auto& venue : venues_) {
                if (!venue.factory || !venue.api) continue;
                if (venue.api->supports_pair(pair)) {
                    pairs_by_venue_[venue.name].push_back(pair);
                    any = true;
                }
            }
            if (!any) {
                std::cout << "[feed] Pair '" << pair
                          << "' is not supported by any venue and will be ignored."
                          << std::endl;
            }
        }
    }

    // Background loop that periodically logs per-venue counters
    void stats_loop() {
        std::unique_lock<std::mutex> lk(wait_m_);
        while (running_.load(std::memory_order_relaxed)) {
            wait_cv_.wait_for(lk, opts_.stats_interval,
                              [this] { return !running_.load(std::memory_order_relaxed); });
            if (!running_.load(std::memory_order_relaxed)) break;

            for (const auto& s : stats()) {
                std::cout << "[feed] stats " << s.venue
                          << " frames=" << s.frames
                          << " ticks=" << s.ticks
                          << " malformed=" << s.malformed
                          << " dropped=" << s.dropped
                          << " reconnects=" << s.reconnects
                          << (s.stale ? " STALE" : "")
                          << std::endl;
            }
        }
    }

    std::vector<VenueRuntime> venues_;
    std::vector<std::string> canonical_pairs_;
    std::unordered_map<std::string, std::vector<std::string>> pairs_by_venue_;
    Options opts_;

    mutable std::mutex m_;
    std::vector<std::shared_ptr<IVenueFeed>> feeds_;

    std::mutex wait_m_;
    std::condition_variable wait_cv_;
    std::atomic<bool> running_{false};
    std::thread stats_thread_;
};
