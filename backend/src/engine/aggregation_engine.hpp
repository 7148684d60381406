#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "md/tick.hpp"
#include "md/touch_book.hpp"
#include "engine/market_events.hpp"
#include "util/turn_sequencer.hpp"

// Default candle intervals, in seconds.
inline const std::vector<int> kDefaultKlineIntervals = {1, 10, 60, 300};

// Consumes canonical ticks and maintains, per (symbol, scope):
//  - best touch (per venue, and consolidated under "all")
//  - one open kline bucket per interval, epoch-aligned
//  - one EWMA per distinct half-life that has at least one subscriber
//
// State lives in per-symbol shards, each with its own mutex; shards are held in
// an arena (stable addresses) and found through an index under a shared_mutex.
// Derived events are collected under the shard lock and handed to the listener
// after the lock is released, in the order the shard produced them (a ticket
// is taken from the shard's TurnSequencer before unlocking).
class AggregationEngine {
public:
    using Listener = std::function<void(const MarketEvent&)>;

    explicit AggregationEngine(std::vector<int> kline_intervals_s = kDefaultKlineIntervals);

    // Must be set before ticks flow.
    void set_listener(Listener l) { listener_ = std::move(l); }

    void on_tick(const Tick& t);

    // Periodic boundary advance: closes every bucket whose window ended at or
    // before now_ns and opens the next (flat) one, so buckets stay time-complete.
    void advance(std::int64_t now_ns);

    // EWMA registrations are reference counted per (symbol, scope, half-life).
    void retain_ewma(const std::string& symbol, const std::string& scope, double half_life_s);
    void release_ewma(const std::string& symbol, const std::string& scope, double half_life_s);

    // Read API (copies taken under the shard lock)
    std::optional<BestTouch> best_touch(const std::string& symbol, const std::string& scope) const;
    std::optional<KlineBucket> kline(const std::string& symbol, const std::string& scope, int interval_s) const;
    std::optional<EwmaState> ewma(const std::string& symbol, const std::string& scope, double half_life_s) const;
    std::vector<std::string> symbols() const;

    const std::vector<int>& intervals() const noexcept { return intervals_; }
    std::uint64_t gaps() const noexcept { return gaps_.load(std::memory_order_relaxed); }
    std::uint64_t late_trades() const noexcept { return late_trades_.load(std::memory_order_relaxed); }

    // alpha = 2^(-(t - t0) / h); v' = alpha * v + (1 - alpha) * p
    static double ewma_step(double prev, std::int64_t prev_ts_ns,
                            double price, std::int64_t ts_ns, double half_life_s);

    // Epoch-aligned start of the bucket containing ts_ns.
    static std::int64_t bucket_start(std::int64_t ts_ns, int interval_s);

private:
    struct EwmaSlot {
        EwmaState state;
        std::size_t refs{0};
    };

    struct ScopeState {
        std::int64_t last_trade_ns{0};          // duplicate / out-of-order guard
        std::map<int, KlineBucket> klines;      // interval_s -> open bucket
        std::map<double, EwmaSlot> ewma;        // half-life -> state
    };

    struct SymbolShard {
        explicit SymbolShard(std::string s) : symbol(std::move(s)), touch(symbol) {}
        std::string symbol;
        mutable std::mutex m;
        TurnSequencer emit_order;
        TouchBook touch;
        std::unordered_map<std::string, ScopeState> scopes; // venue name or "all"
    };

    SymbolShard& shard(const std::string& symbol);
    SymbolShard* find_shard(const std::string& symbol) const;

    // -------- unlocked helpers (caller holds shard.m) --------
    void apply_quote_unlocked(SymbolShard& sh, const Tick& t, std::vector<MarketEvent>& out);
    void apply_trade_unlocked(SymbolShard& sh, const std::string& scope, const Tick& t,
                              std::vector<MarketEvent>& out);
    void update_kline_unlocked(const std::string& symbol, const std::string& scope, int interval_s,
                               ScopeState& st, const Tick& t, std::vector<MarketEvent>& out);
    static void close_through(const std::string& symbol, const std::string& scope, int interval_s,
                              KlineBucket& b, std::int64_t target_start_ns,
                              std::vector<MarketEvent>& out);

    void emit(SymbolShard& sh, std::uint64_t ticket, std::vector<MarketEvent>& evs);

    std::vector<int> intervals_;
    Listener listener_;

    mutable std::shared_mutex index_m_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::unique_ptr<SymbolShard>> shards_;

    std::atomic<std::uint64_t> gaps_{0};
    std::atomic<std::uint64_t> late_trades_{0};
};
