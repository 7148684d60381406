#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "tick.hpp"

// Best bid/ask for one symbol in one scope (a venue, or consolidated "all").
struct BestTouch {
    double bid{0}, bid_size{0};
    double ask{0}, ask_size{0};
    std::string bid_venue; // venue(s) quoting the best bid
    std::string ask_venue;
    std::int64_t updated_at_ns{0};

    bool has_bid() const noexcept { return bid > 0.0; }
    bool has_ask() const noexcept { return ask > 0.0; }
};

// Per-symbol top-of-book across venues.
// - apply() replaces one venue's quote (zero price => side unknown for that venue).
// - consolidated() takes max(bid) / min(ask) over venues that have quoted the
//   side; sizes at an identical best price are summed across venues.
// - Not thread-safe: the owning shard serializes access.
class TouchBook {
public:
    explicit TouchBook(std::string symbol = {}) : symbol_(std::move(symbol)) {}

    // Returns false for non-quote ticks or ticks for another symbol.
    bool apply(const Tick& t) {
        if (t.kind != TickKind::Quote) return false;
        if (!symbol_.empty() && t.symbol != symbol_) return false;

        BestTouch& bt = venues_[t.venue];
        bt.bid      = t.bid > 0.0 ? t.bid : 0.0;
        bt.bid_size = t.bid > 0.0 ? t.bid_size : 0.0;
        bt.ask      = t.ask > 0.0 ? t.ask : 0.0;
        bt.ask_size = t.ask > 0.0 ? t.ask_size : 0.0;
        bt.bid_venue = bt.has_bid() ? t.venue : std::string{};
        bt.ask_venue = bt.has_ask() ? t.venue : std::string{};
        bt.updated_at_ns = t.ts_ns;
        return true;
    }

    std::optional<BestTouch> venue(const std::string& venue) const {
        auto it = venues_.find(venue);
        if (it == venues_.end()) return std::nullopt;
        return it->second;
    }

    BestTouch consolidated() const {
        BestTouch out;
        for (const auto& [name, bt] : venues_) {
            if (bt.updated_at_ns > out.updated_at_ns) out.updated_at_ns = bt.updated_at_ns;

            if (bt.has_bid()) {
                if (!out.has_bid() || bt.bid > out.bid) {
                    out.bid = bt.bid;
                    out.bid_size = bt.bid_size;
                    out.bid_venue = name;
                } else if (bt.bid == out.bid) {
                    out.bid_size += bt.bid_size;
                    out.bid_venue += "," + name;
                }
            }
            if (bt.has_ask()) {
                if (!out.has_ask() || bt.ask < out.ask) {
                    out.ask = bt.ask;
                    out.ask_size = bt.ask_size;
                    out.ask_venue = name;
                } else if (bt.ask == out.ask) {
                    out.ask_size += bt.ask_size;
                    out.ask_venue += "," + name;
                }
            }
        }
        return out;
    }

    const std::map<std::string, BestTouch>& venues() const noexcept { return venues_; }
    const std::string& symbol() const noexcept { return symbol_; }
    bool empty() const noexcept { return venues_.empty(); }

private:
    std::string symbol_;
    std::map<std::string, BestTouch> venues_; // only venues that have quoted
};
