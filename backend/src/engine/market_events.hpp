#pragma once
#include <cstdint>
#include <string>
#include <variant>

#include "md/touch_book.hpp"

// Scope name for the cross-venue consolidated view.
inline const std::string kAllScope = "all";

// OHLCV bucket aligned to the epoch: [start_ns, end_ns).
struct KlineBucket {
    double open{0}, high{0}, low{0}, close{0};
    double volume{0};
    std::int64_t start_ns{0};
    std::int64_t end_ns{0};
    bool closed{false};
};

// Time-decayed average; value is meaningful once initialized.
struct EwmaState {
    double value{0};
    std::int64_t last_ts_ns{0};
    bool initialized{false};
};

// -------- derived events emitted by the aggregation engine --------

struct BestTouchUpdated {
    std::string symbol;
    std::string scope; // venue or "all"
    BestTouch touch;
};

struct TradePassThrough {
    std::string symbol;
    std::string venue;
    double price{0};
    double size{0};
    std::int64_t ts_ns{0};
};

struct KlineUpdated {
    std::string symbol;
    std::string scope;
    int interval_s{0};
    KlineBucket bucket;
};

struct KlineClosed {
    std::string symbol;
    std::string scope;
    int interval_s{0};
    KlineBucket bucket; // bucket.closed == true
};

struct EwmaUpdated {
    std::string symbol;
    std::string scope;
    double half_life_s{0};
    EwmaState state;
};

using MarketEvent = std::variant<BestTouchUpdated, TradePassThrough, KlineUpdated, KlineClosed, EwmaUpdated>;
