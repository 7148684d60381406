/*
Canonical market-data event shared by every venue adapter and both engines.
*/

#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

enum class TickKind : uint8_t
{
    Quote = 0, // best bid/ask update
    Trade = 1  // single print
};

struct Tick
{
    std::string venue;  // "binance", "okx"
    std::string symbol; // canonical "BTCUSDT"
    TickKind kind{TickKind::Quote};

    // Quote fields; a zero price means the venue did not quote that side.
    double bid{0}, bid_size{0};
    double ask{0}, ask_size{0};

    // Trade fields
    double trade_price{0}, trade_size{0};

    std::int64_t ts_ns{0};  // epoch ns: exchange event time, or receipt time
    bool after_gap{false};  // first tick after the feed reconnected
};

// Ticks are shared read-only between the bus readers.
using TickPtr = std::shared_ptr<const Tick>;

constexpr std::int64_t kNsPerSec = 1'000'000'000;
constexpr std::int64_t kNsPerMs = 1'000'000;

inline std::int64_t wall_clock_ns()
{
    using namespace std::chrono;
    return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
}
