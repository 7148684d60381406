#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "md/tick.hpp"

// Where a feed delivers its canonical ticks (the tick bus).
using TickSink = std::function<void(TickPtr)>;

struct FeedStats {
    std::string venue;
    std::uint64_t frames{0};     // raw text frames received
    std::uint64_t ticks{0};      // canonical ticks produced
    std::uint64_t malformed{0};  // frames the parser rejected
    std::uint64_t dropped{0};    // frames lost to a full raw ring
    std::uint64_t reconnects{0};
    bool stale{true};            // link currently down (or never up)
};

struct IVenueFeed {
    virtual ~IVenueFeed() = default;

    // `venue_symbols` must be formatted for the venue (use SymbolCodec::to_venue).
    virtual void start_ws(const std::vector<std::string>& venue_symbols, unsigned short port) = 0;
    virtual void stop() = 0;

    virtual const std::string& venue() const = 0; // "binance", "okx"
    virtual bool stale() const = 0;
    virtual FeedStats stats() const = 0;

    // Runs one raw frame through the parser on the caller's thread, as the
    // consumer loop would. For replaying captured traffic.
    virtual void ingest(const std::string& raw) = 0;
};
