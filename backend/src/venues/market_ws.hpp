#pragma once

#include <functional>
#include <string>
#include <vector>

// Interface for a market-data WebSocket connector covering a set of symbols.
// start() blocks running the connect/read/reconnect loop until stop().
// stop() requests a graceful close; safe from any thread.
// OnMsg(json): called for each text frame from the exchange.
// OnLink(up): called on every connect (true) and disconnect (false).
struct IMarketWs {
    using OnMsg = std::function<void(const std::string &)>;
    using OnLink = std::function<void(bool up)>;
    virtual ~IMarketWs() = default;
    virtual void start(unsigned short port = 443) = 0;
    virtual void stop() = 0;
};
