#pragma once

#include <string>
#include <vector>

#include "venues/market_ws.hpp"

// Binance combined stream: bookTicker + trade for every symbol on one socket.
// Symbols are in Binance stream format ("btcusdt").
class BinanceWs : public IMarketWs {
public:
    static constexpr unsigned short kDefaultPort = 9443;

    BinanceWs(std::vector<std::string> stream_symbols, OnMsg cb, OnLink link = {});
    ~BinanceWs();
    BinanceWs(const BinanceWs &) = delete;
    BinanceWs &operator=(const BinanceWs &) = delete;

    void start(unsigned short port = kDefaultPort) override;
    void stop() noexcept override;

    // "/stream?streams=btcusdt@bookTicker/btcusdt@trade/..."
    static std::string build_target(const std::vector<std::string> &stream_symbols);

private:
    struct Impl;
    Impl *impl_;
};
