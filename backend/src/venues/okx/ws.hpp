#pragma once

#include <string>
#include <vector>

#include "venues/market_ws.hpp"

// OKX public v5 socket, subscribed to tickers + trades per instrument.
// Symbols are OKX instrument ids ("BTC-USDT").
class OkxWs : public IMarketWs {
public:
    static constexpr unsigned short kDefaultPort = 8443;

    OkxWs(std::vector<std::string> inst_ids, OnMsg cb, OnLink link = {});
    ~OkxWs();
    OkxWs(const OkxWs &) = delete;
    OkxWs &operator=(const OkxWs &) = delete;

    void start(unsigned short port = kDefaultPort) override;
    void stop() noexcept override;

    // {"op":"subscribe","args":[{"channel":"tickers","instId":"BTC-USDT"},...]}
    static std::string build_subscribe(const std::vector<std::string> &inst_ids);

private:
    struct Impl;
    Impl *impl_;
};
