#include "venues/binance/ws.hpp"
#include "ws/tls_ws_client.hpp"

#include <utility>

struct BinanceWs::Impl
{
    TlsWsClient client;

    Impl(const std::vector<std::string> &symbols, OnMsg cb, OnLink link)
    : client(TlsWsClient::Options{"binance-ws", "stream.binance.com", build_target(symbols), ""},
             std::move(cb), std::move(link))
    {}
};

std::string BinanceWs::build_target(const std::vector<std::string> &stream_symbols)
{
    std::string target = "/stream?streams=";
    bool first = true;
    for (const auto &s : stream_symbols)
    {
        if (!first) target += "/";
        first = false;
        target += s + "@bookTicker/" + s + "@trade";
    }
    return target;
}

BinanceWs::BinanceWs(std::vector<std::string> stream_symbols, OnMsg cb, OnLink link)
    : impl_(new Impl(stream_symbols, std::move(cb), std::move(link))) {}
BinanceWs::~BinanceWs() { delete impl_; }

void BinanceWs::start(unsigned short port) { impl_->client.run(port); }
void BinanceWs::stop() noexcept { impl_->client.stop(); }
