#pragma once
#include <string>
#include <utility>

struct SymbolCodec
{
    // Convert canonical ("BTCUSDT") to venue format ("btcusdt" on Binance streams, "BTC-USDT" on OKX).
    static std::string to_venue(const std::string &venue, const std::string &canonical);
    // Convert venue format ("BTC-USDT", "btcusdt") to canonical ("BTCUSDT").
    static std::string to_canonical(const std::string &venue, const std::string &venue_sym);
    // Split canonical into (base, quote). Recognizes USDT/USDC/USD quotes, else a 3-letter quote.
    static std::pair<std::string, std::string> split(const std::string &canonical);
};
