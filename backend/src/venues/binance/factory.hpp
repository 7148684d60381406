#pragma once

#include "venues/venue_factory.hpp"
#include "pipeline/venue_feed.hpp"
#include "venues/binance/parser.hpp"
#include "venues/binance/ws.hpp"
#include "venues/binance/api.hpp"
#include "md/symbol_codec.hpp"

inline VenueFactory make_binance_factory() {
    VenueFactory factory;
    factory.name = "binance";
    factory.port = BinanceWs::kDefaultPort;
    factory.make_feed = [](TickSink sink) -> std::shared_ptr<IVenueFeed> {
        using Feed = VenueFeed<BinanceWs, BinanceTickParser>;
        return std::make_shared<Feed>("binance", std::move(sink));
    };
    factory.make_api = []() -> std::unique_ptr<IVenueApi> {
        return std::make_unique<BinanceVenueApi>();
    };
    factory.to_venue_symbol = [](const std::string& canonical) {
        return SymbolCodec::to_venue("binance", canonical);
    };
    return factory;
}
