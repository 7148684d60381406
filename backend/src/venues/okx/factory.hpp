#pragma once

#include "venues/venue_factory.hpp"
#include "pipeline/venue_feed.hpp"
#include "venues/okx/parser.hpp"
#include "venues/okx/ws.hpp"
#include "venues/okx/api.hpp"
#include "md/symbol_codec.hpp"

inline VenueFactory make_okx_factory() {
    VenueFactory factory;
    factory.name = "okx";
    factory.port = OkxWs::kDefaultPort;
    factory.make_feed = [](TickSink sink) -> std::shared_ptr<IVenueFeed> {
        using Feed = VenueFeed<OkxWs, OkxTickParser>;
        return std::make_shared<Feed>("okx", std::move(sink));
    };
    factory.make_api = []() -> std::unique_ptr<IVenueApi> {
        return std::make_unique<OkxVenueApi>();
    };
    factory.to_venue_symbol = [](const std::string& canonical) {
        return SymbolCodec::to_venue("okx", canonical);
    };
    return factory;
}
