#pragma once

#include "venues/venue_api.hpp"

class BinanceVenueApi final : public IVenueApi {
public:
    std::string name() const override { return "binance"; }

    // Stablecoin-quoted spot only.
    std::vector<std::string> quote_assets() const override { return {"USDT", "USDC"}; }
};
