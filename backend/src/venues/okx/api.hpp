#pragma once

#include "venues/venue_api.hpp"

class OkxVenueApi final : public IVenueApi {
public:
    std::string name() const override { return "okx"; }

    std::vector<std::string> quote_assets() const override { return {"USDT", "USDC", "USD"}; }
};
