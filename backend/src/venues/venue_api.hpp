#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include "md/symbol_codec.hpp"

// Static facts about a venue's spot listings.
class IVenueApi {
public:
    virtual ~IVenueApi() = default;

    virtual std::string name() const = 0;

    // Quote assets the venue lists spot pairs against.
    virtual std::vector<std::string> quote_assets() const = 0;

    bool supports_pair(const std::string& canonical) const {
        auto [base, quote] = SymbolCodec::split(canonical);
        if (base.empty()) return false;
        const auto quotes = quote_assets();
        return std::find(quotes.begin(), quotes.end(), quote) != quotes.end();
    }
};
