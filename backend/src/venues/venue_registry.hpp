#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "venue_factory.hpp"
#include "binance/factory.hpp"
#include "okx/factory.hpp"

// Name -> factory for every venue this build can connect to.
class VenueRegistry {
public:
    static const VenueRegistry& instance() {
        static VenueRegistry registry;
        return registry;
    }

    const VenueFactory* find(std::string_view name) const {
        auto it = factories_.find(std::string(name));
        if (it == factories_.end()) {
            return nullptr;
        }
        return &it->second;
    }

private:
    VenueRegistry() {
        register_factory(make_binance_factory());
        register_factory(make_okx_factory());
    }

    void register_factory(VenueFactory factory) {
        if (factory.name.empty() ||
            !factory.make_feed ||
            !factory.make_api ||
            !factory.to_venue_symbol) {
            return;
        }
        factories_.emplace(factory.name, std::move(factory));
    }

    std::unordered_map<std::string, VenueFactory> factories_;
};
