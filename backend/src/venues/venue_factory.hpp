#pragma once

#include <functional>
#include <memory>
#include <string>

#include "pipeline/venue_feed_iface.hpp"

class IVenueApi;

struct VenueFactory {
    std::string name;
    unsigned short port{443};
    std::function<std::shared_ptr<IVenueFeed>(TickSink sink)> make_feed;
    std::function<std::unique_ptr<IVenueApi>()> make_api;
    std::function<std::string(const std::string& canonical)> to_venue_symbol;
};
