#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "auth/jwt.hpp"
#include "auth/user_store.hpp"
#include "engine/aggregation_engine.hpp"
#include "engine/matching_engine.hpp"
#include "hub/subscription_hub.hpp"
#include "pipeline/tick_bus.hpp"
#include "server/config.hpp"
#include "server/feed_manager.hpp"
#include "server/http_routes.hpp"
#include "server/http_server.hpp"
#include "server/pairs_config.hpp"
#include "server/state_persister.hpp"
#include "server/venues_config.hpp"
#include "server/ws_session.hpp"
#include "storage/state_store.hpp"
#include "util/periodic_task.hpp"
#include "venues/venue_registry.hpp"

using tcp = boost::asio::ip::tcp;

namespace {

std::unique_ptr<IStateStore> open_store(const Settings& settings) {
    if (!settings.state_db_url.empty()) {
        try {
            auto store = make_postgres_store(settings.state_db_url);
            std::cout << "[setup] Database connected successfully" << std::endl;
            return store;
        } catch (const std::exception& e) {
            std::cerr << "[setup] Warning: Failed to initialize Postgres: " << e.what() << std::endl;
            std::cerr << "[setup] Falling back to " << settings.state_path << std::endl;
        }
    }
    return make_json_file_store(settings.state_path);
}

std::vector<FeedManager::VenueRuntime> build_venues() {
    const auto& registry = VenueRegistry::instance();
    std::vector<FeedManager::VenueRuntime> venues;
    venues.reserve(kVenueConfigs.size());
    for (const auto& venue_cfg : kVenueConfigs) {
        const VenueFactory* factory = registry.find(venue_cfg.name);
        if (!factory) {
            std::cerr << "[setup] Unknown venue '" << venue_cfg.name
                      << "'; skipping." << std::endl;
            continue;
        }

        auto api = factory->make_api ? factory->make_api() : nullptr;
        if (!api) {
            std::cerr << "[setup] Venue '" << venue_cfg.name
                      << "' did not provide an API implementation; skipping."
                      << std::endl;
            continue;
        }

        venues.push_back(FeedManager::VenueRuntime{venue_cfg.name, factory, std::move(api)});
    }
    return venues;
}

} // namespace

int main() {
    load_env_file();

    Settings settings;
    try {
        settings = load_settings();
    } catch (const std::exception& e) {
        std::cerr << "[setup] " << e.what() << std::endl;
        return 1;
    }

    // Durable state first: nothing may trade before it is loaded.
    std::unique_ptr<IStateStore> store = open_store(settings);
    UserStore users;
    MatchingEngine engine(kCanonicalPairs);
    std::optional<StateSnapshot> loaded;
    try {
        loaded = store->load();
    } catch (const std::exception& e) {
        std::cerr << "[setup] cannot load state from " << store->describe() << ": " << e.what() << std::endl;
        return 1;
    }
    if (loaded) {
        users.load(loaded->users);
        engine.load(loaded->engine);
        std::cout << "[setup] state loaded from " << store->describe() << " ("
                  << loaded->users.size() << " users)" << std::endl;
    } else {
        std::cout << "[setup] no saved state in " << store->describe() << std::endl;
    }

    StatePersister persister(*store, users, engine,
                             std::chrono::duration_cast<std::chrono::milliseconds>(settings.snapshot_interval));
    if (loaded) persister.seed(*loaded);

    // Market data path: feeds -> bus -> {aggregation, matching} -> hub
    AggregationEngine agg;
    JwtCodec jwt(settings.secret_key, settings.jwt_ttl);
    RegisteredUserVerifier verifier(jwt, users);

    std::vector<std::string> venue_names;
    for (const auto& v : kVenueConfigs) venue_names.push_back(v.name);
    SubscriptionHub hub(agg, verifier, HubOptions{settings.outbound_queue, kCanonicalPairs, venue_names});

    agg.set_listener([&hub](const MarketEvent& ev) { hub.on_market_event(ev); });
    engine.set_order_listener([&hub](const Order& o) { hub.on_order_update(o); });

    TickBus bus;
    bus.add_reader("aggregation", [&agg](const Tick& t) { agg.on_tick(t); });
    bus.add_reader("matching", [&engine](const Tick& t) { engine.on_tick(t); });
    bus.start();

    PeriodicTask clock("agg-clock", std::chrono::seconds(1), [&agg] { agg.advance(wall_clock_ns()); });
    clock.start();

    const std::int64_t retention_ns =
        std::chrono::duration_cast<std::chrono::nanoseconds>(settings.order_retention).count();
    PeriodicTask pruner("retention", std::chrono::minutes(10), [&engine, retention_ns] {
        const std::size_t n = engine.prune_terminal(wall_clock_ns() - retention_ns);
        if (n > 0) std::cout << "[engine] pruned " << n << " terminal orders" << std::endl;
    });
    if (retention_ns > 0) pruner.start();
    persister.start();

    FeedManager feeds(build_venues(), kCanonicalPairs);
    feeds.start_all([&bus](TickPtr t) { bus.publish(std::move(t)); });

    ApiContext api{engine, users, jwt, kCanonicalPairs, assets_of(kCanonicalPairs)};

    int exit_code = 0;
    {
        // Declared after the hub so pending sessions are destroyed first.
        const unsigned n_threads = std::max(2u, std::thread::hardware_concurrency());
        boost::asio::io_context ioc{static_cast<int>(n_threads)};

        // REST handlers (PBKDF2 on register/login) run off the I/O threads.
        boost::asio::thread_pool api_pool{2};

        try {
            tcp::endpoint ep{boost::asio::ip::make_address("0.0.0.0"), settings.port};
            HttpServer server{ioc, ep,
                [&api](auto const& req, auto& res) { handle_request(api, req, res); },
                [&hub](tcp::socket s, http::request<http::string_body> req) {
                    std::make_shared<WsSession>(std::move(s), hub)->run(std::move(req));
                },
                &api_pool};
            server.run();

            boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
            signals.async_wait([&](boost::beast::error_code, int sig) {
                std::cout << "[setup] signal " << sig << ", shutting down" << std::endl;
                server.close();
                ioc.stop();
            });

            std::cout << "[setup] HTTP and WebSocket listening on :" << settings.port << std::endl;

            std::vector<std::thread> workers;
            workers.reserve(n_threads - 1);
            for (unsigned i = 0; i + 1 < n_threads; ++i) workers.emplace_back([&ioc] { ioc.run(); });
            ioc.run();
            for (auto& w : workers) w.join();
            api_pool.join();
        } catch (const std::exception& e) {
            std::cerr << "[setup] server error: " << e.what() << std::endl;
            exit_code = 1;
        }
    }

    feeds.shutdown();
    clock.stop();
    pruner.stop();
    bus.stop();
    persister.stop();
    std::cout << "[setup] stopped (" << engine.fills() << " fills, "
              << persister.saves() << " saves)" << std::endl;
    return exit_code;
}
