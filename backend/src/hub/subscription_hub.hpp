#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "auth/token_verifier.hpp"
#include "common/errors.hpp"
#include "engine/aggregation_engine.hpp"
#include "engine/market_events.hpp"
#include "engine/order.hpp"
#include "hub/stream_spec.hpp"
#include "util/bounded_queue.hpp"

using OutboundFrame = std::shared_ptr<const std::string>;

// One client socket as the hub sees it: an id and a bounded outbound queue.
// The transport drains the queue; `wakeup` tells it there is something to send.
class ClientConnection {
public:
    using Wakeup = std::function<void()>;

    ClientConnection(std::uint64_t id, std::size_t capacity, Wakeup wakeup)
        : id_(id), q_(capacity, Backpressure::DropOldest), wakeup_(std::move(wakeup)) {}

    std::uint64_t id() const noexcept { return id_; }

    // Never blocks; on overflow the oldest queued frame is dropped.
    void enqueue(OutboundFrame f) {
        q_.push(std::move(f));
        if (wakeup_) wakeup_();
    }

    bool try_pop(OutboundFrame& out) { return q_.try_pop(out); }

    void close() { q_.close(); }

    std::uint64_t dropped() const noexcept { return q_.dropped(); }

private:
    std::uint64_t id_;
    BoundedQueue<OutboundFrame> q_;
    Wakeup wakeup_;
};

struct HubOptions {
    std::size_t outbound_capacity{1024};
    std::vector<std::string> symbols; // accepted symbols; empty = any
    std::vector<std::string> venues;  // accepted exchange scopes besides "all"; empty = any
};

// Routes derived market events and order updates to client connections.
//
// Subscriptions are resolved once into a StreamKey; routes_ maps each key to
// the connections that hold it. A frame is encoded once per event and shared
// by every recipient. All hub state sits behind one mutex; encoding and
// enqueueing happen after it is released.
//
// Client protocol (JSON text frames):
//   {"action":"auth","token":"..."}
//   {"action":"subscribe","stream":"klines","symbol":"BTCUSDT","exchange":"all","interval":"1m"}
//   {"action":"unsubscribe","stream":"klines","symbol":"BTCUSDT"}
class SubscriptionHub {
public:
    SubscriptionHub(AggregationEngine& agg, const ITokenVerifier& verifier, HubOptions opts);

    std::shared_ptr<ClientConnection> connect(ClientConnection::Wakeup wakeup);
    // Drops every subscription of the connection; others are untouched.
    void disconnect(std::uint64_t conn_id);

    // Inbound text frame from a client.
    void on_message(std::uint64_t conn_id, const std::string& text);

    // Direct API (the JSON protocol funnels into these).
    std::variant<std::string, EngineError> authenticate(std::uint64_t conn_id, const std::string& token);
    std::variant<StreamKey, EngineError> subscribe(std::uint64_t conn_id, const StreamSpec& spec);
    // Removes every subscription of (kind, symbol) held by the connection; returns how many.
    std::variant<std::size_t, EngineError> unsubscribe(std::uint64_t conn_id, StreamKind kind,
                                                       const std::string& symbol);

    // Listeners wired to the engines.
    void on_market_event(const MarketEvent& ev);
    void on_order_update(const Order& o);

    std::size_t connection_count() const;
    std::size_t subscriber_count(const StreamKey& key) const;
    std::uint64_t malformed() const noexcept { return malformed_.load(std::memory_order_relaxed); }

private:
    struct ConnState {
        std::shared_ptr<ClientConnection> conn;
        std::string user; // empty until auth succeeds
        std::vector<StreamKey> subs;
    };

    std::optional<EngineError> validate(const StreamKey& key) const;

    void route(const std::vector<StreamKey>& keys, const std::function<std::string()>& encode);
    void send_to(std::uint64_t conn_id, std::string frame);
    void send_error(std::uint64_t conn_id, const EngineError& err);

    // Caller holds m_.
    void remove_route_unlocked(const StreamKey& key, std::uint64_t conn_id);

    AggregationEngine& agg_;
    const ITokenVerifier& verifier_;
    HubOptions opts_;

    mutable std::mutex m_;
    std::unordered_map<std::uint64_t, ConnState> conns_;
    std::unordered_map<StreamKey, std::vector<std::uint64_t>, StreamKeyHash> routes_;
    std::unordered_map<std::string, std::vector<std::uint64_t>> by_user_;

    std::atomic<std::uint64_t> next_conn_id_{1};
    std::atomic<std::uint64_t> malformed_{0};
};
