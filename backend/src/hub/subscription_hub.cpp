#include "hub/subscription_hub.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

#include <nlohmann/json.hpp>

#include "util/json_encode.hpp"

using json = nlohmann::json;

namespace {

std::string upper(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}

std::string lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// Builds a StreamSpec from a subscribe frame. Throws json::exception on
// missing/mistyped fields.
std::variant<StreamSpec, EngineError> spec_from_json(const json& j) {
    const auto kind = parse_stream_kind(j.at("stream").get<std::string>());
    if (!kind) return EngineError{ErrorCode::Malformed, "unknown stream"};

    const std::string symbol = upper(j.at("symbol").get<std::string>());
    const std::string scope = lower(j.value("exchange", kAllScope));

    switch (*kind) {
        case StreamKind::BestTouch:
            return StreamSpec{BestTouchSpec{symbol, scope}};
        case StreamKind::Trades:
            return StreamSpec{TradesSpec{symbol, scope}};
        case StreamKind::Klines: {
            if (!j.contains("interval")) return EngineError{ErrorCode::Malformed, "interval is required for klines"};
            const json& iv = j.at("interval");
            std::optional<int> interval_s;
            if (iv.is_string()) interval_s = parse_interval_label(iv.get<std::string>());
            else if (iv.is_number_integer()) interval_s = iv.get<int>();
            if (!interval_s) return EngineError{ErrorCode::Malformed, "bad interval"};
            return StreamSpec{KlineSpec{symbol, scope, *interval_s}};
        }
        case StreamKind::Ewma: {
            if (!j.contains("half_life")) return EngineError{ErrorCode::Malformed, "half_life is required for ewma"};
            return StreamSpec{EwmaSpec{symbol, scope, j.at("half_life").get<double>()}};
        }
    }
    return EngineError{ErrorCode::Malformed, "unknown stream"};
}

json describe(const StreamKey& key) {
    json out = {
        {"stream", to_cstr(key.kind)},
        {"symbol", key.symbol},
        {"exchange", key.scope},
    };
    if (key.kind == StreamKind::Klines) out["interval"] = interval_label(static_cast<int>(key.param));
    if (key.kind == StreamKind::Ewma) out["half_life"] = key.param;
    return out;
}

} // namespace

SubscriptionHub::SubscriptionHub(AggregationEngine& agg, const ITokenVerifier& verifier, HubOptions opts)
    : agg_(agg), verifier_(verifier), opts_(std::move(opts)) {}

// ---------------------------------------------------------------------------
// connections
// ---------------------------------------------------------------------------

std::shared_ptr<ClientConnection> SubscriptionHub::connect(ClientConnection::Wakeup wakeup) {
    const std::uint64_t id = next_conn_id_.fetch_add(1, std::memory_order_relaxed);
    auto conn = std::make_shared<ClientConnection>(id, opts_.outbound_capacity, std::move(wakeup));
    {
        std::lock_guard<std::mutex> lk(m_);
        conns_[id].conn = conn;
    }
    std::cout << "[hub] connection " << id << " opened" << std::endl;
    return conn;
}

void SubscriptionHub::disconnect(std::uint64_t conn_id) {
    std::shared_ptr<ClientConnection> conn;
    std::size_t n_subs = 0;
    {
        std::lock_guard<std::mutex> lk(m_);
        auto it = conns_.find(conn_id);
        if (it == conns_.end()) return;
        ConnState& st = it->second;

        for (const auto& key : st.subs) {
            remove_route_unlocked(key, conn_id);
            if (key.kind == StreamKind::Ewma) agg_.release_ewma(key.symbol, key.scope, key.param);
        }
        n_subs = st.subs.size();

        if (!st.user.empty()) {
            auto uit = by_user_.find(st.user);
            if (uit != by_user_.end()) {
                auto& ids = uit->second;
                ids.erase(std::remove(ids.begin(), ids.end(), conn_id), ids.end());
                if (ids.empty()) by_user_.erase(uit);
            }
        }
        conn = std::move(st.conn);
        conns_.erase(it);
    }
    conn->close();
    std::cout << "[hub] connection " << conn_id << " closed (" << n_subs
              << " subscriptions, " << conn->dropped() << " frames dropped)" << std::endl;
}

std::size_t SubscriptionHub::connection_count() const {
    std::lock_guard<std::mutex> lk(m_);
    return conns_.size();
}

std::size_t SubscriptionHub::subscriber_count(const StreamKey& key) const {
    std::lock_guard<std::mutex> lk(m_);
    auto it = routes_.find(key);
    return it == routes_.end() ? 0 : it->second.size();
}

// ---------------------------------------------------------------------------
// client protocol
// ---------------------------------------------------------------------------

void SubscriptionHub::on_message(std::uint64_t conn_id, const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        send_error(conn_id, EngineError{ErrorCode::Malformed, "invalid JSON"});
        return;
    }

    try {
        const std::string action = j.value("action", std::string{});

        if (action == "auth") {
            auto r = authenticate(conn_id, j.at("token").get<std::string>());
            if (auto* err = std::get_if<EngineError>(&r)) {
                send_error(conn_id, *err);
                return;
            }
            json resp = {{"type", "auth"}, {"status", "ok"}, {"username", std::get<std::string>(r)}};
            send_to(conn_id, resp.dump());
            return;
        }

        if (action == "subscribe") {
            auto parsed = spec_from_json(j);
            if (auto* err = std::get_if<EngineError>(&parsed)) {
                send_error(conn_id, *err);
                return;
            }
            auto r = subscribe(conn_id, std::get<StreamSpec>(parsed));
            if (auto* err = std::get_if<EngineError>(&r)) {
                send_error(conn_id, *err);
                return;
            }
            json resp = describe(std::get<StreamKey>(r));
            resp["type"] = "subscribed";
            send_to(conn_id, resp.dump());
            return;
        }

        if (action == "unsubscribe") {
            const auto kind = parse_stream_kind(j.at("stream").get<std::string>());
            if (!kind) {
                send_error(conn_id, EngineError{ErrorCode::Malformed, "unknown stream"});
                return;
            }
            const std::string symbol = upper(j.at("symbol").get<std::string>());
            auto r = unsubscribe(conn_id, *kind, symbol);
            if (auto* err = std::get_if<EngineError>(&r)) {
                send_error(conn_id, *err);
                return;
            }
            json resp = {
                {"type", "unsubscribed"},
                {"stream", to_cstr(*kind)},
                {"symbol", symbol},
                {"removed", std::get<std::size_t>(r)},
            };
            send_to(conn_id, resp.dump());
            return;
        }

        malformed_.fetch_add(1, std::memory_order_relaxed);
        send_error(conn_id, EngineError{ErrorCode::Malformed, "unknown action '" + action + "'"});
    } catch (const json::exception& e) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        send_error(conn_id, EngineError{ErrorCode::Malformed, e.what()});
    }
}

std::variant<std::string, EngineError> SubscriptionHub::authenticate(std::uint64_t conn_id, const std::string& token) {
    auto user = verifier_.verify(token);
    if (!user) return EngineError{ErrorCode::Unauthorized, "invalid or expired token"};

    std::lock_guard<std::mutex> lk(m_);
    auto it = conns_.find(conn_id);
    if (it == conns_.end()) return EngineError{ErrorCode::NotFound, "connection closed"};
    ConnState& st = it->second;
    if (st.user == *user) return *user;

    if (!st.user.empty()) {
        auto& ids = by_user_[st.user];
        ids.erase(std::remove(ids.begin(), ids.end(), conn_id), ids.end());
        if (ids.empty()) by_user_.erase(st.user);
    }
    st.user = *user;
    by_user_[st.user].push_back(conn_id);
    return *user;
}

std::optional<EngineError> SubscriptionHub::validate(const StreamKey& key) const {
    if (key.symbol.empty()) return EngineError{ErrorCode::Malformed, "symbol is required"};
    if (!opts_.symbols.empty() && !contains(opts_.symbols, key.symbol)) {
        return EngineError{ErrorCode::Malformed, "unknown symbol " + key.symbol};
    }
    if (key.scope != kAllScope && !opts_.venues.empty() && !contains(opts_.venues, key.scope)) {
        return EngineError{ErrorCode::Malformed, "unknown exchange " + key.scope};
    }
    if (key.kind == StreamKind::Klines) {
        const auto& iv = agg_.intervals();
        if (std::find(iv.begin(), iv.end(), static_cast<int>(key.param)) == iv.end()) {
            return EngineError{ErrorCode::Malformed, "unsupported interval"};
        }
    }
    if (key.kind == StreamKind::Ewma && !(std::isfinite(key.param) && key.param > 0.0)) {
        return EngineError{ErrorCode::Malformed, "half_life must be a positive number of seconds"};
    }
    return std::nullopt;
}

std::variant<StreamKey, EngineError> SubscriptionHub::subscribe(std::uint64_t conn_id, const StreamSpec& spec) {
    StreamKey key = to_key(spec);

    // EWMA registrations are taken under m_: the aggregation engine never
    // calls the hub while holding one of its shard locks.
    std::lock_guard<std::mutex> lk(m_);
    auto it = conns_.find(conn_id);
    if (it == conns_.end()) return EngineError{ErrorCode::NotFound, "connection closed"};
    ConnState& st = it->second;
    if (st.user.empty()) return EngineError{ErrorCode::Unauthorized, "authenticate first"};

    if (auto err = validate(key)) return *err;

    if (std::find(st.subs.begin(), st.subs.end(), key) != st.subs.end()) return key;

    st.subs.push_back(key);
    routes_[key].push_back(conn_id);
    if (key.kind == StreamKind::Ewma) agg_.retain_ewma(key.symbol, key.scope, key.param);
    return key;
}

std::variant<std::size_t, EngineError> SubscriptionHub::unsubscribe(std::uint64_t conn_id, StreamKind kind,
                                                                    const std::string& symbol) {
    std::lock_guard<std::mutex> lk(m_);
    auto it = conns_.find(conn_id);
    if (it == conns_.end()) return EngineError{ErrorCode::NotFound, "connection closed"};
    ConnState& st = it->second;
    if (st.user.empty()) return EngineError{ErrorCode::Unauthorized, "authenticate first"};

    std::size_t removed = 0;
    auto& subs = st.subs;
    for (auto sit = subs.begin(); sit != subs.end();) {
        if (sit->kind != kind || sit->symbol != symbol) {
            ++sit;
            continue;
        }
        remove_route_unlocked(*sit, conn_id);
        if (sit->kind == StreamKind::Ewma) agg_.release_ewma(sit->symbol, sit->scope, sit->param);
        sit = subs.erase(sit);
        ++removed;
    }
    return removed;
}

void SubscriptionHub::remove_route_unlocked(const StreamKey& key, std::uint64_t conn_id) {
    auto rit = routes_.find(key);
    if (rit == routes_.end()) return;
    auto& ids = rit->second;
    ids.erase(std::remove(ids.begin(), ids.end(), conn_id), ids.end());
    if (ids.empty()) routes_.erase(rit);
}

// ---------------------------------------------------------------------------
// delivery
// ---------------------------------------------------------------------------

void SubscriptionHub::on_market_event(const MarketEvent& ev) {
    if (auto* e = std::get_if<BestTouchUpdated>(&ev)) {
        route({StreamKey{StreamKind::BestTouch, e->symbol, e->scope, 0}},
              [e] { return encode_best_touch(*e); });
    } else if (auto* e = std::get_if<TradePassThrough>(&ev)) {
        route({StreamKey{StreamKind::Trades, e->symbol, e->venue, 0},
               StreamKey{StreamKind::Trades, e->symbol, kAllScope, 0}},
              [e] { return encode_trade(*e); });
    } else if (auto* e = std::get_if<KlineUpdated>(&ev)) {
        route({StreamKey{StreamKind::Klines, e->symbol, e->scope, static_cast<double>(e->interval_s)}},
              [e] { return encode_kline(e->symbol, e->scope, e->interval_s, e->bucket); });
    } else if (auto* e = std::get_if<KlineClosed>(&ev)) {
        route({StreamKey{StreamKind::Klines, e->symbol, e->scope, static_cast<double>(e->interval_s)}},
              [e] { return encode_kline(e->symbol, e->scope, e->interval_s, e->bucket); });
    } else if (auto* e = std::get_if<EwmaUpdated>(&ev)) {
        route({StreamKey{StreamKind::Ewma, e->symbol, e->scope, e->half_life_s}},
              [e] { return encode_ewma(*e); });
    }
}

void SubscriptionHub::on_order_update(const Order& o) {
    std::vector<std::shared_ptr<ClientConnection>> targets;
    {
        std::lock_guard<std::mutex> lk(m_);
        auto uit = by_user_.find(o.user_id);
        if (uit == by_user_.end()) return;
        for (auto id : uit->second) {
            auto cit = conns_.find(id);
            if (cit != conns_.end()) targets.push_back(cit->second.conn);
        }
    }
    if (targets.empty()) return;
    auto frame = std::make_shared<const std::string>(encode_order_update(o));
    for (auto& c : targets) c->enqueue(frame);
}

void SubscriptionHub::route(const std::vector<StreamKey>& keys, const std::function<std::string()>& encode) {
    std::vector<std::shared_ptr<ClientConnection>> targets;
    {
        std::lock_guard<std::mutex> lk(m_);
        for (const auto& key : keys) {
            auto rit = routes_.find(key);
            if (rit == routes_.end()) continue;
            for (auto id : rit->second) {
                auto cit = conns_.find(id);
                if (cit == conns_.end()) continue;
                const auto& c = cit->second.conn;
                // one copy per connection even if several of its keys match
                if (std::find(targets.begin(), targets.end(), c) == targets.end()) targets.push_back(c);
            }
        }
    }
    if (targets.empty()) return;
    auto frame = std::make_shared<const std::string>(encode());
    for (auto& c : targets) c->enqueue(frame);
}

void SubscriptionHub::send_to(std::uint64_t conn_id, std::string frame) {
    std::shared_ptr<ClientConnection> conn;
    {
        std::lock_guard<std::mutex> lk(m_);
        auto it = conns_.find(conn_id);
        if (it == conns_.end()) return;
        conn = it->second.conn;
    }
    conn->enqueue(std::make_shared<const std::string>(std::move(frame)));
}

void SubscriptionHub::send_error(std::uint64_t conn_id, const EngineError& err) {
    json resp = {{"type", "error"}, {"code", to_cstr(err.code)}, {"message", err.message}};
    send_to(conn_id, resp.dump());
}
