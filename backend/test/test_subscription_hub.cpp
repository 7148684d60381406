#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/aggregation_engine.hpp"
#include "hub/subscription_hub.hpp"

using json = nlohmann::json;

namespace {

class FakeVerifier : public ITokenVerifier {
public:
    std::optional<std::string> verify(const std::string& token) const override {
        auto it = tokens.find(token);
        if (it == tokens.end()) return std::nullopt;
        return it->second;
    }
    std::map<std::string, std::string> tokens{{"tok-alice", "alice"}, {"tok-bob", "bob"}};
};

std::vector<json> drain(ClientConnection& c) {
    std::vector<json> out;
    OutboundFrame f;
    while (c.try_pop(f)) out.push_back(json::parse(*f));
    return out;
}

std::string frame(const json& j) {
    return j.dump();
}

BestTouchUpdated touch_event(const std::string& symbol, const std::string& scope, double bid, double ask) {
    BestTouchUpdated ev;
    ev.symbol = symbol;
    ev.scope = scope;
    ev.touch.bid = bid;
    ev.touch.bid_size = 1.0;
    ev.touch.ask = ask;
    ev.touch.ask_size = 2.0;
    ev.touch.bid_venue = scope;
    ev.touch.ask_venue = scope;
    ev.touch.updated_at_ns = 1'700'000'000LL * kNsPerSec;
    return ev;
}

TradePassThrough trade_event(const std::string& symbol, const std::string& venue, double price) {
    return TradePassThrough{symbol, venue, price, 0.5, 1'700'000'000LL * kNsPerSec};
}

class SubscriptionHubTest : public ::testing::Test {
protected:
    SubscriptionHubTest()
        : hub_(agg_, verifier_, HubOptions{1024, {"BTCUSDT", "ETHUSDT"}, {"binance", "okx"}}) {}

    // Connected and authenticated; the auth ack is consumed.
    std::shared_ptr<ClientConnection> login(const std::string& token = "tok-alice") {
        auto c = hub_.connect({});
        hub_.on_message(c->id(), frame({{"action", "auth"}, {"token", token}}));
        auto acks = drain(*c);
        EXPECT_EQ(acks.size(), 1u);
        if (!acks.empty()) EXPECT_EQ(acks[0]["status"], "ok");
        return c;
    }

    json request(ClientConnection& c, const std::string& text) {
        hub_.on_message(c.id(), text);
        auto frames = drain(c);
        EXPECT_EQ(frames.size(), 1u) << text;
        return frames.empty() ? json{} : frames[0];
    }

    AggregationEngine agg_;
    FakeVerifier verifier_;
    SubscriptionHub hub_;
};

} // namespace

TEST_F(SubscriptionHubTest, SubscribeRequiresAuthentication) {
    auto c = hub_.connect({});
    json r = request(*c, frame({{"action", "subscribe"}, {"stream", "best_touch"}, {"symbol", "BTCUSDT"}}));
    EXPECT_EQ(r["type"], "error");
    EXPECT_EQ(r["code"], "unauthorized");

    r = request(*c, frame({{"action", "auth"}, {"token", "forged"}}));
    EXPECT_EQ(r["type"], "error");
    EXPECT_EQ(r["code"], "unauthorized");

    r = request(*c, frame({{"action", "auth"}, {"token", "tok-alice"}}));
    EXPECT_EQ(r["type"], "auth");
    EXPECT_EQ(r["username"], "alice");

    r = request(*c, frame({{"action", "subscribe"}, {"stream", "best_touch"}, {"symbol", "btcusdt"}}));
    EXPECT_EQ(r["type"], "subscribed");
    EXPECT_EQ(r["symbol"], "BTCUSDT");
    EXPECT_EQ(r["exchange"], "all");
}

TEST_F(SubscriptionHubTest, DeliversOnlyMatchingStream) {
    auto c = login();
    request(*c, frame({{"action", "subscribe"}, {"stream", "best_touch"}, {"symbol", "BTCUSDT"}}));

    hub_.on_market_event(touch_event("BTCUSDT", "all", 100.0, 101.0));
    hub_.on_market_event(touch_event("BTCUSDT", "binance", 100.0, 101.0));
    hub_.on_market_event(touch_event("ETHUSDT", "all", 2000.0, 2001.0));

    auto frames = drain(*c);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0]["type"], "best_touch");
    EXPECT_EQ(frames[0]["data"]["symbol"], "BTCUSDT");
    EXPECT_EQ(frames[0]["data"]["exchange"], "all");
    EXPECT_DOUBLE_EQ(frames[0]["data"]["best_bid"].get<double>(), 100.0);
}

TEST_F(SubscriptionHubTest, TradesOnAllScopeIncludeEveryVenue) {
    auto all = login();
    auto okx_only = login("tok-bob");
    request(*all, frame({{"action", "subscribe"}, {"stream", "trades"}, {"symbol", "BTCUSDT"}}));
    request(*okx_only, frame({{"action", "subscribe"}, {"stream", "trades"}, {"symbol", "BTCUSDT"}, {"exchange", "OKX"}}));

    hub_.on_market_event(trade_event("BTCUSDT", "binance", 100.0));
    hub_.on_market_event(trade_event("BTCUSDT", "okx", 100.5));

    auto a = drain(*all);
    auto o = drain(*okx_only);
    ASSERT_EQ(a.size(), 2u);
    ASSERT_EQ(o.size(), 1u);
    EXPECT_EQ(a[0]["data"]["exchange"], "binance");
    EXPECT_EQ(o[0]["data"]["exchange"], "okx");
    EXPECT_DOUBLE_EQ(o[0]["data"]["price"].get<double>(), 100.5);
}

TEST_F(SubscriptionHubTest, OverlappingSubscriptionsDeliverOneCopy) {
    auto c = login();
    request(*c, frame({{"action", "subscribe"}, {"stream", "trades"}, {"symbol", "BTCUSDT"}}));
    request(*c, frame({{"action", "subscribe"}, {"stream", "trades"}, {"symbol", "BTCUSDT"}, {"exchange", "binance"}}));
    request(*c, frame({{"action", "subscribe"}, {"stream", "trades"}, {"symbol", "BTCUSDT"}}));

    EXPECT_EQ(hub_.subscriber_count({StreamKind::Trades, "BTCUSDT", "all", 0}), 1u);

    hub_.on_market_event(trade_event("BTCUSDT", "binance", 100.0));
    EXPECT_EQ(drain(*c).size(), 1u);
}

TEST_F(SubscriptionHubTest, KlineIntervalAcceptsLabelOrSeconds) {
    auto c = login();
    json r = request(*c, frame({{"action", "subscribe"}, {"stream", "klines"}, {"symbol", "ETHUSDT"}, {"interval", "1m"}}));
    EXPECT_EQ(r["interval"], "1m");
    r = request(*c, frame({{"action", "subscribe"}, {"stream", "klines"}, {"symbol", "ETHUSDT"}, {"interval", 60}}));
    EXPECT_EQ(r["type"], "subscribed");
    EXPECT_EQ(hub_.subscriber_count({StreamKind::Klines, "ETHUSDT", "all", 60}), 1u);

    KlineClosed ev{"ETHUSDT", "all", 60, KlineBucket{}};
    ev.bucket.closed = true;
    hub_.on_market_event(ev);
    hub_.on_market_event(KlineUpdated{"ETHUSDT", "all", 300, KlineBucket{}});

    auto frames = drain(*c);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0]["type"], "klines");
    EXPECT_EQ(frames[0]["data"]["closed"], true);
}

TEST_F(SubscriptionHubTest, RejectsInvalidSubscriptions) {
    auto c = login();
    const std::vector<std::string> bad = {
        frame({{"action", "subscribe"}, {"stream", "best_touch"}, {"symbol", "DOGEUSDT"}}),
        frame({{"action", "subscribe"}, {"stream", "best_touch"}, {"symbol", "BTCUSDT"}, {"exchange", "kraken"}}),
        frame({{"action", "subscribe"}, {"stream", "klines"}, {"symbol", "BTCUSDT"}, {"interval", "7m"}}),
        frame({{"action", "subscribe"}, {"stream", "klines"}, {"symbol", "BTCUSDT"}}),
        frame({{"action", "subscribe"}, {"stream", "ewma"}, {"symbol", "BTCUSDT"}, {"half_life", -5}}),
        frame({{"action", "subscribe"}, {"stream", "depth"}, {"symbol", "BTCUSDT"}}),
        frame({{"action", "subscribe"}, {"stream", "trades"}}),
    };
    for (const auto& text : bad) {
        json r = request(*c, text);
        EXPECT_EQ(r["type"], "error") << text;
        EXPECT_EQ(r["code"], "malformed") << text;
    }
}

TEST_F(SubscriptionHubTest, MalformedFramesGetErrorReplies) {
    auto c = login();
    EXPECT_EQ(request(*c, "{oops")["code"], "malformed");
    EXPECT_EQ(request(*c, "[1,2]")["code"], "malformed");
    EXPECT_EQ(request(*c, frame({{"action", "dance"}}))["code"], "malformed");
    EXPECT_EQ(request(*c, frame({{"action", "auth"}}))["code"], "malformed");
    EXPECT_EQ(hub_.malformed(), 4u);
    EXPECT_EQ(hub_.connection_count(), 1u);
}

TEST_F(SubscriptionHubTest, UnsubscribeRemovesEveryScope) {
    auto c = login();
    request(*c, frame({{"action", "subscribe"}, {"stream", "best_touch"}, {"symbol", "BTCUSDT"}}));
    request(*c, frame({{"action", "subscribe"}, {"stream", "best_touch"}, {"symbol", "BTCUSDT"}, {"exchange", "okx"}}));

    json r = request(*c, frame({{"action", "unsubscribe"}, {"stream", "best_touch"}, {"symbol", "BTCUSDT"}}));
    EXPECT_EQ(r["type"], "unsubscribed");
    EXPECT_EQ(r["removed"], 2);

    hub_.on_market_event(touch_event("BTCUSDT", "all", 1.0, 2.0));
    hub_.on_market_event(touch_event("BTCUSDT", "okx", 1.0, 2.0));
    EXPECT_TRUE(drain(*c).empty());
}

TEST_F(SubscriptionHubTest, DisconnectOnlyAffectsThatConnection) {
    auto a = login();
    auto b = login("tok-bob");
    for (auto* c : {a.get(), b.get()}) {
        request(*c, frame({{"action", "subscribe"}, {"stream", "trades"}, {"symbol", "BTCUSDT"}}));
    }
    const StreamKey key{StreamKind::Trades, "BTCUSDT", "all", 0};
    EXPECT_EQ(hub_.subscriber_count(key), 2u);

    hub_.disconnect(a->id());
    EXPECT_EQ(hub_.connection_count(), 1u);
    EXPECT_EQ(hub_.subscriber_count(key), 1u);

    hub_.on_market_event(trade_event("BTCUSDT", "okx", 100.0));
    EXPECT_TRUE(drain(*a).empty());
    EXPECT_EQ(drain(*b).size(), 1u);

    // unknown ids are ignored
    hub_.disconnect(a->id());
    auto r = hub_.subscribe(a->id(), TradesSpec{"BTCUSDT"});
    ASSERT_TRUE(std::holds_alternative<EngineError>(r));
    EXPECT_EQ(std::get<EngineError>(r).code, ErrorCode::NotFound);
}

TEST_F(SubscriptionHubTest, EwmaSubscriptionsDriveEngineTracking) {
    agg_.set_listener([this](const MarketEvent& ev) { hub_.on_market_event(ev); });
    auto a = login();
    auto b = login("tok-bob");
    request(*a, frame({{"action", "subscribe"}, {"stream", "ewma"}, {"symbol", "BTCUSDT"}, {"half_life", 10}}));
    request(*b, frame({{"action", "subscribe"}, {"stream", "ewma"}, {"symbol", "BTCUSDT"}, {"half_life", 10.0}}));
    EXPECT_TRUE(agg_.ewma("BTCUSDT", kAllScope, 10.0).has_value());

    Tick t;
    t.venue = "binance";
    t.symbol = "BTCUSDT";
    t.kind = TickKind::Trade;
    t.trade_price = 42000.0;
    t.trade_size = 0.1;
    t.ts_ns = wall_clock_ns();
    agg_.on_tick(t);

    auto frames = drain(*a);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0]["type"], "ewma");
    EXPECT_DOUBLE_EQ(frames[0]["data"]["value"].get<double>(), 42000.0);
    EXPECT_DOUBLE_EQ(frames[0]["data"]["half_life"].get<double>(), 10.0);

    hub_.disconnect(a->id());
    EXPECT_TRUE(agg_.ewma("BTCUSDT", kAllScope, 10.0).has_value());
    request(*b, frame({{"action", "unsubscribe"}, {"stream", "ewma"}, {"symbol", "BTCUSDT"}}));
    EXPECT_FALSE(agg_.ewma("BTCUSDT", kAllScope, 10.0).has_value());
}

TEST_F(SubscriptionHubTest, OrderUpdatesReachEveryConnectionOfTheOwner) {
    auto alice1 = login();
    auto alice2 = login();
    auto bob = login("tok-bob");
    auto anon = hub_.connect({});

    Order o;
    o.id = 7;
    o.user_id = "alice";
    o.symbol = "BTCUSDT";
    o.price = 100.0;
    o.quantity = 1.0;
    o.status = OrderStatus::FILLED;
    hub_.on_order_update(o);

    for (auto* c : {alice1.get(), alice2.get()}) {
        auto frames = drain(*c);
        ASSERT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0]["type"], "order");
        EXPECT_EQ(frames[0]["data"]["id"], 7);
        EXPECT_EQ(frames[0]["data"]["status"], "filled");
    }
    EXPECT_TRUE(drain(*bob).empty());
    EXPECT_TRUE(drain(*anon).empty());

    hub_.disconnect(alice1->id());
    hub_.on_order_update(o);
    EXPECT_EQ(drain(*alice2).size(), 1u);
}

TEST(SubscriptionHub, SlowClientLosesOldestFramesOnly) {
    AggregationEngine agg;
    FakeVerifier verifier;
    SubscriptionHub hub(agg, verifier, HubOptions{2, {}, {}});
    std::atomic<int> wakeups{0};
    auto c = hub.connect([&] { ++wakeups; });
    ASSERT_TRUE(std::holds_alternative<std::string>(hub.authenticate(c->id(), "tok-alice")));
    ASSERT_TRUE(std::holds_alternative<StreamKey>(hub.subscribe(c->id(), TradesSpec{"SOLUSDT", "all"})));

    for (int i = 1; i <= 5; ++i) hub.on_market_event(trade_event("SOLUSDT", "okx", i));

    EXPECT_EQ(wakeups.load(), 5);
    EXPECT_EQ(c->dropped(), 3u);
    auto frames = drain(*c);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_DOUBLE_EQ(frames[0]["data"]["price"].get<double>(), 4.0);
    EXPECT_DOUBLE_EQ(frames[1]["data"]["price"].get<double>(), 5.0);
}
