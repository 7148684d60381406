#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <limits>
#include <map>
#include <mutex>
#include <random>
#include <thread>
#include <utility>
#include <vector>

#include "engine/matching_engine.hpp"
#include "md/symbol_codec.hpp"

namespace {

const std::vector<std::string> kPairs = {"BTCUSDT", "ETHUSDT"};

Tick touch(const std::string& symbol, double bid, double bid_sz, double ask, double ask_sz,
           const std::string& venue = "binance") {
    Tick t;
    t.venue = venue;
    t.symbol = symbol;
    t.kind = TickKind::Quote;
    t.bid = bid;
    t.bid_size = bid_sz;
    t.ask = ask;
    t.ask_size = ask_sz;
    t.ts_ns = wall_clock_ns();
    return t;
}

Order submit_ok(MatchingEngine& eng, const std::string& user, const std::string& symbol, Side side,
                double price, double qty) {
    auto r = eng.submit_order(OrderRequest{user, symbol, side, price, qty});
    if (auto* err = std::get_if<EngineError>(&r)) {
        ADD_FAILURE() << "submit failed: " << err->message;
        return Order{};
    }
    return std::get<Order>(r);
}

Order order_of(const MatchingEngine& eng, const std::string& user, std::uint64_t id) {
    auto r = eng.get_order(user, id);
    EXPECT_TRUE(std::holds_alternative<Order>(r));
    return std::holds_alternative<Order>(r) ? std::get<Order>(r) : Order{};
}

Balance balance_of(const MatchingEngine& eng, const std::string& user, const std::string& asset) {
    auto all = eng.get_balance(user);
    auto it = all.find(asset);
    return it == all.end() ? Balance{} : it->second;
}

ErrorCode code_of(const std::variant<Order, EngineError>& r) {
    EXPECT_TRUE(std::holds_alternative<EngineError>(r));
    return std::holds_alternative<EngineError>(r) ? std::get<EngineError>(r).code : ErrorCode::Malformed;
}

// total - available must equal what the user's open orders still reserve.
void expect_reservations_consistent(const MatchingEngine& eng, const std::string& user) {
    std::map<std::string, double> held;
    for (const auto& o : eng.list_orders(user)) {
        if (is_terminal(o.status)) {
            EXPECT_NEAR(o.reserved, 0.0, 1e-9) << "order " << o.id;
            continue;
        }
        auto [base, quote] = SymbolCodec::split(o.symbol);
        held[o.side == Side::BUY ? quote : base] += o.reserved;
    }
    for (const auto& [asset, b] : eng.get_balance(user)) {
        EXPECT_NEAR(b.total - b.available, held[asset], 1e-9) << user << " " << asset;
        EXPECT_GE(b.available, -1e-12);
    }
}

} // namespace

TEST(MatchingEngine, BuyReservesQuoteThenFillsAgainstAsk) {
    MatchingEngine eng(kPairs);
    ASSERT_TRUE(std::holds_alternative<Balance>(eng.deposit("alice", "USDT", 1000.0)));

    Order o = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 50000.0, 0.01);
    EXPECT_EQ(o.status, OrderStatus::OPEN);
    EXPECT_DOUBLE_EQ(o.reserved, 500.0);

    Balance usdt = balance_of(eng, "alice", "USDT");
    EXPECT_DOUBLE_EQ(usdt.total, 1000.0);
    EXPECT_DOUBLE_EQ(usdt.available, 500.0);

    eng.on_tick(touch("BTCUSDT", 49990.0, 1.0, 50000.0, 0.02));

    Order filled = order_of(eng, "alice", o.id);
    EXPECT_EQ(filled.status, OrderStatus::FILLED);
    EXPECT_DOUBLE_EQ(filled.filled_quantity, 0.01);

    usdt = balance_of(eng, "alice", "USDT");
    Balance btc = balance_of(eng, "alice", "BTC");
    EXPECT_NEAR(usdt.total, 500.0, 1e-9);
    EXPECT_NEAR(usdt.available, 500.0, 1e-9);
    EXPECT_NEAR(btc.total, 0.01, 1e-12);
    EXPECT_NEAR(btc.available, 0.01, 1e-12);
    EXPECT_EQ(eng.fills(), 1u);
}

TEST(MatchingEngine, EarlierOrderFillsFirstWhenTouchCoversOnlyOne) {
    MatchingEngine eng(kPairs);
    eng.deposit("a", "USDT", 1000.0);
    eng.deposit("b", "USDT", 1000.0);

    Order a = submit_ok(eng, "a", "BTCUSDT", Side::BUY, 100.0, 1.0);
    Order b = submit_ok(eng, "b", "BTCUSDT", Side::BUY, 100.0, 1.0);
    ASSERT_LT(a.id, b.id);

    eng.on_tick(touch("BTCUSDT", 99.0, 5.0, 100.0, 1.0));

    EXPECT_EQ(order_of(eng, "a", a.id).status, OrderStatus::FILLED);
    EXPECT_EQ(order_of(eng, "b", b.id).status, OrderStatus::OPEN);

    // the next quote refreshes the size at the touch
    eng.on_tick(touch("BTCUSDT", 99.0, 5.0, 100.0, 1.0));
    EXPECT_EQ(order_of(eng, "b", b.id).status, OrderStatus::FILLED);
}

TEST(MatchingEngine, SubmissionOrderBeatsBetterLimitPrice) {
    MatchingEngine eng(kPairs);
    eng.deposit("a", "USDT", 1000.0);
    eng.deposit("b", "USDT", 1000.0);

    Order a = submit_ok(eng, "a", "BTCUSDT", Side::BUY, 100.0, 1.0);
    Order b = submit_ok(eng, "b", "BTCUSDT", Side::BUY, 105.0, 1.0);

    eng.on_tick(touch("BTCUSDT", 99.0, 1.0, 100.0, 1.0));
    EXPECT_EQ(order_of(eng, "a", a.id).status, OrderStatus::FILLED);
    EXPECT_EQ(order_of(eng, "b", b.id).status, OrderStatus::OPEN);
}

TEST(MatchingEngine, BuyExecutesAtItsLimitPrice) {
    MatchingEngine eng(kPairs);
    eng.deposit("alice", "USDT", 1000.0);
    Order o = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 110.0, 2.0);

    eng.on_tick(touch("BTCUSDT", 99.0, 1.0, 100.0, 10.0));

    EXPECT_EQ(order_of(eng, "alice", o.id).status, OrderStatus::FILLED);
    Balance usdt = balance_of(eng, "alice", "USDT");
    EXPECT_NEAR(usdt.total, 780.0, 1e-9);
    EXPECT_NEAR(usdt.available, 780.0, 1e-9);
}

TEST(MatchingEngine, SellReservesBaseAndCreditsQuote) {
    MatchingEngine eng(kPairs);
    eng.deposit("bob", "BTC", 1.0);

    Order o = submit_ok(eng, "bob", "BTCUSDT", Side::SELL, 100.0, 1.0);
    EXPECT_DOUBLE_EQ(balance_of(eng, "bob", "BTC").available, 0.0);

    // ask side crossing does not fill a sell
    eng.on_tick(touch("BTCUSDT", 99.0, 5.0, 100.0, 5.0));
    EXPECT_EQ(order_of(eng, "bob", o.id).status, OrderStatus::OPEN);

    eng.on_tick(touch("BTCUSDT", 100.0, 5.0, 101.0, 5.0));
    EXPECT_EQ(order_of(eng, "bob", o.id).status, OrderStatus::FILLED);

    Balance btc = balance_of(eng, "bob", "BTC");
    Balance usdt = balance_of(eng, "bob", "USDT");
    EXPECT_NEAR(btc.total, 0.0, 1e-12);
    EXPECT_NEAR(usdt.total, 100.0, 1e-9);
    EXPECT_NEAR(usdt.available, 100.0, 1e-9);
}

TEST(MatchingEngine, PartialFillKeepsRemainderReserved) {
    MatchingEngine eng(kPairs);
    eng.deposit("alice", "USDT", 1000.0);
    Order o = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 100.0, 2.0);

    eng.on_tick(touch("BTCUSDT", 99.0, 1.0, 100.0, 0.5));

    Order p = order_of(eng, "alice", o.id);
    EXPECT_EQ(p.status, OrderStatus::PARTIALLY_FILLED);
    EXPECT_DOUBLE_EQ(p.filled_quantity, 0.5);
    EXPECT_NEAR(p.reserved, 150.0, 1e-9);

    Balance usdt = balance_of(eng, "alice", "USDT");
    EXPECT_NEAR(usdt.total, 950.0, 1e-9);
    EXPECT_NEAR(usdt.available, 800.0, 1e-9);
    EXPECT_NEAR(balance_of(eng, "alice", "BTC").total, 0.5, 1e-12);
    expect_reservations_consistent(eng, "alice");

    eng.on_tick(touch("BTCUSDT", 99.0, 1.0, 100.0, 5.0));
    Order f = order_of(eng, "alice", o.id);
    EXPECT_EQ(f.status, OrderStatus::FILLED);
    EXPECT_DOUBLE_EQ(f.filled_quantity, 2.0);
    usdt = balance_of(eng, "alice", "USDT");
    EXPECT_NEAR(usdt.total, 800.0, 1e-9);
    EXPECT_NEAR(usdt.available, 800.0, 1e-9);
}

TEST(MatchingEngine, CrossingQuoteFillsNewOrderImmediately) {
    MatchingEngine eng(kPairs);
    std::vector<Order> updates;
    eng.set_order_listener([&](const Order& o) { updates.push_back(o); });
    eng.deposit("alice", "USDT", 1000.0);

    eng.on_tick(touch("BTCUSDT", 99.0, 1.0, 100.0, 1.0));
    Order first = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 100.0, 1.0);
    EXPECT_EQ(first.status, OrderStatus::FILLED);

    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0].status, OrderStatus::OPEN);
    EXPECT_EQ(updates[1].status, OrderStatus::FILLED);

    // size at the touch is used up until the next quote
    Order second = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 100.0, 1.0);
    EXPECT_EQ(second.status, OrderStatus::OPEN);
}

TEST(MatchingEngine, RejectsOrdersThatCannotBeFunded) {
    MatchingEngine eng(kPairs);
    auto r = eng.submit_order(OrderRequest{"alice", "BTCUSDT", Side::BUY, 100.0, 1.0});
    EXPECT_EQ(code_of(r), ErrorCode::InsufficientBalance);

    eng.deposit("alice", "USDT", 50.0);
    r = eng.submit_order(OrderRequest{"alice", "BTCUSDT", Side::BUY, 100.0, 1.0});
    EXPECT_EQ(code_of(r), ErrorCode::InsufficientBalance);
    EXPECT_DOUBLE_EQ(balance_of(eng, "alice", "USDT").available, 50.0);

    r = eng.submit_order(OrderRequest{"alice", "BTCUSDT", Side::SELL, 100.0, 0.1});
    EXPECT_EQ(code_of(r), ErrorCode::InsufficientBalance);
    EXPECT_TRUE(eng.list_orders("alice").empty());
}

TEST(MatchingEngine, ValidatesOrderFields) {
    MatchingEngine eng(kPairs);
    eng.deposit("alice", "USDT", 1000.0);
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_EQ(code_of(eng.submit_order({"alice", "BTCUSDT", Side::BUY, 0.0, 1.0})), ErrorCode::InvalidOrder);
    EXPECT_EQ(code_of(eng.submit_order({"alice", "BTCUSDT", Side::BUY, 1.0, -1.0})), ErrorCode::InvalidOrder);
    EXPECT_EQ(code_of(eng.submit_order({"alice", "BTCUSDT", Side::BUY, nan, 1.0})), ErrorCode::InvalidOrder);
    EXPECT_EQ(code_of(eng.submit_order({"alice", "DOGEUSDT", Side::BUY, 1.0, 1.0})), ErrorCode::InvalidOrder);
    EXPECT_EQ(code_of(eng.submit_order({"", "BTCUSDT", Side::BUY, 1.0, 1.0})), ErrorCode::Unauthorized);
}

TEST(MatchingEngine, CancelReleasesReservation) {
    MatchingEngine eng(kPairs);
    eng.deposit("alice", "USDT", 1000.0);
    Order o = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 50000.0, 0.01);

    auto r = eng.cancel_order("alice", o.id);
    ASSERT_TRUE(std::holds_alternative<Order>(r));
    EXPECT_EQ(std::get<Order>(r).status, OrderStatus::CANCELLED);
    EXPECT_DOUBLE_EQ(balance_of(eng, "alice", "USDT").available, 1000.0);

    // a cancelled order never fills
    eng.on_tick(touch("BTCUSDT", 49000.0, 1.0, 49000.0, 1.0));
    EXPECT_EQ(order_of(eng, "alice", o.id).status, OrderStatus::CANCELLED);
    EXPECT_EQ(eng.fills(), 0u);

    EXPECT_EQ(code_of(eng.cancel_order("alice", o.id)), ErrorCode::AlreadyTerminal);
}

TEST(MatchingEngine, CancelErrors) {
    MatchingEngine eng(kPairs);
    eng.deposit("alice", "USDT", 1000.0);
    Order o = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 100.0, 1.0);

    EXPECT_EQ(code_of(eng.cancel_order("alice", 9999)), ErrorCode::NotFound);
    EXPECT_EQ(code_of(eng.cancel_order("mallory", o.id)), ErrorCode::NotFound);
    EXPECT_EQ(code_of(eng.get_order("mallory", o.id)), ErrorCode::NotFound);

    eng.on_tick(touch("BTCUSDT", 99.0, 1.0, 100.0, 1.0));
    EXPECT_EQ(code_of(eng.cancel_order("alice", o.id)), ErrorCode::AlreadyTerminal);
}

TEST(MatchingEngine, DepositValidatesAndNormalizesAsset) {
    MatchingEngine eng(kPairs);
    auto bad = eng.deposit("alice", "USDT", 0.0);
    ASSERT_TRUE(std::holds_alternative<EngineError>(bad));
    EXPECT_EQ(std::get<EngineError>(bad).code, ErrorCode::InvalidOrder);
    EXPECT_TRUE(std::holds_alternative<EngineError>(eng.deposit("alice", "", 1.0)));

    eng.deposit("alice", "usdt", 10.0);
    auto r = eng.deposit("alice", "USDT", 5.0);
    ASSERT_TRUE(std::holds_alternative<Balance>(r));
    EXPECT_DOUBLE_EQ(std::get<Balance>(r).total, 15.0);
    EXPECT_DOUBLE_EQ(std::get<Balance>(r).available, 15.0);
}

TEST(MatchingEngine, ReservationsStayConsistentAcrossMixedActivity) {
    MatchingEngine eng(kPairs);
    eng.deposit("alice", "USDT", 10000.0);
    eng.deposit("alice", "ETH", 3.0);

    Order b1 = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 100.0, 3.0);
    submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 90.0, 1.0);
    Order s1 = submit_ok(eng, "alice", "ETHUSDT", Side::SELL, 2000.0, 2.0);
    expect_reservations_consistent(eng, "alice");

    eng.on_tick(touch("BTCUSDT", 95.0, 1.0, 100.0, 1.25));
    eng.on_tick(touch("ETHUSDT", 2000.0, 0.5, 2001.0, 1.0));
    expect_reservations_consistent(eng, "alice");

    eng.cancel_order("alice", b1.id);
    eng.on_tick(touch("ETHUSDT", 2005.0, 5.0, 2006.0, 1.0));
    expect_reservations_consistent(eng, "alice");

    EXPECT_EQ(order_of(eng, "alice", s1.id).status, OrderStatus::FILLED);
    EXPECT_NEAR(balance_of(eng, "alice", "ETH").total, 1.0, 1e-12);
}

TEST(MatchingEngine, ListOrdersReturnsOwnOrdersById) {
    MatchingEngine eng(kPairs);
    eng.deposit("alice", "USDT", 1000.0);
    eng.deposit("bob", "USDT", 1000.0);
    Order a1 = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 10.0, 1.0);
    submit_ok(eng, "bob", "BTCUSDT", Side::BUY, 10.0, 1.0);
    Order a2 = submit_ok(eng, "alice", "ETHUSDT", Side::BUY, 10.0, 1.0);

    auto list = eng.list_orders("alice");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].id, a1.id);
    EXPECT_EQ(list[1].id, a2.id);
    EXPECT_TRUE(eng.list_orders("nobody").empty());
}

TEST(MatchingEngine, IgnoresTradesAndUnknownSymbols) {
    MatchingEngine eng(kPairs);
    eng.deposit("alice", "USDT", 1000.0);
    Order o = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 100.0, 1.0);

    Tick t;
    t.venue = "okx";
    t.symbol = "BTCUSDT";
    t.kind = TickKind::Trade;
    t.trade_price = 90.0;
    t.trade_size = 10.0;
    eng.on_tick(t);
    eng.on_tick(touch("SOLUSDT", 1.0, 1.0, 1.0, 1.0));

    EXPECT_EQ(order_of(eng, "alice", o.id).status, OrderStatus::OPEN);
}

TEST(MatchingEngine, ExportAndLoadResumeOpenOrders) {
    EngineState saved;
    std::uint64_t open_id = 0;
    {
        MatchingEngine eng(kPairs);
        eng.deposit("alice", "USDT", 1000.0);
        Order done = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 100.0, 1.0);
        eng.cancel_order("alice", done.id);
        open_id = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 200.0, 2.0).id;
        saved = eng.export_state();
    }
    ASSERT_EQ(saved.orders.size(), 2u);
    EXPECT_EQ(saved.next_order_id, open_id + 1);

    MatchingEngine eng(kPairs);
    eng.load(saved);
    EXPECT_DOUBLE_EQ(balance_of(eng, "alice", "USDT").available, 600.0);
    expect_reservations_consistent(eng, "alice");

    eng.on_tick(touch("BTCUSDT", 150.0, 1.0, 190.0, 5.0));
    EXPECT_EQ(order_of(eng, "alice", open_id).status, OrderStatus::FILLED);

    eng.deposit("alice", "USDT", 1000.0);
    Order next = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 1.0, 1.0);
    EXPECT_EQ(next.id, open_id + 1);
}

TEST(MatchingEngine, FillReportedBeforeConcurrentCancel) {
    MatchingEngine eng(kPairs);
    eng.deposit("alice", "USDT", 1000.0);

    std::mutex m;
    std::vector<Order> seen;
    std::atomic<bool> in_fill_callback{false};
    eng.set_order_listener([&](const Order& o) {
        {
            std::lock_guard<std::mutex> lk(m);
            seen.push_back(o);
        }
        if (o.status == OrderStatus::PARTIALLY_FILLED) {
            in_fill_callback = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    Order o = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 100.0, 2.0);
    std::thread feed([&] { eng.on_tick(touch("BTCUSDT", 99.0, 1.0, 100.0, 1.0)); });
    while (!in_fill_callback) std::this_thread::yield();

    auto cancelled = eng.cancel_order("alice", o.id);
    feed.join();

    ASSERT_TRUE(std::holds_alternative<Order>(cancelled));
    EXPECT_DOUBLE_EQ(std::get<Order>(cancelled).filled_quantity, 1.0);

    std::lock_guard<std::mutex> lk(m);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].status, OrderStatus::OPEN);
    EXPECT_EQ(seen[1].status, OrderStatus::PARTIALLY_FILLED);
    EXPECT_EQ(seen[2].status, OrderStatus::CANCELLED);
    EXPECT_EQ(order_of(eng, "alice", o.id).status, OrderStatus::CANCELLED);
}

TEST(MatchingEngine, ConcurrentTicksOrdersAndDepositsStayConsistent) {
    MatchingEngine eng(kPairs);
    const std::vector<std::string> users = {"alice", "bob", "carol"};
    for (const auto& u : users) {
        eng.deposit(u, "USDT", 1e6);
        eng.deposit(u, "BTC", 100.0);
        eng.deposit(u, "ETH", 100.0);
    }

    std::mutex m;
    std::map<std::uint64_t, std::vector<Order>> delivered;
    eng.set_order_listener([&](const Order& o) {
        std::lock_guard<std::mutex> lk(m);
        delivered[o.id].push_back(o);
    });

    std::atomic<bool> stop{false};
    std::vector<std::thread> threads;

    // one feed per symbol
    for (const auto& symbol : kPairs) {
        threads.emplace_back([&eng, &stop, symbol] {
            std::mt19937 rng(symbol.size());
            std::uniform_real_distribution<double> size(0.0, 0.05);
            while (!stop) eng.on_tick(touch(symbol, 99.9, size(rng), 100.1, size(rng)));
        });
    }

    // a second depositor per user, racing the fills on the same account
    for (const auto& u : users) {
        threads.emplace_back([&eng, u] {
            for (int i = 0; i < 1000; ++i) {
                eng.deposit(u, "USDC", 1.0);
                eng.deposit(u, "USDT", 0.5);
            }
        });
    }

    std::mutex cancel_m;
    std::map<std::uint64_t, std::pair<std::string, double>> filled_at_cancel;
    std::vector<std::thread> traders;
    for (std::size_t n = 0; n < users.size(); ++n) {
        traders.emplace_back([&, n] {
            const std::string& user = users[n];
            std::mt19937 rng(static_cast<unsigned>(n + 1));
            std::uniform_int_distribution<int> pick(0, 5);
            std::vector<std::uint64_t> mine;
            for (int i = 0; i < 500; ++i) {
                const std::string& symbol = kPairs[i % kPairs.size()];
                switch (pick(rng)) {
                case 0: mine.push_back(submit_ok(eng, user, symbol, Side::BUY, 100.2, 0.03).id); break;
                case 1: mine.push_back(submit_ok(eng, user, symbol, Side::SELL, 99.8, 0.03).id); break;
                case 2: mine.push_back(submit_ok(eng, user, symbol, Side::BUY, 50.0, 0.1).id); break;
                case 3: mine.push_back(submit_ok(eng, user, symbol, Side::SELL, 150.0, 0.1).id); break;
                default:
                    if (mine.empty()) break;
                    const std::uint64_t id = mine[std::uniform_int_distribution<std::size_t>(0, mine.size() - 1)(rng)];
                    auto r = eng.cancel_order(user, id);
                    if (auto* o = std::get_if<Order>(&r)) {
                        std::lock_guard<std::mutex> lk(cancel_m);
                        filled_at_cancel[id] = {user, o->filled_quantity};
                    } else {
                        EXPECT_EQ(std::get<EngineError>(r).code, ErrorCode::AlreadyTerminal);
                    }
                }
            }
        });
    }

    for (auto& t : traders) t.join();
    stop = true;
    for (auto& t : threads) t.join();

    for (const auto& u : users) {
        EXPECT_DOUBLE_EQ(balance_of(eng, u, "USDC").total, 1000.0) << u;

        std::map<std::string, double> held;
        for (const auto& o : eng.list_orders(u)) {
            if (is_terminal(o.status)) continue;
            auto [base, quote] = SymbolCodec::split(o.symbol);
            held[o.side == Side::BUY ? quote : base] += o.reserved;
        }
        for (const auto& [asset, b] : eng.get_balance(u)) {
            EXPECT_NEAR(b.available + held[asset], b.total, 1e-6) << u << " " << asset;
            EXPECT_GE(b.available, -1e-9) << u << " " << asset;
        }
    }

    // nothing fills after a successful cancel
    for (const auto& [id, at_cancel] : filled_at_cancel) {
        const Order o = order_of(eng, at_cancel.first, id);
        EXPECT_EQ(o.status, OrderStatus::CANCELLED) << "order " << id;
        EXPECT_DOUBLE_EQ(o.filled_quantity, at_cancel.second) << "order " << id;
    }

    // per order, updates arrive in the order they happened and end on the final state
    std::lock_guard<std::mutex> lk(m);
    for (const auto& u : users) {
        for (const auto& o : eng.list_orders(u)) {
            const auto& seq = delivered[o.id];
            ASSERT_FALSE(seq.empty()) << "order " << o.id;
            EXPECT_EQ(seq.front().status, OrderStatus::OPEN) << "order " << o.id;
            for (std::size_t i = 1; i < seq.size(); ++i) {
                EXPECT_FALSE(is_terminal(seq[i - 1].status)) << "order " << o.id << " update after terminal";
                EXPECT_GE(seq[i].filled_quantity, seq[i - 1].filled_quantity) << "order " << o.id;
            }
            EXPECT_EQ(seq.back().status, o.status) << "order " << o.id;
            EXPECT_DOUBLE_EQ(seq.back().filled_quantity, o.filled_quantity) << "order " << o.id;
        }
    }
}

TEST(MatchingEngine, PruneForgetsOnlyOldTerminalOrders) {
    MatchingEngine eng(kPairs);
    eng.deposit("alice", "USDT", 1000.0);
    Order filled = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 100.0, 1.0);
    eng.on_tick(touch("BTCUSDT", 99.0, 5.0, 100.0, 5.0));
    Order cancelled = submit_ok(eng, "alice", "BTCUSDT", Side::BUY, 10.0, 1.0);
    eng.cancel_order("alice", cancelled.id);
    Order open = submit_ok(eng, "alice", "ETHUSDT", Side::BUY, 10.0, 1.0);
    ASSERT_EQ(order_of(eng, "alice", filled.id).status, OrderStatus::FILLED);

    EXPECT_EQ(eng.prune_terminal(0), 0u);
    EXPECT_EQ(eng.list_orders("alice").size(), 3u);

    EXPECT_EQ(eng.prune_terminal(wall_clock_ns() + 1), 2u);
    auto left = eng.list_orders("alice");
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].id, open.id);
    EXPECT_EQ(code_of(eng.get_order("alice", filled.id)), ErrorCode::NotFound);
    EXPECT_EQ(code_of(eng.cancel_order("alice", cancelled.id)), ErrorCode::NotFound);

    const EngineState saved = eng.export_state();
    ASSERT_EQ(saved.orders.size(), 1u);
    EXPECT_EQ(saved.next_order_id, open.id + 1);
    expect_reservations_consistent(eng, "alice");

    // the open order still matches after pruning
    eng.on_tick(touch("ETHUSDT", 9.0, 1.0, 10.0, 1.0));
    EXPECT_EQ(order_of(eng, "alice", open.id).status, OrderStatus::FILLED);
}
