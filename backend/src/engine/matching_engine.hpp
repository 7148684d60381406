#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "common/errors.hpp"
#include "engine/engine_state.hpp"
#include "engine/order.hpp"
#include "md/tick.hpp"
#include "md/touch_book.hpp"
#include "util/turn_sequencer.hpp"

struct OrderRequest {
    std::string user_id;
    std::string symbol;
    Side side{Side::BUY};
    double price{0.0};
    double quantity{0.0};
};

// Paper-trading matcher. Resting limit orders fill against the consolidated
// best touch of the tick stream it is fed; execution happens at the order's
// own limit price.
//
// Locking:
//  - one BookShard per configured symbol (touch book + open-order worklist)
//  - one Account per user (balances + owned order ids)
//  - one mutex per order; fills and cancels both take it and re-check status
//  - lock order is book -> order -> account, never the reverse
//  - state_m_ is held shared by every operation and exclusively by
//    export_state()/load(), which therefore see a quiescent engine
// Order-update callbacks run after all locks are released, in the order the
// book produced them: every order lives on one book, so a per-book ticket
// taken under book.m keeps a fill from being reported after a cancel.
class MatchingEngine {
public:
    using OrderListener = std::function<void(const Order&)>;

    static constexpr double kEps = 1e-12;

    explicit MatchingEngine(const std::vector<std::string>& symbols);

    void set_order_listener(OrderListener l) { listener_ = std::move(l); }

    // Replaces all engine state. Call before ticks or orders are processed.
    void load(const EngineState& state);
    EngineState export_state() const;

    std::variant<Order, EngineError> submit_order(const OrderRequest& req);
    std::variant<Order, EngineError> cancel_order(const std::string& user_id, std::uint64_t order_id);
    std::variant<Order, EngineError> get_order(const std::string& user_id, std::uint64_t order_id) const;
    std::vector<Order> list_orders(const std::string& user_id) const;
    std::map<std::string, Balance> get_balance(const std::string& user_id) const;
    std::variant<Balance, EngineError> deposit(const std::string& user_id, const std::string& asset, double amount);

    void on_tick(const Tick& t);

    // Forgets filled/cancelled orders last updated before cutoff_ns: they stop
    // appearing in queries and snapshots. Returns how many were dropped.
    std::size_t prune_terminal(std::int64_t cutoff_ns);

    std::vector<std::string> symbols() const;
    std::uint64_t fills() const noexcept { return fills_.load(std::memory_order_relaxed); }

private:
    struct OrderSlot {
        mutable std::mutex m;
        Order o;
    };
    using SlotPtr = std::shared_ptr<OrderSlot>;

    struct Account {
        mutable std::mutex m;
        std::map<std::string, Balance> balances;
        std::vector<std::uint64_t> order_ids;
    };

    struct BookShard {
        explicit BookShard(const std::string& s);
        std::string symbol, base, quote;
        std::mutex m;
        TurnSequencer emit_order;
        TouchBook touch;
        BestTouch best; // consolidated view as of the last quote tick
        double bid_left{0.0}; // consolidated touch size not yet consumed by fills
        double ask_left{0.0};
        std::vector<SlotPtr> worklist; // non-terminal orders, ascending id
    };

    Account& account(const std::string& user_id);
    Account* find_account(const std::string& user_id) const;
    SlotPtr find_order(std::uint64_t id) const;

    // Caller holds book.m and slot.m.
    bool try_fill_unlocked(BookShard& book, OrderSlot& slot, std::int64_t now_ns);
    // Caller holds book.m; walks the worklist in id order.
    void match_book_unlocked(BookShard& book, std::int64_t now_ns, std::vector<Order>& updates);

    void emit(BookShard& book, std::uint64_t ticket, const std::vector<Order>& updates);

    std::unordered_map<std::string, std::unique_ptr<BookShard>> books_; // fixed at construction

    mutable std::shared_mutex accounts_m_;
    std::unordered_map<std::string, std::unique_ptr<Account>> accounts_;

    mutable std::shared_mutex orders_m_;
    std::unordered_map<std::uint64_t, SlotPtr> orders_;

    mutable std::shared_mutex state_m_;
    std::atomic<std::uint64_t> next_id_{1};
    std::atomic<std::uint64_t> fills_{0};

    OrderListener listener_;
};
