#include "engine/matching_engine.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <iterator>

#include "md/symbol_codec.hpp"

namespace {

// Float residue from fills; anything this close to zero is zero.
void snap(Balance& b) {
    if (std::fabs(b.total) < MatchingEngine::kEps) b.total = 0.0;
    if (std::fabs(b.available) < MatchingEngine::kEps) b.available = 0.0;
    if (b.available > b.total && b.available - b.total < MatchingEngine::kEps) b.available = b.total;
}

std::string spent_asset(const Order& o) {
    auto [base, quote] = SymbolCodec::split(o.symbol);
    return o.side == Side::BUY ? quote : base;
}

std::string upper(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}

} // namespace

MatchingEngine::BookShard::BookShard(const std::string& s) : symbol(s), touch(s) {
    auto [b, q] = SymbolCodec::split(s);
    base = b;
    quote = q;
}

MatchingEngine::MatchingEngine(const std::vector<std::string>& symbols) {
    for (const auto& s : symbols) {
        if (s.empty() || books_.count(s)) continue;
        books_.emplace(s, std::make_unique<BookShard>(s));
    }
}

std::vector<std::string> MatchingEngine::symbols() const {
    std::vector<std::string> out;
    out.reserve(books_.size());
    for (const auto& kv : books_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

MatchingEngine::Account& MatchingEngine::account(const std::string& user_id) {
    {
        std::shared_lock lk(accounts_m_);
        auto it = accounts_.find(user_id);
        if (it != accounts_.end()) return *it->second;
    }
    std::unique_lock lk(accounts_m_);
    auto& slot = accounts_[user_id];
    if (!slot) slot = std::make_unique<Account>();
    return *slot;
}

MatchingEngine::Account* MatchingEngine::find_account(const std::string& user_id) const {
    std::shared_lock lk(accounts_m_);
    auto it = accounts_.find(user_id);
    return it == accounts_.end() ? nullptr : it->second.get();
}

MatchingEngine::SlotPtr MatchingEngine::find_order(std::uint64_t id) const {
    std::shared_lock lk(orders_m_);
    auto it = orders_.find(id);
    return it == orders_.end() ? nullptr : it->second;
}

// ---------------------------------------------------------------------------
// commands
// ---------------------------------------------------------------------------

std::variant<Order, EngineError> MatchingEngine::submit_order(const OrderRequest& req) {
    if (req.user_id.empty()) {
        return EngineError{ErrorCode::Unauthorized, "missing user"};
    }
    if (!std::isfinite(req.price) || req.price <= 0.0) {
        return EngineError{ErrorCode::InvalidOrder, "price must be positive"};
    }
    if (!std::isfinite(req.quantity) || req.quantity <= 0.0) {
        return EngineError{ErrorCode::InvalidOrder, "quantity must be positive"};
    }
    const std::string symbol = upper(req.symbol);
    auto bit = books_.find(symbol);
    if (bit == books_.end()) {
        return EngineError{ErrorCode::InvalidOrder, "unknown symbol " + req.symbol};
    }

    BookShard& book = *bit->second;
    std::vector<Order> updates;
    std::uint64_t ticket = 0;
    Order result;
    {
        std::shared_lock st(state_m_);
        std::lock_guard<std::mutex> bl(book.m);

        const std::string& asset = req.side == Side::BUY ? book.quote : book.base;
        const double need = req.side == Side::BUY ? req.price * req.quantity : req.quantity;
        const std::int64_t now = wall_clock_ns();

        auto slot = std::make_shared<OrderSlot>();
        {
            Account& acct = account(req.user_id);
            std::lock_guard<std::mutex> al(acct.m);
            auto balit = acct.balances.find(asset);
            const double available = balit == acct.balances.end() ? 0.0 : balit->second.available;
            if (need > available + kEps) {
                return EngineError{ErrorCode::InsufficientBalance,
                                   "insufficient " + asset + " balance"};
            }
            Balance& b = acct.balances[asset];
            b.available -= need;
            snap(b);

            Order& o = slot->o;
            o.id = next_id_.fetch_add(1, std::memory_order_relaxed);
            o.user_id = req.user_id;
            o.symbol = symbol;
            o.side = req.side;
            o.price = req.price;
            o.quantity = req.quantity;
            o.reserved = need;
            o.status = OrderStatus::OPEN;
            o.created_at_ns = o.updated_at_ns = now;
            acct.order_ids.push_back(o.id);
        }
        {
            std::unique_lock lk(orders_m_);
            orders_.emplace(slot->o.id, slot);
        }

        std::lock_guard<std::mutex> ol(slot->m);
        updates.push_back(slot->o);
        if (try_fill_unlocked(book, *slot, now)) updates.push_back(slot->o);
        if (!is_terminal(slot->o.status)) book.worklist.push_back(slot);
        result = slot->o;
        ticket = book.emit_order.take();
    }
    emit(book, ticket, updates);
    return result;
}

std::variant<Order, EngineError> MatchingEngine::cancel_order(const std::string& user_id, std::uint64_t order_id) {
    std::vector<Order> updates;
    BookShard* book = nullptr;
    std::uint64_t ticket = 0;
    Order result;
    {
        std::shared_lock st(state_m_);
        SlotPtr slot = find_order(order_id);
        if (!slot) {
            return EngineError{ErrorCode::NotFound, "order not found"};
        }
        std::string symbol;
        {
            std::lock_guard<std::mutex> ol(slot->m);
            if (slot->o.user_id != user_id) {
                return EngineError{ErrorCode::NotFound, "order not found"};
            }
            symbol = slot->o.symbol;
        }

        auto bit = books_.find(symbol);
        book = bit == books_.end() ? nullptr : bit->second.get();
        std::unique_lock<std::mutex> bl;
        if (book) bl = std::unique_lock<std::mutex>(book->m);

        std::lock_guard<std::mutex> ol(slot->m);
        Order& o = slot->o;
        if (is_terminal(o.status)) {
            return EngineError{ErrorCode::AlreadyTerminal,
                               std::string("order already ") + to_cstr(o.status)};
        }
        {
            Account& acct = account(o.user_id);
            std::lock_guard<std::mutex> al(acct.m);
            Balance& b = acct.balances[spent_asset(o)];
            b.available += o.reserved;
            snap(b);
        }
        o.reserved = 0.0;
        o.status = OrderStatus::CANCELLED;
        o.updated_at_ns = wall_clock_ns();

        if (book) {
            auto& wl = book->worklist;
            wl.erase(std::remove(wl.begin(), wl.end(), slot), wl.end());
            ticket = book->emit_order.take();
        }
        result = o;
        updates.push_back(o);
    }
    if (book) {
        emit(*book, ticket, updates);
    } else if (listener_) {
        // off-book orders never fill, so there is nothing to order against
        listener_(result);
    }
    return result;
}

std::variant<Balance, EngineError> MatchingEngine::deposit(const std::string& user_id, const std::string& asset,
                                                           double amount) {
    if (user_id.empty()) {
        return EngineError{ErrorCode::Unauthorized, "missing user"};
    }
    if (asset.empty()) {
        return EngineError{ErrorCode::InvalidOrder, "asset is required"};
    }
    if (!std::isfinite(amount) || amount <= 0.0) {
        return EngineError{ErrorCode::InvalidOrder, "amount must be positive"};
    }

    std::shared_lock st(state_m_);
    Account& acct = account(user_id);
    std::lock_guard<std::mutex> al(acct.m);
    Balance& b = acct.balances[upper(asset)];
    b.total += amount;
    b.available += amount;
    return b;
}

// ---------------------------------------------------------------------------
// queries
// ---------------------------------------------------------------------------

std::variant<Order, EngineError> MatchingEngine::get_order(const std::string& user_id,
                                                           std::uint64_t order_id) const {
    SlotPtr slot = find_order(order_id);
    if (!slot) return EngineError{ErrorCode::NotFound, "order not found"};
    std::lock_guard<std::mutex> ol(slot->m);
    if (slot->o.user_id != user_id) return EngineError{ErrorCode::NotFound, "order not found"};
    return slot->o;
}

std::vector<Order> MatchingEngine::list_orders(const std::string& user_id) const {
    std::vector<std::uint64_t> ids;
    if (Account* acct = find_account(user_id)) {
        std::lock_guard<std::mutex> al(acct->m);
        ids = acct->order_ids;
    }
    // Account lock released before taking order locks (lock order).
    std::vector<Order> out;
    out.reserve(ids.size());
    for (auto id : ids) {
        SlotPtr slot = find_order(id);
        if (!slot) continue;
        std::lock_guard<std::mutex> ol(slot->m);
        out.push_back(slot->o);
    }
    std::sort(out.begin(), out.end(), [](const Order& a, const Order& b) { return a.id < b.id; });
    return out;
}

std::map<std::string, Balance> MatchingEngine::get_balance(const std::string& user_id) const {
    Account* acct = find_account(user_id);
    if (!acct) return {};
    std::lock_guard<std::mutex> al(acct->m);
    return acct->balances;
}

// ---------------------------------------------------------------------------
// market data
// ---------------------------------------------------------------------------

void MatchingEngine::on_tick(const Tick& t) {
    if (t.kind != TickKind::Quote) return;
    auto bit = books_.find(t.symbol);
    if (bit == books_.end()) return;

    BookShard& book = *bit->second;
    std::vector<Order> updates;
    std::uint64_t ticket = 0;
    {
        std::shared_lock st(state_m_);
        std::lock_guard<std::mutex> bl(book.m);
        if (!book.touch.apply(t)) return;

        // A fresh quote resets the consumable size at the touch.
        book.best = book.touch.consolidated();
        book.bid_left = book.best.has_bid() ? book.best.bid_size : 0.0;
        book.ask_left = book.best.has_ask() ? book.best.ask_size : 0.0;

        match_book_unlocked(book, wall_clock_ns(), updates);
        if (updates.empty()) return;
        ticket = book.emit_order.take();
    }
    emit(book, ticket, updates);
}

void MatchingEngine::match_book_unlocked(BookShard& book, std::int64_t now_ns, std::vector<Order>& updates) {
    auto& wl = book.worklist;
    std::size_t keep = 0;
    for (std::size_t i = 0; i < wl.size(); ++i) {
        SlotPtr& slot = wl[i];
        bool live = true;
        if (book.bid_left > kEps || book.ask_left > kEps) {
            std::lock_guard<std::mutex> ol(slot->m);
            if (try_fill_unlocked(book, *slot, now_ns)) updates.push_back(slot->o);
            live = !is_terminal(slot->o.status);
        }
        if (live) {
            if (keep != i) wl[keep] = std::move(slot);
            ++keep;
        }
    }
    wl.resize(keep);
}

bool MatchingEngine::try_fill_unlocked(BookShard& book, OrderSlot& slot, std::int64_t now_ns) {
    Order& o = slot.o;
    if (is_terminal(o.status)) return false;

    double* left = nullptr;
    if (o.side == Side::BUY) {
        if (!book.best.has_ask() || o.price < book.best.ask) return false;
        left = &book.ask_left;
    } else {
        if (!book.best.has_bid() || o.price > book.best.bid) return false;
        left = &book.bid_left;
    }
    if (*left <= kEps) return false;

    const double qty = std::min(o.remaining(), *left);
    if (qty <= kEps) return false;
    *left -= qty;

    {
        Account& acct = account(o.user_id);
        std::lock_guard<std::mutex> al(acct.m);
        Balance& base = acct.balances[book.base];
        Balance& quote = acct.balances[book.quote];

        if (o.side == Side::BUY) {
            const double spent = std::min(qty * o.price, o.reserved);
            quote.total -= spent;
            o.reserved -= spent;
            base.total += qty;
            base.available += qty;
        } else {
            const double spent = std::min(qty, o.reserved);
            base.total -= spent;
            o.reserved -= spent;
            quote.total += qty * o.price;
            quote.available += qty * o.price;
        }

        o.filled_quantity += qty;
        if (o.remaining() <= kEps) {
            o.filled_quantity = o.quantity;
            o.status = OrderStatus::FILLED;
            // leftover reservation (rounding) goes back to available
            Balance& spent_bal = o.side == Side::BUY ? quote : base;
            spent_bal.available += o.reserved;
            o.reserved = 0.0;
        } else {
            o.status = OrderStatus::PARTIALLY_FILLED;
        }
        snap(base);
        snap(quote);
    }
    o.updated_at_ns = now_ns;
    fills_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

// ---------------------------------------------------------------------------
// lifecycle
// ---------------------------------------------------------------------------

std::size_t MatchingEngine::prune_terminal(std::int64_t cutoff_ns) {
    std::shared_lock st(state_m_);
    std::unordered_map<std::string, std::vector<std::uint64_t>> gone; // user -> ids
    {
        std::unique_lock lk(orders_m_);
        for (auto it = orders_.begin(); it != orders_.end();) {
            bool drop = false;
            {
                std::lock_guard<std::mutex> ol(it->second->m);
                const Order& o = it->second->o;
                drop = is_terminal(o.status) && o.updated_at_ns < cutoff_ns;
                if (drop) gone[o.user_id].push_back(o.id);
            }
            it = drop ? orders_.erase(it) : std::next(it);
        }
    }

    std::size_t n = 0;
    for (auto& [user, ids] : gone) {
        n += ids.size();
        Account* acct = find_account(user);
        if (!acct) continue;
        std::sort(ids.begin(), ids.end());
        std::lock_guard<std::mutex> al(acct->m);
        auto& owned = acct->order_ids;
        owned.erase(std::remove_if(owned.begin(), owned.end(),
                                   [&ids](std::uint64_t id) {
                                       return std::binary_search(ids.begin(), ids.end(), id);
                                   }),
                    owned.end());
    }
    return n;
}

EngineState MatchingEngine::export_state() const {
    std::unique_lock st(state_m_);
    EngineState out;
    {
        std::shared_lock lk(accounts_m_);
        for (const auto& [user, acct] : accounts_) {
            std::lock_guard<std::mutex> al(acct->m);
            if (!acct->balances.empty()) out.balances[user] = acct->balances;
        }
    }
    {
        std::shared_lock lk(orders_m_);
        out.orders.reserve(orders_.size());
        for (const auto& kv : orders_) {
            std::lock_guard<std::mutex> ol(kv.second->m);
            out.orders.push_back(kv.second->o);
        }
    }
    std::sort(out.orders.begin(), out.orders.end(),
              [](const Order& a, const Order& b) { return a.id < b.id; });
    out.next_order_id = next_id_.load();
    return out;
}

void MatchingEngine::load(const EngineState& state) {
    std::unique_lock st(state_m_);
    std::unique_lock al(accounts_m_);
    std::unique_lock ol(orders_m_);

    accounts_.clear();
    orders_.clear();
    for (auto& kv : books_) {
        std::lock_guard<std::mutex> bl(kv.second->m);
        kv.second->worklist.clear();
    }

    for (const auto& [user, balances] : state.balances) {
        auto acct = std::make_unique<Account>();
        acct->balances = balances;
        accounts_.emplace(user, std::move(acct));
    }

    std::uint64_t next_id = std::max<std::uint64_t>(1, state.next_order_id);
    std::size_t open = 0;
    std::vector<Order> sorted = state.orders;
    std::sort(sorted.begin(), sorted.end(), [](const Order& a, const Order& b) { return a.id < b.id; });

    for (const auto& o : sorted) {
        if (o.id == 0 || orders_.count(o.id)) {
            std::cerr << "[engine] skipping order with bad or duplicate id " << o.id << std::endl;
            continue;
        }
        auto slot = std::make_shared<OrderSlot>();
        slot->o = o;
        orders_.emplace(o.id, slot);
        next_id = std::max(next_id, o.id + 1);

        auto& acct = accounts_[o.user_id];
        if (!acct) acct = std::make_unique<Account>();
        acct->order_ids.push_back(o.id);

        if (is_terminal(o.status)) continue;
        auto bit = books_.find(o.symbol);
        if (bit == books_.end()) {
            std::cerr << "[engine] order " << o.id << " rests on unconfigured symbol "
                      << o.symbol << "; it will not match" << std::endl;
            continue;
        }
        bit->second->worklist.push_back(slot); // ascending id: input is sorted
        ++open;
    }
    next_id_.store(next_id);

    std::cout << "[engine] loaded " << accounts_.size() << " accounts, " << orders_.size()
              << " orders (" << open << " open), next id " << next_id << std::endl;
}

void MatchingEngine::emit(BookShard& book, std::uint64_t ticket, const std::vector<Order>& updates) {
    book.emit_order.run(ticket, [&] {
        if (!listener_) return;
        for (const auto& o : updates) listener_(o);
    });
}
