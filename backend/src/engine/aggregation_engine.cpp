#include "engine/aggregation_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace {

// Upper bound on empty windows synthesized in one roll. A larger jump means a
// bogus exchange timestamp or a suspended host; we skip ahead instead of
// flooding subscribers.
constexpr std::int64_t kMaxGapBuckets = 3600;

KlineBucket open_bucket(std::int64_t start_ns, std::int64_t len_ns, double price, double size) {
    KlineBucket b;
    b.open = b.high = b.low = b.close = price;
    b.volume = size;
    b.start_ns = start_ns;
    b.end_ns = start_ns + len_ns;
    return b;
}

KlineBucket flat_bucket(std::int64_t start_ns, std::int64_t len_ns, double last_close) {
    return open_bucket(start_ns, len_ns, last_close, 0.0);
}

} // namespace

AggregationEngine::AggregationEngine(std::vector<int> kline_intervals_s)
    : intervals_(std::move(kline_intervals_s)) {
    intervals_.erase(std::remove_if(intervals_.begin(), intervals_.end(),
                                    [](int i) { return i <= 0; }),
                     intervals_.end());
    std::sort(intervals_.begin(), intervals_.end());
    intervals_.erase(std::unique(intervals_.begin(), intervals_.end()), intervals_.end());
}

double AggregationEngine::ewma_step(double prev, std::int64_t prev_ts_ns,
                                    double price, std::int64_t ts_ns, double half_life_s) {
    if (half_life_s <= 0.0) return price;
    const double dt_s = static_cast<double>(std::max<std::int64_t>(0, ts_ns - prev_ts_ns)) / kNsPerSec;
    const double alpha = std::exp2(-dt_s / half_life_s);
    return alpha * prev + (1.0 - alpha) * price;
}

std::int64_t AggregationEngine::bucket_start(std::int64_t ts_ns, int interval_s) {
    const std::int64_t len = static_cast<std::int64_t>(interval_s) * kNsPerSec;
    std::int64_t q = ts_ns / len;
    if (ts_ns % len < 0) --q; // floor for pre-epoch timestamps
    return q * len;
}

AggregationEngine::SymbolShard& AggregationEngine::shard(const std::string& symbol) {
    {
        std::shared_lock lk(index_m_);
        auto it = index_.find(symbol);
        if (it != index_.end()) return *shards_[it->second];
    }
    std::unique_lock lk(index_m_);
    auto it = index_.find(symbol);
    if (it != index_.end()) return *shards_[it->second];
    shards_.push_back(std::make_unique<SymbolShard>(symbol));
    index_.emplace(symbol, shards_.size() - 1);
    return *shards_.back();
}

AggregationEngine::SymbolShard* AggregationEngine::find_shard(const std::string& symbol) const {
    std::shared_lock lk(index_m_);
    auto it = index_.find(symbol);
    if (it == index_.end()) return nullptr;
    return shards_[it->second].get();
}

void AggregationEngine::on_tick(const Tick& t) {
    if (t.symbol.empty() || t.venue.empty() || t.venue == kAllScope) return;

    if (t.after_gap) {
        gaps_.fetch_add(1, std::memory_order_relaxed);
        std::cout << "[agg] " << t.venue << " " << t.symbol
                  << " resumed after a feed gap" << std::endl;
    }

    SymbolShard& sh = shard(t.symbol);
    std::vector<MarketEvent> evs;
    std::uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lk(sh.m);

        if (t.kind == TickKind::Quote) {
            apply_quote_unlocked(sh, t, evs);
        } else {
            if (!(t.trade_price > 0.0) || t.trade_size < 0.0) return;
            evs.emplace_back(TradePassThrough{t.symbol, t.venue, t.trade_price, t.trade_size, t.ts_ns});
            apply_trade_unlocked(sh, t.venue, t, evs);
            apply_trade_unlocked(sh, kAllScope, t, evs);
        }
        if (evs.empty()) return;
        ticket = sh.emit_order.take();
    }
    emit(sh, ticket, evs);
}

void AggregationEngine::apply_quote_unlocked(SymbolShard& sh, const Tick& t, std::vector<MarketEvent>& out) {
    if (!sh.touch.apply(t)) return;

    if (auto venue_touch = sh.touch.venue(t.venue)) {
        out.emplace_back(BestTouchUpdated{sh.symbol, t.venue, *venue_touch});
    }
    out.emplace_back(BestTouchUpdated{sh.symbol, kAllScope, sh.touch.consolidated()});
}

void AggregationEngine::apply_trade_unlocked(SymbolShard& sh, const std::string& scope, const Tick& t,
                                             std::vector<MarketEvent>& out) {
    ScopeState& st = sh.scopes[scope];
    if (t.ts_ns <= st.last_trade_ns) {
        late_trades_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    st.last_trade_ns = t.ts_ns;

    for (int interval : intervals_) {
        update_kline_unlocked(sh.symbol, scope, interval, st, t, out);
    }

    for (auto& [half_life, slot] : st.ewma) {
        EwmaState& e = slot.state;
        if (!e.initialized) {
            e.value = t.trade_price;
            e.initialized = true;
        } else {
            e.value = ewma_step(e.value, e.last_ts_ns, t.trade_price, t.ts_ns, half_life);
        }
        e.last_ts_ns = t.ts_ns;
        out.emplace_back(EwmaUpdated{sh.symbol, scope, half_life, e});
    }
}

void AggregationEngine::update_kline_unlocked(const std::string& symbol, const std::string& scope, int interval_s,
                                              ScopeState& st, const Tick& t, std::vector<MarketEvent>& out) {
    const std::int64_t len = static_cast<std::int64_t>(interval_s) * kNsPerSec;
    const std::int64_t start = bucket_start(t.ts_ns, interval_s);

    auto it = st.klines.find(interval_s);
    if (it == st.klines.end()) {
        it = st.klines.emplace(interval_s, open_bucket(start, len, t.trade_price, t.trade_size)).first;
        out.emplace_back(KlineUpdated{symbol, scope, interval_s, it->second});
        return;
    }

    KlineBucket& b = it->second;
    if (t.ts_ns < b.start_ns) {
        // advance() already rolled past this window
        return;
    }
    if (t.ts_ns >= b.end_ns) {
        close_through(symbol, scope, interval_s, b, start, out);
        b = open_bucket(start, len, t.trade_price, t.trade_size);
    } else {
        b.high = std::max(b.high, t.trade_price);
        b.low = std::min(b.low, t.trade_price);
        b.close = t.trade_price;
        b.volume += t.trade_size;
    }
    out.emplace_back(KlineUpdated{symbol, scope, interval_s, b});
}

void AggregationEngine::close_through(const std::string& symbol, const std::string& scope, int interval_s,
                                      KlineBucket& b, std::int64_t target_start_ns,
                                      std::vector<MarketEvent>& out) {
    const std::int64_t len = static_cast<std::int64_t>(interval_s) * kNsPerSec;

    if ((target_start_ns - b.end_ns) / len > kMaxGapBuckets) {
        std::cerr << "[agg] " << symbol << "/" << scope << " " << interval_s
                  << "s kline gap too large; skipping empty windows" << std::endl;
        b.closed = true;
        out.emplace_back(KlineClosed{symbol, scope, interval_s, b});
        b = flat_bucket(target_start_ns - len, len, b.close);
    }

    for (;;) {
        b.closed = true;
        out.emplace_back(KlineClosed{symbol, scope, interval_s, b});
        if (b.end_ns >= target_start_ns) break;
        b = flat_bucket(b.end_ns, len, b.close);
    }
}

void AggregationEngine::advance(std::int64_t now_ns) {
    std::vector<SymbolShard*> all;
    {
        std::shared_lock lk(index_m_);
        all.reserve(shards_.size());
        for (auto& sp : shards_) all.push_back(sp.get());
    }

    for (SymbolShard* sh : all) {
        std::vector<MarketEvent> evs;
        std::uint64_t ticket = 0;
        {
            std::lock_guard<std::mutex> lk(sh->m);
            for (auto& [scope, st] : sh->scopes) {
                for (auto& [interval, b] : st.klines) {
                    if (b.end_ns > now_ns) continue;
                    const std::int64_t len = static_cast<std::int64_t>(interval) * kNsPerSec;
                    const std::int64_t target = bucket_start(now_ns, interval);
                    close_through(sh->symbol, scope, interval, b, target, evs);
                    b = flat_bucket(target, len, b.close);
                    evs.emplace_back(KlineUpdated{sh->symbol, scope, interval, b});
                }
            }
            if (evs.empty()) continue;
            ticket = sh->emit_order.take();
        }
        emit(*sh, ticket, evs);
    }
}

void AggregationEngine::retain_ewma(const std::string& symbol, const std::string& scope, double half_life_s) {
    if (!(half_life_s > 0.0)) return;
    SymbolShard& sh = shard(symbol);
    std::lock_guard<std::mutex> lk(sh.m);
    sh.scopes[scope].ewma[half_life_s].refs++;
}

void AggregationEngine::release_ewma(const std::string& symbol, const std::string& scope, double half_life_s) {
    SymbolShard* sh = find_shard(symbol);
    if (!sh) return;
    std::lock_guard<std::mutex> lk(sh->m);
    auto sit = sh->scopes.find(scope);
    if (sit == sh->scopes.end()) return;
    auto eit = sit->second.ewma.find(half_life_s);
    if (eit == sit->second.ewma.end()) return;
    if (eit->second.refs <= 1) {
        sit->second.ewma.erase(eit);
    } else {
        eit->second.refs--;
    }
}

std::optional<BestTouch> AggregationEngine::best_touch(const std::string& symbol, const std::string& scope) const {
    SymbolShard* sh = find_shard(symbol);
    if (!sh) return std::nullopt;
    std::lock_guard<std::mutex> lk(sh->m);
    if (scope == kAllScope) {
        if (sh->touch.empty()) return std::nullopt;
        return sh->touch.consolidated();
    }
    return sh->touch.venue(scope);
}

std::optional<KlineBucket> AggregationEngine::kline(const std::string& symbol, const std::string& scope,
                                                    int interval_s) const {
    SymbolShard* sh = find_shard(symbol);
    if (!sh) return std::nullopt;
    std::lock_guard<std::mutex> lk(sh->m);
    auto sit = sh->scopes.find(scope);
    if (sit == sh->scopes.end()) return std::nullopt;
    auto kit = sit->second.klines.find(interval_s);
    if (kit == sit->second.klines.end()) return std::nullopt;
    return kit->second;
}

std::optional<EwmaState> AggregationEngine::ewma(const std::string& symbol, const std::string& scope,
                                                 double half_life_s) const {
    SymbolShard* sh = find_shard(symbol);
    if (!sh) return std::nullopt;
    std::lock_guard<std::mutex> lk(sh->m);
    auto sit = sh->scopes.find(scope);
    if (sit == sh->scopes.end()) return std::nullopt;
    auto eit = sit->second.ewma.find(half_life_s);
    if (eit == sit->second.ewma.end()) return std::nullopt;
    return eit->second.state;
}

std::vector<std::string> AggregationEngine::symbols() const {
    std::shared_lock lk(index_m_);
    std::vector<std::string> out;
    out.reserve(index_.size());
    for (const auto& kv : index_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void AggregationEngine::emit(SymbolShard& sh, std::uint64_t ticket, std::vector<MarketEvent>& evs) {
    sh.emit_order.run(ticket, [&] {
        if (!listener_) return;
        for (const auto& ev : evs) listener_(ev);
    });
}
