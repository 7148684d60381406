#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <sstream>
#include <iomanip>

#include "engine/market_events.hpp"
#include "engine/order.hpp"
#include "md/tick.hpp"

// Hot-path encoders for outbound stream frames. Control replies and REST
// bodies go through nlohmann::json instead.

// Basic JSON string escaper
inline std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// "1s", "10s", "1m", "5m", "1h"
inline std::string interval_label(int interval_s) {
    if (interval_s >= 3600 && interval_s % 3600 == 0) return std::to_string(interval_s / 3600) + "h";
    if (interval_s >= 60 && interval_s % 60 == 0) return std::to_string(interval_s / 60) + "m";
    return std::to_string(interval_s) + "s";
}

inline double ns_to_seconds(std::int64_t ns) {
    return static_cast<double>(ns) / static_cast<double>(kNsPerSec);
}

// Writes `null` for unknown (non-positive) prices.
inline void json_price_or_null(std::ostringstream& os, double px) {
    if (px > 0.0) os << std::setprecision(15) << px;
    else os << "null";
}

inline void json_str_or_null(std::ostringstream& os, const std::string& s) {
    if (s.empty()) os << "null";
    else os << "\"" << json_escape(s) << "\"";
}

// {"type":"best_touch","data":{...}}
inline std::string encode_best_touch(const BestTouchUpdated& ev) {
    const BestTouch& t = ev.touch;
    std::ostringstream os;
    os << "{\"type\":\"best_touch\",\"data\":{"
       << "\"symbol\":\"" << json_escape(ev.symbol) << "\","
       << "\"exchange\":\"" << json_escape(ev.scope) << "\","
       << "\"best_bid\":"; json_price_or_null(os, t.bid); os << ","
       << "\"bid_size\":" << std::setprecision(15) << t.bid_size << ","
       << "\"best_ask\":"; json_price_or_null(os, t.ask); os << ","
       << "\"ask_size\":" << std::setprecision(15) << t.ask_size << ","
       << "\"best_bid_exchange\":"; json_str_or_null(os, t.bid_venue); os << ","
       << "\"best_ask_exchange\":"; json_str_or_null(os, t.ask_venue); os << ","
       << "\"timestamp\":" << std::setprecision(15) << ns_to_seconds(t.updated_at_ns)
       << "}}";
    return os.str();
}

// {"type":"trades","data":{...}}
inline std::string encode_trade(const TradePassThrough& ev) {
    std::ostringstream os;
    os << "{\"type\":\"trades\",\"data\":{"
       << "\"symbol\":\"" << json_escape(ev.symbol) << "\","
       << "\"exchange\":\"" << json_escape(ev.venue) << "\","
       << "\"price\":" << std::setprecision(15) << ev.price << ","
       << "\"quantity\":" << std::setprecision(15) << ev.size << ","
       << "\"timestamp\":" << std::setprecision(15) << ns_to_seconds(ev.ts_ns)
       << "}}";
    return os.str();
}

// {"type":"klines","data":{...}}; closed=true on the final update of a window
inline std::string encode_kline(const std::string& symbol, const std::string& scope,
                                int interval_s, const KlineBucket& b) {
    std::ostringstream os;
    os << "{\"type\":\"klines\",\"data\":{"
       << "\"symbol\":\"" << json_escape(symbol) << "\","
       << "\"exchange\":\"" << json_escape(scope) << "\","
       << "\"interval\":\"" << interval_label(interval_s) << "\","
       << "\"start\":" << std::setprecision(15) << ns_to_seconds(b.start_ns) << ","
       << "\"end\":" << std::setprecision(15) << ns_to_seconds(b.end_ns) << ","
       << "\"open\":" << std::setprecision(15) << b.open << ","
       << "\"high\":" << std::setprecision(15) << b.high << ","
       << "\"low\":" << std::setprecision(15) << b.low << ","
       << "\"close\":" << std::setprecision(15) << b.close << ","
       << "\"volume\":" << std::setprecision(15) << b.volume << ","
       << "\"closed\":" << (b.closed ? "true" : "false")
       << "}}";
    return os.str();
}

// {"type":"ewma","data":{...}}
inline std::string encode_ewma(const EwmaUpdated& ev) {
    std::ostringstream os;
    os << "{\"type\":\"ewma\",\"data\":{"
       << "\"symbol\":\"" << json_escape(ev.symbol) << "\","
       << "\"exchange\":\"" << json_escape(ev.scope) << "\","
       << "\"half_life\":" << std::setprecision(15) << ev.half_life_s << ","
       << "\"value\":" << std::setprecision(15) << ev.state.value << ","
       << "\"timestamp\":" << std::setprecision(15) << ns_to_seconds(ev.state.last_ts_ns)
       << "}}";
    return os.str();
}

// Order object without envelope (REST bodies embed it as-is).
inline void json_order(std::ostringstream& os, const Order& o) {
    os << "{"
       << "\"id\":" << o.id << ","
       << "\"user\":\"" << json_escape(o.user_id) << "\","
       << "\"symbol\":\"" << json_escape(o.symbol) << "\","
       << "\"side\":\"" << to_cstr(o.side) << "\","
       << "\"price\":" << std::setprecision(15) << o.price << ","
       << "\"quantity\":" << std::setprecision(15) << o.quantity << ","
       << "\"filled_quantity\":" << std::setprecision(15) << o.filled_quantity << ","
       << "\"reserved\":" << std::setprecision(15) << o.reserved << ","
       << "\"status\":\"" << to_cstr(o.status) << "\","
       << "\"created_at\":" << std::setprecision(15) << ns_to_seconds(o.created_at_ns) << ","
       << "\"updated_at\":" << std::setprecision(15) << ns_to_seconds(o.updated_at_ns)
       << "}";
}

inline std::string encode_order(const Order& o) {
    std::ostringstream os;
    json_order(os, o);
    return os.str();
}

// {"type":"order","data":{...}}
inline std::string encode_order_update(const Order& o) {
    std::ostringstream os;
    os << "{\"type\":\"order\",\"data\":";
    json_order(os, o);
    os << "}";
    return os.str();
}
