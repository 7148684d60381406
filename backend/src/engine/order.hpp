#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

enum class Side { BUY, SELL };

enum class OrderStatus { OPEN, PARTIALLY_FILLED, FILLED, CANCELLED };

inline const char* to_cstr(Side s){ return s==Side::BUY?"buy":"sell"; }
inline const char* to_cstr(OrderStatus st){
    switch(st){
        case OrderStatus::OPEN: return "open";
        case OrderStatus::PARTIALLY_FILLED: return "partially_filled";
        case OrderStatus::FILLED: return "filled";
        case OrderStatus::CANCELLED: return "cancelled";
    }
    return "?";
}

inline bool is_terminal(OrderStatus st){
    return st==OrderStatus::FILLED || st==OrderStatus::CANCELLED;
}

// Accepts "buy"/"sell" in any case.
inline std::optional<Side> parse_side(std::string s){
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s=="buy") return Side::BUY;
    if (s=="sell") return Side::SELL;
    return std::nullopt;
}

inline std::optional<OrderStatus> parse_status(const std::string& s){
    if (s=="open") return OrderStatus::OPEN;
    if (s=="partially_filled") return OrderStatus::PARTIALLY_FILLED;
    if (s=="filled") return OrderStatus::FILLED;
    if (s=="cancelled") return OrderStatus::CANCELLED;
    return std::nullopt;
}

struct Order {
    std::uint64_t id{0};      // assigned by the engine, ascending in submission order
    std::string user_id;
    std::string symbol;       // canonical, e.g. BTCUSDT
    Side side{Side::BUY};
    double price{0.0};        // limit price
    double quantity{0.0};
    double filled_quantity{0.0};
    double reserved{0.0};     // amount of the spent asset still held for this order
    OrderStatus status{OrderStatus::OPEN};
    std::int64_t created_at_ns{0};
    std::int64_t updated_at_ns{0};

    double remaining() const { return quantity - filled_quantity; }
};

// Per (user, asset). total - available is what open orders hold.
struct Balance {
    double total{0.0};
    double available{0.0};

    double reserved() const { return total - available; }
};
