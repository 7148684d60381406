#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "engine/order.hpp"

// Everything the matching engine needs to resume: balances, every order
// (terminal ones included, for history) and the id counter.
struct EngineState {
    std::map<std::string, std::map<std::string, Balance>> balances; // user -> asset -> balance
    std::vector<Order> orders;
    std::uint64_t next_order_id{1};
};
