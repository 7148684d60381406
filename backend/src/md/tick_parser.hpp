#pragma once
#include "tick.hpp"
#include <cstdint>
#include <string>
#include <vector>

enum class ParseResult : uint8_t {
    Parsed,    // one or more ticks appended
    Ignored,   // well-formed control frame (acks, pongs, heartbeats)
    Malformed  // unparseable or missing required fields
};

// Uniform interface for any venue parser (quotes + trades).
struct ITickParser {
    virtual ~ITickParser() = default;

    // Parse a raw JSON text frame into zero or more canonical ticks.
    // Must never throw on bad input; report Malformed instead.
    virtual ParseResult parse(const std::string& raw, std::vector<Tick>& out) = 0;
};
