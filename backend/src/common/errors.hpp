#pragma once
#include <cstdint>
#include <string>

// Error kinds surfaced by the engines and the client protocol.
enum class ErrorCode : uint8_t {
    InvalidOrder,        // bad price / quantity / symbol / amount
    InsufficientBalance,
    NotFound,            // unknown order or not owned by the caller
    AlreadyTerminal,     // order already filled or cancelled
    Unauthorized,
    Stale,               // feed gap, advisory only
    Malformed,           // unparseable exchange or client message
};

inline const char* to_cstr(ErrorCode c) {
    switch (c) {
        case ErrorCode::InvalidOrder:        return "invalid_order";
        case ErrorCode::InsufficientBalance: return "insufficient_balance";
        case ErrorCode::NotFound:            return "not_found";
        case ErrorCode::AlreadyTerminal:     return "already_terminal";
        case ErrorCode::Unauthorized:        return "unauthorized";
        case ErrorCode::Stale:               return "stale";
        case ErrorCode::Malformed:           return "malformed";
    }
    return "?";
}

struct EngineError {
    ErrorCode code;
    std::string message;
};
