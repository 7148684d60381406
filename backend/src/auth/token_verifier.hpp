#pragma once
#include <optional>
#include <string>

// Resolves a bearer token to the username it was issued for.
struct ITokenVerifier {
    virtual ~ITokenVerifier() = default;
    virtual std::optional<std::string> verify(const std::string& token) const = 0;
};
