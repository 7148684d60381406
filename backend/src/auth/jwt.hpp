#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "auth/token_verifier.hpp"

// HS256 JSON Web Tokens carrying {sub, iat, exp}.
class JwtCodec : public ITokenVerifier {
public:
    JwtCodec(std::string secret, std::chrono::minutes ttl)
        : secret_(std::move(secret)), ttl_(ttl) {}

    std::string issue(const std::string& subject) const;
    std::string issue_at(const std::string& subject, std::int64_t now_s) const;

    // Subject of a well-formed, correctly signed, unexpired token.
    std::optional<std::string> verify(const std::string& token) const override;
    std::optional<std::string> verify_at(const std::string& token, std::int64_t now_s) const;

    std::chrono::minutes ttl() const noexcept { return ttl_; }

private:
    std::string secret_;
    std::chrono::minutes ttl_;
};
