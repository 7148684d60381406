#include "auth/jwt.hpp"
#include "auth/auth_utils.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::int64_t now_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

std::string JwtCodec::issue(const std::string& subject) const {
    return issue_at(subject, now_seconds());
}

std::string JwtCodec::issue_at(const std::string& subject, std::int64_t now_s) const {
    const json header = {{"alg", "HS256"}, {"typ", "JWT"}};
    const json payload = {
        {"sub", subject},
        {"iat", now_s},
        {"exp", now_s + static_cast<std::int64_t>(ttl_.count()) * 60},
    };
    const std::string signing_input = base64url_encode(header.dump()) + "." + base64url_encode(payload.dump());
    return signing_input + "." + base64url_encode(hmac_sha256(secret_, signing_input));
}

std::optional<std::string> JwtCodec::verify(const std::string& token) const {
    return verify_at(token, now_seconds());
}

std::optional<std::string> JwtCodec::verify_at(const std::string& token, std::int64_t now_s) const {
    const auto d1 = token.find('.');
    if (d1 == std::string::npos) return std::nullopt;
    const auto d2 = token.find('.', d1 + 1);
    if (d2 == std::string::npos || token.find('.', d2 + 1) != std::string::npos) return std::nullopt;

    const std::string signing_input = token.substr(0, d2);
    auto sig = base64url_decode(token.substr(d2 + 1));
    if (!sig || !bytes_equal(*sig, hmac_sha256(secret_, signing_input))) return std::nullopt;

    auto header_raw = base64url_decode(token.substr(0, d1));
    auto payload_raw = base64url_decode(token.substr(d1 + 1, d2 - d1 - 1));
    if (!header_raw || !payload_raw) return std::nullopt;

    json header = json::parse(*header_raw, nullptr, false);
    if (!header.is_object() || header.value("alg", std::string{}) != "HS256") return std::nullopt;

    json payload = json::parse(*payload_raw, nullptr, false);
    if (!payload.is_object()) return std::nullopt;

    auto sub = payload.find("sub");
    auto exp = payload.find("exp");
    if (sub == payload.end() || !sub->is_string()) return std::nullopt;
    if (exp == payload.end() || !exp->is_number()) return std::nullopt;
    if (exp->get<double>() <= static_cast<double>(now_s)) return std::nullopt;

    return sub->get<std::string>();
}
