#include "server/http_routes.hpp"

#include <boost/url.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <limits>
#include <optional>
#include <set>
#include <sstream>
#include <string_view>

#include "md/symbol_codec.hpp"
#include "util/json_encode.hpp"

namespace urls = boost::urls;
using json = nlohmann::json;

std::vector<std::string> assets_of(const std::vector<std::string>& pairs) {
    std::set<std::string> assets;
    for (const auto& p : pairs) {
        auto [base, quote] = SymbolCodec::split(p);
        if (!base.empty()) assets.insert(base);
        if (!quote.empty()) assets.insert(quote);
    }
    return {assets.begin(), assets.end()};
}

http::status http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:     return http::status::not_found;
        case ErrorCode::Unauthorized: return http::status::unauthorized;
        case ErrorCode::Stale:        return http::status::service_unavailable;
        case ErrorCode::InvalidOrder:
        case ErrorCode::InsufficientBalance:
        case ErrorCode::AlreadyTerminal:
        case ErrorCode::Malformed:
            return http::status::bad_request;
    }
    return http::status::bad_request;
}

namespace {

void reply(http::response<http::string_body>& res, http::status st, std::string body) {
    res.result(st);
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(body);
}

void reply_error(http::response<http::string_body>& res, const EngineError& err) {
    json body = {{"error", err.message}, {"code", to_cstr(err.code)}};
    reply(res, http_status_for(err.code), body.dump());
}

// "Authorization: Bearer <jwt>" -> username of a registered user.
std::optional<std::string> bearer_user(ApiContext& ctx, const http::request<http::string_body>& req) {
    auto it = req.find(http::field::authorization);
    if (it == req.end()) return std::nullopt;
    std::string value(it->value().data(), it->value().size());
    static const std::string kPrefix = "Bearer ";
    if (value.size() <= kPrefix.size() || value.compare(0, kPrefix.size(), kPrefix) != 0) return std::nullopt;

    return RegisteredUserVerifier(ctx.jwt, ctx.users).verify(value.substr(kPrefix.size()));
}

std::optional<std::uint64_t> parse_order_id(std::string_view s) {
    if (s.empty()) return std::nullopt;
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (v > (kMax - digit) / 10) return std::nullopt; // overflow
        v = v * 10 + digit;
    }
    return v;
}

std::string token_body(const std::string& token) {
    json body = {{"access_token", token}, {"token_type", "bearer"}};
    return body.dump();
}

void orders_route(ApiContext& ctx, const std::string& user,
                  const http::request<http::string_body>& req,
                  http::response<http::string_body>& res,
                  std::string_view path)
{
    // POST /orders
    if (path == "/orders" && req.method() == http::verb::post) {
        json j = json::parse(req.body());
        auto side = parse_side(j.at("side").get<std::string>());
        if (!side) {
            reply_error(res, EngineError{ErrorCode::InvalidOrder, "side must be buy or sell"});
            return;
        }
        OrderRequest o{user, j.at("symbol").get<std::string>(), *side,
                       j.at("price").get<double>(), j.at("quantity").get<double>()};
        auto r = ctx.engine.submit_order(o);
        if (auto* err = std::get_if<EngineError>(&r)) {
            reply_error(res, *err);
            return;
        }
        reply(res, http::status::ok, encode_order(std::get<Order>(r)));
        return;
    }

    // GET /orders
    if (path == "/orders" && req.method() == http::verb::get) {
        std::ostringstream os;
        os << "{\"orders\":[";
        bool first = true;
        for (const auto& o : ctx.engine.list_orders(user)) {
            if (!first) os << ",";
            first = false;
            json_order(os, o);
        }
        os << "]}";
        reply(res, http::status::ok, os.str());
        return;
    }

    // /orders/{id}
    const std::string_view prefix = "/orders/";
    if (path.substr(0, prefix.size()) == prefix) {
        auto id = parse_order_id(path.substr(prefix.size()));
        if (!id) {
            reply_error(res, EngineError{ErrorCode::NotFound, "order not found"});
            return;
        }
        std::variant<Order, EngineError> r = EngineError{ErrorCode::NotFound, "order not found"};
        if (req.method() == http::verb::get) {
            r = ctx.engine.get_order(user, *id);
        } else if (req.method() == http::verb::delete_) {
            r = ctx.engine.cancel_order(user, *id);
        } else {
            reply(res, http::status::method_not_allowed, R"({"error":"method not allowed"})");
            return;
        }
        if (auto* err = std::get_if<EngineError>(&r)) {
            reply_error(res, *err);
            return;
        }
        reply(res, http::status::ok, encode_order(std::get<Order>(r)));
        return;
    }

    reply(res, http::status::not_found, R"({"error":"not found"})");
}

} // namespace

void handle_request(ApiContext& ctx,
                    const http::request<http::string_body>& req,
                    http::response<http::string_body>& res)
{
    res.set(http::field::server, "paper-router/0.1");

    // Parse the target as an origin-form URL
    std::string_view target{req.target().data(), req.target().size()};
    auto parsed_result = urls::parse_origin_form(target);
    if (!parsed_result) {
        reply(res, http::status::bad_request, R"({"error":"bad request"})");
        return;
    }
    urls::url_view url = *parsed_result;
    const std::string path_str(url.path());
    const std::string_view path{path_str};

    try {
        // /api/health
        if (req.method() == http::verb::get && path == "/api/health") {
            reply(res, http::status::ok, R"({"status":"ok"})");
            return;
        }

        // /info
        if (req.method() == http::verb::get && path == "/info") {
            json body = {{"assets", ctx.assets}, {"pairs", ctx.pairs}};
            reply(res, http::status::ok, body.dump());
            return;
        }

        // /register
        if (req.method() == http::verb::post && path == "/register") {
            json j = json::parse(req.body());
            const std::string username = j.at("username").get<std::string>();
            if (auto err = ctx.users.create_user(username, j.at("password").get<std::string>())) {
                reply_error(res, *err);
                return;
            }
            std::cout << "[api] registered user " << username << std::endl;
            reply(res, http::status::ok, token_body(ctx.jwt.issue(username)));
            return;
        }

        // /login
        if (req.method() == http::verb::post && path == "/login") {
            json j = json::parse(req.body());
            const std::string username = j.at("username").get<std::string>();
            if (!ctx.users.check_credentials(username, j.at("password").get<std::string>())) {
                reply_error(res, EngineError{ErrorCode::Unauthorized, "invalid credentials"});
                return;
            }
            reply(res, http::status::ok, token_body(ctx.jwt.issue(username)));
            return;
        }

        const bool needs_auth = path == "/deposit" || path == "/balance" || path == "/orders" ||
                                path.substr(0, 8) == "/orders/";
        if (!needs_auth) {
            reply(res, http::status::not_found, R"({"error":"not found"})");
            return;
        }

        auto user = bearer_user(ctx, req);
        if (!user) {
            reply_error(res, EngineError{ErrorCode::Unauthorized, "invalid or expired token"});
            return;
        }

        // /deposit
        if (path == "/deposit" && req.method() == http::verb::post) {
            json j = json::parse(req.body());
            const std::string asset = j.at("asset").get<std::string>();
            auto r = ctx.engine.deposit(*user, asset, j.at("amount").get<double>());
            if (auto* err = std::get_if<EngineError>(&r)) {
                reply_error(res, *err);
                return;
            }
            const Balance& b = std::get<Balance>(r);
            json body = {{"status", "ok"}, {"total", b.total}, {"available", b.available}};
            reply(res, http::status::ok, body.dump());
            return;
        }

        // /balance: every configured asset, zero-filled, plus anything else held
        if (path == "/balance" && req.method() == http::verb::get) {
            auto held = ctx.engine.get_balance(*user);
            std::set<std::string> names(ctx.assets.begin(), ctx.assets.end());
            for (const auto& kv : held) names.insert(kv.first);

            json lines = json::array();
            for (const auto& asset : names) {
                auto it = held.find(asset);
                const Balance b = it == held.end() ? Balance{} : it->second;
                lines.push_back({{"asset", asset}, {"total", b.total}, {"available", b.available}});
            }
            json body = {{"balances", std::move(lines)}};
            reply(res, http::status::ok, body.dump());
            return;
        }

        orders_route(ctx, *user, req, res, path);
    } catch (const json::exception& e) {
        reply(res, http::status::bad_request,
              json{{"error", std::string("malformed body: ") + e.what()}, {"code", "malformed"}}.dump());
    } catch (const std::exception& e) {
        std::cerr << "[api] " << req.method_string() << " " << req.target() << " failed: " << e.what() << std::endl;
        reply(res, http::status::internal_server_error, R"({"error":"internal error"})");
    }
}
