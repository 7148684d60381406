#pragma once
#include <boost/beast/http.hpp>
#include <string>
#include <vector>

#include "auth/jwt.hpp"
#include "auth/user_store.hpp"
#include "common/errors.hpp"
#include "engine/matching_engine.hpp"

namespace http = boost::beast::http;

// What the REST handlers need; all references outlive the server.
struct ApiContext {
    MatchingEngine& engine;
    UserStore& users;
    const JwtCodec& jwt;
    std::vector<std::string> pairs;   // canonical symbols
    std::vector<std::string> assets;  // sorted base and quote assets of `pairs`
};

// Sorted, deduplicated base and quote assets of the given pairs.
std::vector<std::string> assets_of(const std::vector<std::string>& pairs);

http::status http_status_for(ErrorCode code);

void handle_request(ApiContext& ctx,
                    const http::request<http::string_body>& req,
                    http::response<http::string_body>& res);
