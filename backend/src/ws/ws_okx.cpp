#include "venues/okx/ws.hpp"
#include "ws/tls_ws_client.hpp"

#include <utility>

struct OkxWs::Impl
{
    TlsWsClient client;

    Impl(const std::vector<std::string> &inst_ids, OnMsg cb, OnLink link)
    : client(TlsWsClient::Options{"okx-ws", "ws.okx.com", "/ws/v5/public", build_subscribe(inst_ids)},
             std::move(cb), std::move(link))
    {}
};

std::string OkxWs::build_subscribe(const std::vector<std::string> &inst_ids)
{
    std::string body = "{\"op\":\"subscribe\",\"args\":[";
    bool first = true;
    for (const auto &id : inst_ids)
    {
        for (const char *channel : {"tickers", "trades"})
        {
            if (!first) body += ",";
            first = false;
            body += std::string("{\"channel\":\"") + channel + "\",\"instId\":\"" + id + "\"}";
        }
    }
    body += "]}";
    return body;
}

OkxWs::OkxWs(std::vector<std::string> inst_ids, OnMsg cb, OnLink link)
    : impl_(new Impl(inst_ids, std::move(cb), std::move(link))) {}
OkxWs::~OkxWs() { delete impl_; }

void OkxWs::start(unsigned short port) { impl_->client.run(port); }
void OkxWs::stop() noexcept { impl_->client.stop(); }
