#pragma once
#include <functional>
#include <string>

// Blocking TLS WebSocket client with an automatic reconnect loop.
// run() connects, sends the optional subscribe frame, reads text frames into
// on_msg until stop() or a socket error, then waits out a ReconnectBackoff
// delay and connects again. on_link(true/false) fires on every connect and
// disconnect, from the thread that called run().
// The Boost stack is hidden behind a PIMPL so venue headers stay light.
class TlsWsClient {
public:
    using OnMsg = std::function<void(const std::string &)>;
    using OnLink = std::function<void(bool up)>;

    struct Options {
        std::string tag;        // log prefix, e.g. "binance-ws"
        std::string host;
        std::string target;     // request path
        std::string subscribe;  // sent after every handshake when non-empty
        std::string user_agent = "paper-router/0.1";
    };

    TlsWsClient(Options opts, OnMsg on_msg, OnLink on_link);
    ~TlsWsClient();
    TlsWsClient(const TlsWsClient &) = delete;
    TlsWsClient &operator=(const TlsWsClient &) = delete;

    // Blocks until stop().
    void run(unsigned short port);
    // Safe from any thread; unblocks a pending read or backoff sleep.
    void stop() noexcept;

private:
    struct Impl;
    Impl *impl_;
};
