#include "tls_ws_client.hpp"
#include "backoff.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

struct TlsWsClient::Impl
{
    using Stream = websocket::stream<beast::ssl_stream<tcp::socket>>;

    Options opts;
    OnMsg on_msg;
    OnLink on_link;

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};

    std::mutex ws_m; // guards ws against stop() from another thread
    std::unique_ptr<Stream> ws;

    std::mutex sleep_m;
    std::condition_variable sleep_cv;

    std::atomic<bool> stop_flag{false};
    ReconnectBackoff backoff;

    Impl(Options o, OnMsg m, OnLink l)
    : opts(std::move(o)), on_msg(std::move(m)), on_link(std::move(l))
    {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    void run(unsigned short port)
    {
        while (!stop_flag.load(std::memory_order_relaxed))
        {
            bool was_up = false;
            try
            {
                connect_once(port);
                was_up = true;
                backoff.reset();
                std::cout << "[" << opts.tag << "] connected to " << opts.host << opts.target.substr(0, 64)
                          << (opts.target.size() > 64 ? "..." : "") << std::endl;
                if (on_link) on_link(true);
                read_loop();
            }
            catch (const std::exception &e)
            {
                if (!stop_flag.load(std::memory_order_relaxed))
                    std::cerr << "[" << opts.tag << "] error: " << e.what() << std::endl;
            }

            close_stream();
            if (was_up && on_link) on_link(false);
            if (stop_flag.load(std::memory_order_relaxed)) break;

            const auto delay = backoff.next();
            std::cerr << "[" << opts.tag << "] reconnecting in " << delay.count() << " ms" << std::endl;
            std::unique_lock<std::mutex> lk(sleep_m);
            sleep_cv.wait_for(lk, delay, [this] { return stop_flag.load(std::memory_order_relaxed); });
        }
    }

    void connect_once(unsigned short port)
    {
        tcp::resolver resolver{ioc};
        auto const results = resolver.resolve(opts.host, std::to_string(port));

        auto s = std::make_unique<Stream>(ioc, ssl_ctx);
        {
            std::lock_guard<std::mutex> lk(ws_m);
            if (stop_flag.load(std::memory_order_relaxed)) throw std::runtime_error("stopping");
            ws = std::move(s);
        }

        net::connect(beast::get_lowest_layer(*ws), results);

        // SNI (Server Name Indication) for TLS
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), opts.host.c_str())) {
            throw beast::system_error{
                beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                "SNI set failed"
            };
        }

        ws->next_layer().handshake(net::ssl::stream_base::client);

        ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws->set_option(websocket::stream_base::decorator([ua = opts.user_agent](websocket::request_type &req){
            req.set(http::field::user_agent, ua);
        }));
        ws->handshake(opts.host + ":" + std::to_string(port), opts.target);

        if (!opts.subscribe.empty()) {
            ws->text(true);
            ws->write(net::buffer(opts.subscribe));
        }
    }

    void read_loop()
    {
        beast::flat_buffer buffer;
        while (!stop_flag.load(std::memory_order_relaxed))
        {
            buffer.clear();
            beast::error_code ec;
            ws->read(buffer, ec);
            if (ec)
            {
                if (stop_flag.load(std::memory_order_relaxed)) return;
                if (ec == websocket::error::closed) {
                    std::cerr << "[" << opts.tag << "] closed by remote: " << ws->reason().reason << std::endl;
                    return;
                }
                throw beast::system_error{ec};
            }
            if (!ws->got_text()) continue;
            std::string data = beast::buffers_to_string(buffer.cdata());
            if (on_msg) on_msg(data);
        }
    }

    void close_stream()
    {
        std::unique_ptr<Stream> old;
        {
            std::lock_guard<std::mutex> lk(ws_m);
            old = std::move(ws);
        }
        if (!old) return;
        // No close handshake: the link is either broken or being torn down.
        beast::error_code ec;
        beast::get_lowest_layer(*old).close(ec);
    }

    void stop() noexcept
    {
        stop_flag.store(true, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lk(sleep_m);
        }
        sleep_cv.notify_all();

        // Shutting the socket down makes the blocking read on the run() thread return.
        std::lock_guard<std::mutex> lk(ws_m);
        if (ws) {
            beast::error_code ec;
            beast::get_lowest_layer(*ws).shutdown(tcp::socket::shutdown_both, ec);
        }
    }
};

TlsWsClient::TlsWsClient(Options opts, OnMsg on_msg, OnLink on_link)
    : impl_(new Impl(std::move(opts), std::move(on_msg), std::move(on_link))) {}
TlsWsClient::~TlsWsClient() { delete impl_; }

void TlsWsClient::run(unsigned short port) { impl_->run(port); }
void TlsWsClient::stop() noexcept { impl_->stop(); }
