#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// REST and WebSocket on one port. Plain requests go to `handler`; WebSocket
// upgrade requests on `ws_path` hand their socket to `upgrade`.
// With a `handler_pool`, handlers run there (password hashing takes tens of
// milliseconds) and the reply is written back on the connection's strand, so
// I/O threads keep serving WebSocket sessions. The pool must be joined before
// the server is destroyed.
class HttpServer {
public:
    using HandlerFn = std::function<void(const http::request<http::string_body>&, http::response<http::string_body>&)>;
    using UpgradeFn = std::function<void(tcp::socket, http::request<http::string_body>)>;

    HttpServer(boost::asio::io_context& ioc, tcp::endpoint ep, HandlerFn handler,
               UpgradeFn upgrade = {}, boost::asio::thread_pool* handler_pool = nullptr,
               std::string ws_path = "/ws")
    : ioc_(ioc), acceptor_(ioc), handler_(std::move(handler)),
      upgrade_(std::move(upgrade)), handler_pool_(handler_pool), ws_path_(std::move(ws_path)) {
        boost::beast::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec) throw std::runtime_error("open: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("set_option: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec) throw std::runtime_error("bind: " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("listen: " + ec.message());
    }

    void run() { do_accept(); }

    void close() {
        boost::beast::error_code ec;
        acceptor_.close(ec);
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    struct Session : public std::enable_shared_from_this<Session> {
        tcp::socket socket_;
        boost::beast::flat_buffer buffer_;
        HttpServer& server_;
        Session(tcp::socket s, HttpServer& server) : socket_(std::move(s)), server_(server) {}
        void run() { do_read(); }
        void do_read() {
            auto self = shared_from_this();
            auto req = std::make_shared<http::request<http::string_body>>();
            http::async_read(socket_, buffer_, *req,
                [self, req](boost::beast::error_code ec, std::size_t){
                    if (ec == http::error::end_of_stream) return self->do_close();
                    if (ec) return;

                    if (boost::beast::websocket::is_upgrade(*req) && self->server_.upgrade_) {
                        std::string target(req->target().data(), req->target().size());
                        if (target.substr(0, target.find('?')) == self->server_.ws_path_) {
                            self->server_.upgrade_(std::move(self->socket_), std::move(*req));
                            return;
                        }
                    }

                    auto res = std::make_shared<http::response<http::string_body>>();
                    res->version(req->version());
                    res->keep_alive(false);
                    if (req->method() == http::verb::options) {
                        res->result(http::status::ok);
                        res->set(http::field::content_type, "text/plain");
                        res->body() = "";
                        return self->do_write(res);
                    }

                    if (!self->server_.handler_pool_) {
                        self->server_.handler_(*req, *res);
                        return self->do_write(res);
                    }
                    boost::asio::post(*self->server_.handler_pool_,
                        [self, req, res, handler = self->server_.handler_] {
                            handler(*req, *res);
                            boost::asio::post(self->socket_.get_executor(),
                                              [self, res] { self->do_write(res); });
                        });
                });
        }
        void do_write(std::shared_ptr<http::response<http::string_body>> res) {
            // CORS
            res->set(http::field::access_control_allow_origin, "*");
            res->set(http::field::access_control_allow_headers, "Authorization, Content-Type");
            res->set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
            res->prepare_payload();
            auto self = shared_from_this();
            http::async_write(socket_, *res,
                [self, res](boost::beast::error_code, std::size_t){
                    self->do_close();
                });
        }
        void do_close() {
            boost::beast::error_code ec;
            socket_.shutdown(tcp::socket::shutdown_send, ec);
        }
    };

    void do_accept() {
        acceptor_.async_accept(
            boost::asio::make_strand(ioc_),
            [this](boost::beast::error_code ec, tcp::socket s){
                if (ec == boost::asio::error::operation_aborted) return;
                if (!ec) std::make_shared<Session>(std::move(s), *this)->run();
                do_accept();
            });
    }

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    HandlerFn handler_;
    UpgradeFn upgrade_;
    boost::asio::thread_pool* handler_pool_;
    std::string ws_path_;
};
