#pragma once
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "hub/subscription_hub.hpp"

// Server side of one client WebSocket. Runs on the strand of its socket:
// inbound text frames go to the hub, and the hub's outbound queue for this
// connection is drained one write at a time.
class WsSession : public std::enable_shared_from_this<WsSession> {
public:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    WsSession(boost::asio::ip::tcp::socket socket, SubscriptionHub& hub)
        : ws_(std::move(socket)), hub_(hub) {}

    ~WsSession() {
        if (conn_ && !closed_) hub_.disconnect(conn_->id());
    }

    void run(boost::beast::http::request<boost::beast::http::string_body> req) {
        ws_.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
        ws_.set_option(boost::beast::websocket::stream_base::decorator(
            [](boost::beast::websocket::response_type& res) {
                res.set(boost::beast::http::field::server, "paper-router/0.1");
            }));
        ws_.async_accept(req, [self = shared_from_this()](boost::beast::error_code ec) {
            self->on_accept(ec);
        });
    }

private:
    void on_accept(boost::beast::error_code ec) {
        if (ec) {
            std::cerr << "[ws] accept failed: " << ec.message() << std::endl;
            return;
        }
        std::weak_ptr<WsSession> weak = shared_from_this();
        auto exec = ws_.get_executor();
        conn_ = hub_.connect([weak, exec] {
            if (auto self = weak.lock()) {
                boost::asio::post(exec, [self] { self->pump(); });
            }
        });
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, [self = shared_from_this()](boost::beast::error_code ec, std::size_t) {
            self->on_read(ec);
        });
    }

    void on_read(boost::beast::error_code ec) {
        if (ec) {
            if (ec != boost::beast::websocket::error::closed && ec != boost::asio::error::operation_aborted) {
                std::cerr << "[ws] connection " << conn_->id() << " read error: " << ec.message() << std::endl;
            }
            close();
            return;
        }
        if (ws_.got_text()) {
            hub_.on_message(conn_->id(), boost::beast::buffers_to_string(buffer_.cdata()));
        }
        buffer_.consume(buffer_.size());
        do_read();
    }

    // Starts the next write if none is in flight.
    void pump() {
        if (writing_ || closed_) return;
        if (!conn_->try_pop(current_)) return;
        writing_ = true;
        ws_.text(true);
        ws_.async_write(boost::asio::buffer(*current_),
            [self = shared_from_this()](boost::beast::error_code ec, std::size_t) {
                self->on_write(ec);
            });
    }

    void on_write(boost::beast::error_code ec) {
        writing_ = false;
        current_.reset();
        if (ec) {
            close();
            return;
        }
        pump();
    }

    void close() {
        if (closed_) return;
        closed_ = true;
        hub_.disconnect(conn_->id());
    }

    Stream ws_;
    SubscriptionHub& hub_;
    std::shared_ptr<ClientConnection> conn_;
    boost::beast::flat_buffer buffer_;
    OutboundFrame current_;
    bool writing_{false};
    bool closed_{false};
};
