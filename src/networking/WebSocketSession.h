#pragma once

#include "chat/Connection.h"
#include "chat/Hub.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>

namespace duochat::networking {

// One authenticated WebSocket: a reader pump feeding the hub and a writer
// pump draining the connection's outbound queue. Both run on the session's
// strand and stop together; either side tears the socket down, and the
// reader is the one that unregisters.
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
public:
    struct Options {
        std::size_t queue_capacity = 256;
        std::size_t max_message_bytes = 512 * 1024;
        std::chrono::milliseconds pong_wait{60000};
        std::chrono::milliseconds ping_period{54000};
        std::chrono::milliseconds write_wait{10000};
    };

    WebSocketSession(boost::asio::io_context& ioc,
                     boost::asio::ip::tcp::socket socket,
                     chat::Hub& hub,
                     std::string identity,
                     const Options& options);

    // Completes the upgrade handshake for `req`, then registers and starts both pumps.
    void run(boost::beast::http::request<boost::beast::http::string_body> req);

    const std::string& identity() const noexcept { return connection_->identity(); }

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    void on_accept(boost::beast::error_code ec);
    void on_registered();

    // reader
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);
    void dispatch(const std::string& frame);
    void arm_read_deadline();

    // writer
    void pump();
    void write_front();
    void on_write(boost::beast::error_code ec, std::size_t bytes);
    void do_ping();
    void arm_ping_timer();
    void do_close();
    void arm_write_deadline();

    void fail(const char* what, boost::beast::error_code ec);
    void shutdown();

    chat::Hub& hub_;
    Options options_;
    std::shared_ptr<chat::Connection> connection_;

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    Strand strand_;

    boost::asio::steady_timer read_deadline_;
    boost::asio::steady_timer write_deadline_;
    boost::asio::steady_timer ping_timer_;

    boost::beast::flat_buffer buffer_;

    // Frames taken off the queue for the current burst, written one per frame.
    std::deque<std::string> burst_;
    bool writing_ = false;
    bool drained_ = false;
    bool ping_due_ = false;
    bool closing_ = false;
    bool registered_ = false;
    bool stopped_ = false;
};

} // namespace duochat::networking
