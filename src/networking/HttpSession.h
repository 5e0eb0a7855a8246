#pragma once

#include "api/ApiRouter.h"
#include "chat/Hub.h"
#include "networking/WebSocketSession.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cstddef>
#include <memory>
#include <optional>

namespace duochat::networking {

// Plain HTTP/1.1 keep-alive connection. Answers API requests through the
// ApiRouter and hands admitted WebSocket upgrades over to a WebSocketSession.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::io_context& ioc,
                boost::asio::ip::tcp::socket socket,
                chat::Hub& hub,
                api::ApiRouter& api,
                const WebSocketSession::Options& ws_options);

    void run();

private:
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);
    void upgrade(api::Request req);
    void send(api::Response res);
    void on_write(bool keep_alive, boost::beast::error_code ec, std::size_t bytes);
    void do_close();

    boost::asio::io_context& ioc_;
    chat::Hub& hub_;
    api::ApiRouter& api_;
    WebSocketSession::Options ws_options_;

    boost::beast::tcp_stream stream_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::beast::flat_buffer buffer_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    std::shared_ptr<api::Response> pending_;
};

} // namespace duochat::networking
