#pragma once

#include "api/ApiRouter.h"
#include "chat/Hub.h"
#include "networking/WebSocketSession.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace duochat::networking {

// TCP listener for the chat endpoint. Every accepted socket starts life as
// an HttpSession; "/ws" upgrades become WebSocketSessions.
class WebSocketServer {
public:
    WebSocketServer(boost::asio::io_context& ioc,
                    const boost::asio::ip::tcp::endpoint& endpoint,
                    chat::Hub& hub,
                    api::ApiRouter& api,
                    const WebSocketSession::Options& ws_options);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void start();  // start accepting
    void stop();   // stop accepting

    // Useful when constructed with port 0.
    std::uint16_t port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace duochat::networking
