#include "networking/WebSocketServer.h"

#include "networking/HttpSession.h"

#include <boost/asio/strand.hpp>
#include <boost/beast/core/error.hpp>
#include <spdlog/spdlog.h>

#include <utility>

namespace duochat::networking {

namespace beast = boost::beast;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc,
         const tcp::endpoint& endpoint,
         chat::Hub& hub,
         api::ApiRouter& api,
         const WebSocketSession::Options& ws_options)
        : ioc_(ioc),
          acceptor_(ioc),
          hub_(hub),
          api_(api),
          ws_options_(ws_options) {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(asio::socket_base::max_listen_connections);
    }

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

    std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    spdlog::error("[accept] {}", ec.message());
                    return do_accept();
                }

                std::make_shared<HttpSession>(ioc_, std::move(socket), hub_, api_, ws_options_)->run();
                do_accept();
            });
    }

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;

    chat::Hub& hub_;
    api::ApiRouter& api_;
    WebSocketSession::Options ws_options_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc,
                                 const tcp::endpoint& endpoint,
                                 chat::Hub& hub,
                                 api::ApiRouter& api,
                                 const WebSocketSession::Options& ws_options)
    : impl_(new Impl(ioc, endpoint, hub, api, ws_options)) {}

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

std::uint16_t WebSocketServer::port() const { return impl_->port(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace duochat::networking
