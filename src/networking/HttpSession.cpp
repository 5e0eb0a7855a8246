#include "networking/HttpSession.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <string_view>
#include <utility>

namespace duochat::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kRequestTimeout = std::chrono::seconds(30);
constexpr std::size_t kMaxRequestBody = 64 * 1024;

} // namespace

HttpSession::HttpSession(asio::io_context& ioc,
                         tcp::socket socket,
                         chat::Hub& hub,
                         api::ApiRouter& api,
                         const WebSocketSession::Options& ws_options)
    : ioc_(ioc),
      hub_(hub),
      api_(api),
      ws_options_(ws_options),
      stream_(std::move(socket)),
      strand_(asio::make_strand(ioc)) {}

void HttpSession::run() {
    asio::dispatch(strand_, [self = shared_from_this()] { self->do_read(); });
}

void HttpSession::do_read() {
    // A fresh parser per request: body limits apply per message.
    parser_.emplace();
    parser_->body_limit(kMaxRequestBody);

    stream_.expires_after(kRequestTimeout);
    http::async_read(
        stream_, buffer_, *parser_,
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            }));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) return do_close();
    if (ec) {
        if (ec != asio::error::operation_aborted && ec != beast::error::timeout) {
            spdlog::debug("[http] read: {}", ec.message());
        }
        return;
    }

    api::Request req = parser_->release();

    if (websocket::is_upgrade(req)) return upgrade(std::move(req));

    spdlog::debug("[http] {} {}", std::string_view(req.method_string().data(), req.method_string().size()),
                  std::string_view(req.target().data(), req.target().size()));
    send(api_.handle(req));
}

void HttpSession::upgrade(api::Request req) {
    const std::string_view target(req.target().data(), req.target().size());
    if (api::ApiRouter::path_of(target) != api::ApiRouter::kWebSocketPath) {
        return send(api_.handle(req));
    }

    std::string identity;
    if (auto ec = api_.admit(req, identity)) return send(api_.reject(req, ec));

    // The WebSocket session takes the socket over; this session ends here.
    stream_.expires_never();
    std::make_shared<WebSocketSession>(ioc_, stream_.release_socket(), hub_, std::move(identity), ws_options_)
        ->run(std::move(req));
}

void HttpSession::send(api::Response res) {
    pending_ = std::make_shared<api::Response>(std::move(res));
    const bool keep_alive = pending_->keep_alive();

    http::async_write(
        stream_, *pending_,
        asio::bind_executor(
            strand_,
            [self = shared_from_this(), keep_alive](beast::error_code ec, std::size_t bytes) {
                self->on_write(keep_alive, ec, bytes);
            }));
}

void HttpSession::on_write(bool keep_alive, beast::error_code ec, std::size_t) {
    pending_.reset();

    if (ec) {
        spdlog::debug("[http] write: {}", ec.message());
        return;
    }
    if (!keep_alive) return do_close();

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace duochat::networking
