#include "networking/WebSocketSession.h"

#include "chat/Error.h"
#include "protocol/Envelope.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <utility>
#include <variant>

namespace duochat::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

bool is_orderly_close(const beast::error_code& ec) {
    return ec == websocket::error::closed ||
           ec == asio::error::operation_aborted ||
           ec == asio::error::eof ||
           ec == asio::error::connection_reset;
}

} // namespace

WebSocketSession::WebSocketSession(asio::io_context& ioc,
                                   tcp::socket socket,
                                   chat::Hub& hub,
                                   std::string identity,
                                   const Options& options)
    : hub_(hub),
      options_(options),
      connection_(std::make_shared<chat::Connection>(std::move(identity), options.queue_capacity)),
      ws_(std::move(socket)),
      strand_(asio::make_strand(ioc)),
      read_deadline_(ioc),
      write_deadline_(ioc),
      ping_timer_(ioc) {}

void WebSocketSession::run(http::request<http::string_body> req) {
    asio::dispatch(
        strand_,
        [self = shared_from_this(), req = std::move(req)]() mutable {
            // Liveness is ours: explicit pings and a read deadline, not Beast's idle timer.
            self->ws_.set_option(websocket::stream_base::timeout{
                std::chrono::seconds(30), websocket::stream_base::none(), false});
            self->ws_.set_option(websocket::stream_base::decorator(
                [](websocket::response_type& res) {
                    res.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " duochat");
                }));
            self->ws_.read_message_max(self->options_.max_message_bytes);
            self->ws_.control_callback(
                [raw = self.get()](websocket::frame_type kind, beast::string_view) {
                    if (kind == websocket::frame_type::pong) raw->arm_read_deadline();
                });

            self->ws_.async_accept(
                req,
                asio::bind_executor(
                    self->strand_,
                    [self](beast::error_code ec) { self->on_accept(ec); }));
        });
}

void WebSocketSession::on_accept(beast::error_code ec) {
    if (ec) {
        fail("accept", ec);
        return shutdown();
    }

    std::weak_ptr<WebSocketSession> weak = shared_from_this();
    connection_->queue().set_notify([weak] {
        if (auto self = weak.lock()) {
            asio::post(self->strand_, [self] { self->pump(); });
        }
    });

    // The reader starts only after the hub has the connection in its table.
    registered_ = true;
    hub_.post_register(connection_, [self = shared_from_this()] {
        asio::post(self->strand_, [self] { self->on_registered(); });
    });
}

void WebSocketSession::on_registered() {
    if (stopped_) return;
    spdlog::info("[ws {}] connected", identity());

    arm_read_deadline();
    arm_ping_timer();
    do_read();
    pump();
}

// ---- reader pump ----

void WebSocketSession::do_read() {
    ws_.async_read(
        buffer_,
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            }));
}

void WebSocketSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (stopped_ || is_orderly_close(ec)) {
            const auto lifetime = std::chrono::duration_cast<std::chrono::seconds>(
                chat::Connection::Clock::now() - connection_->connected_at());
            spdlog::info("[ws {}] disconnected after {} s", identity(), lifetime.count());
        } else {
            fail("read", ec);
        }
        return shutdown();
    }

    arm_read_deadline();

    std::string frame = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    dispatch(frame);

    do_read();
}

void WebSocketSession::dispatch(const std::string& frame) {
    boost::system::error_code ec;
    protocol::Inbound inbound = protocol::decode(frame, ec);
    if (ec) {
        spdlog::warn("[ws {}] skipping frame: {}", identity(), ec.message());
        return;
    }

    std::visit(overloaded{
        [this](protocol::ChatRequest& req) {
            hub_.route_message(identity(), req.to, std::move(req.content));
        },
        [this](protocol::TypingRequest& req) {
            hub_.post_typing(identity(), std::move(req.to), req.is_typing);
        }
    }, inbound);
}

void WebSocketSession::arm_read_deadline() {
    if (stopped_) return;
    read_deadline_.expires_after(options_.pong_wait);
    read_deadline_.async_wait(
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec || self->stopped_) return;
                if (self->read_deadline_.expiry() > asio::steady_timer::clock_type::now()) return;
                spdlog::info("[ws {}] no traffic within {} ms", self->identity(), self->options_.pong_wait.count());
                self->fail("read deadline", make_error_code(Errc::transport_failure));
                self->shutdown();
            }));
}

// ---- writer pump ----

void WebSocketSession::pump() {
    if (stopped_ || writing_ || closing_) return;

    if (!burst_.empty()) return write_front();

    if (ping_due_) return do_ping();

    if (auto first = connection_->queue().pop()) {
        burst_.push_back(std::move(*first));
        drained_ = false;
        return write_front();
    }

    // Closed and fully flushed: say goodbye.
    if (connection_->queue().closed()) do_close();
}

void WebSocketSession::write_front() {
    writing_ = true;
    ws_.text(true);
    arm_write_deadline();
    ws_.async_write(
        asio::buffer(burst_.front()),
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                self->on_write(ec, bytes);
            }));
}

void WebSocketSession::on_write(beast::error_code ec, std::size_t) {
    writing_ = false;
    write_deadline_.cancel();

    if (ec) {
        if (!stopped_) fail("write", ec);
        return shutdown();
    }

    burst_.pop_front();

    // Whatever piled up while the first frame was in flight goes out now,
    // still one frame per message.
    if (!drained_) {
        drained_ = true;
        for (auto& frame : connection_->queue().drain()) burst_.push_back(std::move(frame));
    }

    pump();
}

void WebSocketSession::do_ping() {
    ping_due_ = false;
    writing_ = true;
    arm_write_deadline();
    ws_.async_ping(
        {},
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec) {
                self->writing_ = false;
                self->write_deadline_.cancel();
                if (ec) {
                    if (!self->stopped_) self->fail("ping", ec);
                    return self->shutdown();
                }
                self->pump();
            }));
}

void WebSocketSession::arm_ping_timer() {
    if (stopped_) return;
    ping_timer_.expires_after(options_.ping_period);
    ping_timer_.async_wait(
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec || self->stopped_) return;
                self->ping_due_ = true;
                self->pump();
                self->arm_ping_timer();
            }));
}

void WebSocketSession::do_close() {
    closing_ = true;
    writing_ = true;
    arm_write_deadline();
    ws_.async_close(
        websocket::close_code::normal,
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec) {
                self->writing_ = false;
                self->write_deadline_.cancel();
                if (ec && !is_orderly_close(ec)) self->fail("close", ec);
                self->shutdown();
            }));
}

void WebSocketSession::arm_write_deadline() {
    write_deadline_.expires_after(options_.write_wait);
    write_deadline_.async_wait(
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec || self->stopped_ || !self->writing_) return;
                if (self->write_deadline_.expiry() > asio::steady_timer::clock_type::now()) return;
                spdlog::info("[ws {}] write took longer than {} ms", self->identity(), self->options_.write_wait.count());
                self->fail("write deadline", make_error_code(Errc::transport_failure));
                self->shutdown();
            }));
}

// ---- teardown ----

void WebSocketSession::fail(const char* what, beast::error_code ec) {
    spdlog::warn("[ws {}] {}: {}", identity(), what, ec.message());
}

void WebSocketSession::shutdown() {
    if (stopped_) return;
    stopped_ = true;

    if (registered_) {
        hub_.post_unregister(connection_);
    } else {
        connection_->queue().close();
    }

    read_deadline_.cancel();
    write_deadline_.cancel();
    ping_timer_.cancel();

    beast::error_code ignored;
    auto& socket = beast::get_lowest_layer(ws_).socket();
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
}

} // namespace duochat::networking
