#include "api/ApiRouter.h"
#include "auth/Authenticator.h"
#include "auth/SessionStore.h"
#include "chat/Hub.h"
#include "config/ServerConfig.h"
#include "networking/WebSocketServer.h"
#include "networking/WebSocketSession.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

namespace asio = boost::asio;

int main(int argc, char** argv) {
    using namespace duochat;

    const config::ServerConfig cfg = config::configure(argc, argv, "duochat: real-time 1:1 messaging server");

    std::ostringstream dump;
    cfg.dump("[duochat] configuration", dump);
    spdlog::debug("{}", dump.str());

    const unsigned threads = cfg.effective_threads();
    asio::io_context ioc{static_cast<int>(threads)};

    chat::Hub hub{ioc};
    auth::SessionStore sessions{cfg.session_ttl()};
    auth::CookieAuthenticator authenticator{sessions, hub};
    api::ApiRouter api{hub, sessions, authenticator};

    networking::WebSocketSession::Options ws_options;
    ws_options.queue_capacity    = cfg.queue_capacity;
    ws_options.max_message_bytes = cfg.max_message_bytes;
    ws_options.pong_wait         = cfg.pong_wait();
    ws_options.ping_period       = cfg.ping_period();
    ws_options.write_wait        = cfg.write_wait();

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(cfg.address, ec);
    if (ec) {
        spdlog::critical("[duochat] invalid listen address '{}': {}", cfg.address, ec.message());
        return EXIT_FAILURE;
    }

    std::unique_ptr<networking::WebSocketServer> server;
    try {
        server = std::make_unique<networking::WebSocketServer>(
            ioc, asio::ip::tcp::endpoint{address, cfg.port}, hub, api, ws_options);
    } catch (const boost::system::system_error& e) {
        spdlog::critical("[duochat] cannot listen on {}:{}: {}", cfg.address, cfg.port, e.what());
        return EXIT_FAILURE;
    }
    server->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        spdlog::info("[duochat] shutting down...");
        server->stop();
        ioc.stop();
    });

    spdlog::info("[duochat] listening on {}:{} with {} thread(s)", cfg.address, server->port(), threads);

    std::vector<std::thread> pool;
    pool.reserve(threads - 1);
    for (unsigned i = 1; i < threads; ++i) {
        pool.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();

    for (auto& t : pool) t.join();

    spdlog::info("[duochat] exit.");
    return EXIT_SUCCESS;
}
