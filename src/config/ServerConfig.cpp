#include "config/ServerConfig.h"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <thread>

namespace duochat::config {

namespace {

void add_options(CLI::App& app, ServerConfig& cfg) {
    app.add_option("-a,--address", cfg.address, "Address to listen on")->default_val(cfg.address);
    app.add_option("-p,--port", cfg.port, "TCP port for HTTP and WebSocket traffic")->default_val(cfg.port);
    app.add_option("-t,--threads", cfg.threads, "I/O threads (0 = hardware concurrency)")->default_val(cfg.threads);
    app.add_option("--queue-capacity", cfg.queue_capacity, "Outbound frames buffered per connection")
        ->check(CLI::PositiveNumber)->default_val(cfg.queue_capacity);
    app.add_option("--pong-wait-ms", cfg.pong_wait_ms, "Read deadline refreshed by every frame or pong")
        ->check(CLI::Range(1000u, 3600000u))->default_val(cfg.pong_wait_ms);
    app.add_option("--write-wait-ms", cfg.write_wait_ms, "Upper bound on a single frame write")
        ->check(CLI::PositiveNumber)->default_val(cfg.write_wait_ms);
    app.add_option("--max-message-bytes", cfg.max_message_bytes, "Largest inbound frame accepted")
        ->check(CLI::PositiveNumber)->default_val(cfg.max_message_bytes);
    app.add_option("--session-ttl-s", cfg.session_ttl_s, "Login session lifetime in seconds")
        ->check(CLI::PositiveNumber)->default_val(cfg.session_ttl_s);
    app.add_option("-l,--log-level", cfg.log_level, "Log level: trace | debug | info | warn | error | critical | off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
        ->default_val(cfg.log_level);
}

} // namespace

unsigned ServerConfig::effective_threads() const {
    if (threads != 0) return threads;
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

void ServerConfig::dump(const std::string& header, std::ostream& os) const {
    os << header << ":\n"
       << "  Listen          : " << address << ":" << port << "\n"
       << "  Threads         : " << effective_threads() << "\n"
       << "  Queue capacity  : " << queue_capacity << "\n"
       << "  Pong wait       : " << pong_wait_ms << " ms (ping every " << ping_period().count() << " ms)\n"
       << "  Write wait      : " << write_wait_ms << " ms\n"
       << "  Max message     : " << max_message_bytes << " bytes\n"
       << "  Session TTL     : " << session_ttl_s << " s\n"
       << "  Log level       : " << log_level << "\n";
}

ServerConfig parse_args(int argc, const char* const* argv) {
    CLI::App app{"duochat"};
    ServerConfig cfg{};
    add_options(app, cfg);
    app.parse(argc, argv);
    return cfg;
}

ServerConfig configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    ServerConfig cfg{};
    add_options(app, cfg);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    spdlog::set_level(spdlog::level::from_str(cfg.log_level));
    return cfg;
}

} // namespace duochat::config
