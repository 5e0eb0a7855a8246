#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace duochat::config {

struct ServerConfig {
    std::string address           = "0.0.0.0";
    std::uint16_t port            = 8080;
    unsigned threads              = 0;  // 0 = hardware concurrency
    std::size_t queue_capacity    = 256;
    std::uint32_t pong_wait_ms    = 60000;
    std::uint32_t write_wait_ms   = 10000;
    std::size_t max_message_bytes = 512 * 1024;
    std::uint32_t session_ttl_s   = 24 * 60 * 60;
    std::string log_level         = "info";

    std::chrono::milliseconds pong_wait() const { return std::chrono::milliseconds(pong_wait_ms); }
    std::chrono::milliseconds write_wait() const { return std::chrono::milliseconds(write_wait_ms); }
    // Pings must go out before the peer's read deadline expires.
    std::chrono::milliseconds ping_period() const { return pong_wait() * 9 / 10; }
    std::chrono::seconds session_ttl() const { return std::chrono::seconds(session_ttl_s); }
    unsigned effective_threads() const;

    void dump(const std::string& header, std::ostream& os) const;
};

// Throws CLI::ParseError (including CLI::CallForHelp) on bad or help input.
ServerConfig parse_args(int argc, const char* const* argv);

// parse_args() for main(): prints help or errors and exits on failure,
// and applies the configured log level.
ServerConfig configure(int argc, char** argv, std::string_view description);

} // namespace duochat::config
