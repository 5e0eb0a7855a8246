#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace duochat::chat {

struct Presence {
    bool online = false;
    std::chrono::system_clock::time_point last_seen{};
};

// A participant known to the hub. Users are never forgotten once seen;
// disconnecting only flips them offline.
class User {
public:
    using Clock = std::chrono::system_clock;
    static constexpr std::size_t kMaxNameLen = 50;

    explicit User(std::string username);

    const std::string& username() const noexcept;

    const Presence& presence() const noexcept;
    bool online() const noexcept;
    Clock::time_point last_seen() const noexcept;

    void mark_online(Clock::time_point now = Clock::now()) noexcept;
    void mark_offline(Clock::time_point now = Clock::now()) noexcept;

    // Trims surrounding whitespace. Does not validate.
    static std::string normalize_name(std::string s);

    // 1..kMaxNameLen characters of [A-Za-z0-9_]. On failure `why` receives
    // a message suitable for the HTTP client.
    static bool is_valid_name(std::string_view name, std::string* why = nullptr);

private:
    static std::string trim_copy(std::string s);
    static bool is_space(char c) noexcept;
    static bool is_name_char(char c) noexcept;

private:
    std::string username_;
    Presence presence_;
};

} // namespace duochat::chat
