#include "chat/User.h"

#include <utility>

namespace duochat::chat {

User::User(std::string username) : username_(std::move(username)) {}

const std::string& User::username() const noexcept { return username_; }

const Presence& User::presence() const noexcept { return presence_; }
bool User::online() const noexcept { return presence_.online; }
User::Clock::time_point User::last_seen() const noexcept { return presence_.last_seen; }

void User::mark_online(Clock::time_point now) noexcept {
    presence_.online = true;
    presence_.last_seen = now;
}

void User::mark_offline(Clock::time_point now) noexcept {
    presence_.online = false;
    presence_.last_seen = now;
}

bool User::is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool User::is_name_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

std::string User::trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    if (start == 0 && end == s.size()) return s;
    return s.substr(start, end - start);
}

std::string User::normalize_name(std::string s) {
    return trim_copy(std::move(s));
}

bool User::is_valid_name(std::string_view name, std::string* why) {
    if (name.empty() || name.size() > kMaxNameLen) {
        if (why) *why = "Username must be between 1 and 50 characters";
        return false;
    }
    for (char c : name) {
        if (!is_name_char(c)) {
            if (why) *why = "Username can only contain letters, numbers, and underscores";
            return false;
        }
    }
    return true;
}

} // namespace duochat::chat
