#pragma once

#include <boost/uuid/random_generator.hpp>

#include <chrono>
#include <mutex>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace duochat::auth {

// Login sessions keyed by an opaque id handed to the browser as a cookie.
// Ids are "sess-" plus a v4 UUID whose bytes come straight from the OS
// entropy source for every session.
class SessionStore {
public:
    using Clock = std::chrono::system_clock;

    explicit SessionStore(std::chrono::seconds ttl);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    std::string create(const std::string& username);

    // Expired sessions are erased on lookup and reported as absent.
    std::optional<std::string> find(const std::string& session_id);

    // Drops every session held by `username`.
    void erase_user(const std::string& username);

    std::chrono::seconds ttl() const noexcept { return ttl_; }
    std::size_t size() const;

private:
    struct Entry {
        std::string username;
        Clock::time_point expires_at;
    };

    std::string next_id();

    const std::chrono::seconds ttl_;

    std::mutex uuid_mu_;
    boost::uuids::random_generator_pure uuids_;

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, Entry> sessions_;
};

} // namespace duochat::auth
