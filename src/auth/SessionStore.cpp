#include "auth/SessionStore.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>

namespace duochat::auth {

SessionStore::SessionStore(std::chrono::seconds ttl) : ttl_(ttl) {}

std::string SessionStore::create(const std::string& username) {
    std::string id = next_id();

    std::unique_lock<std::shared_mutex> lk(mu_);
    sessions_[id] = Entry{username, Clock::now() + ttl_};
    return id;
}

std::optional<std::string> SessionStore::find(const std::string& session_id) {
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) return std::nullopt;
        if (Clock::now() <= it->second.expires_at) return it->second.username;
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end() && Clock::now() > it->second.expires_at) sessions_.erase(it);
    return std::nullopt;
}

void SessionStore::erase_user(const std::string& username) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.username == username) {
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string SessionStore::next_id() {
    boost::uuids::uuid u;
    {
        std::lock_guard<std::mutex> lk(uuid_mu_);
        u = uuids_();
    }
    return "sess-" + boost::uuids::to_string(u);
}

std::size_t SessionStore::size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return sessions_.size();
}

} // namespace duochat::auth
