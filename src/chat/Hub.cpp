#include "chat/Hub.h"

#include "chat/Error.h"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace duochat::chat {

namespace asio = boost::asio;

Hub::Hub(asio::io_context& ioc)
    : strand_(asio::make_strand(ioc)) {}

// ---- event loop ----

void Hub::post_register(ConnectionPtr connection, std::function<void()> on_registered) {
    asio::post(strand_, [this, c = std::move(connection), done = std::move(on_registered)] {
        register_connection(c);
        if (done) done();
    });
}

void Hub::post_unregister(ConnectionPtr connection) {
    asio::post(strand_, [this, c = std::move(connection)] { unregister_connection(c); });
}

void Hub::post_typing(std::string from, std::string to, bool is_typing) {
    asio::post(strand_, [this, from = std::move(from), to = std::move(to), is_typing] {
        route_typing(from, to, is_typing);
    });
}

// ---- connection churn ----

bool Hub::register_connection(const ConnectionPtr& connection) {
    const std::string& identity = connection->identity();

    std::unique_lock<std::shared_mutex> lk(mu_);

    auto& slot = connections_[identity];
    if (ConnectionPtr old = slot.lock(); old && old != connection) {
        spdlog::info("[hub] {} already connected, closing old connection", identity);
        old->queue().close();
    }
    slot = connection;

    auto user = users_.try_emplace(identity, identity).first;
    user->second.mark_online();

    broadcast_status_locked(identity, true);

    // Tell the newcomer who is already here.
    for (const auto& [name, other] : users_) {
        if (name == identity || !other.online()) continue;
        send_locked(connection, protocol::StatusEvent{name, true});
    }

    flush_evictions_locked();

    spdlog::info("[hub] registered {} ({} connected)", identity, connections_.size());
    return true;
}

void Hub::unregister_connection(const ConnectionPtr& connection) {
    const std::string& identity = connection->identity();

    std::unique_lock<std::shared_mutex> lk(mu_);

    auto it = connections_.find(identity);
    if (it == connections_.end() || it->second.lock() != connection) {
        spdlog::debug("[hub] {} already replaced, skipping unregister", identity);
        return;
    }
    connections_.erase(it);

    if (auto user = users_.find(identity); user != users_.end()) {
        user->second.mark_offline();
    }
    connection->queue().close();

    broadcast_status_locked(identity, false);
    flush_evictions_locked();

    spdlog::info("[hub] unregistered {}", identity);
}

bool Hub::disconnect(const std::string& identity) {
    ConnectionPtr current;
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        current = connection_locked(identity);
    }
    if (!current) return false;
    unregister_connection(current);
    return true;
}

// ---- routing ----

Message Hub::route_message(const std::string& from, const std::string& to, std::string content) {
    std::unique_lock<std::shared_mutex> lk(mu_);

    auto& log = conversations_[conversation_key(from, to)];
    log.push_back(Message{ids_.messageID(), from, to, std::move(content),
                          std::chrono::system_clock::now(), DeliveryState::Sent});
    const std::size_t index = log.size() - 1;

    ConnectionPtr sender = connection_locked(from);
    ConnectionPtr recipient = connection_locked(to);

    if (sender) {
        send_locked(sender, protocol::MessageEvent{log[index], DeliveryState::Sent});
    } else {
        spdlog::debug("[hub] sender {} not connected", from);
    }

    if (recipient && send_locked(recipient, protocol::MessageEvent{log[index], DeliveryState::Delivered})) {
        log[index].state = DeliveryState::Delivered;
        if (sender) {
            send_locked(sender, protocol::AckEvent{log[index].id, DeliveryState::Delivered});
        }
    }

    Message routed = log[index];
    flush_evictions_locked();

    spdlog::debug("[hub] {} -> {} {} ({})", from, to, routed.id, to_string(routed.state));
    return routed;
}

void Hub::route_typing(const std::string& from, const std::string& to, bool is_typing) {
    std::unique_lock<std::shared_mutex> lk(mu_);

    ConnectionPtr recipient = connection_locked(to);
    if (!recipient) {
        spdlog::trace("[hub] typing {} -> {} dropped, recipient offline", from, to);
        return;
    }
    send_locked(recipient, protocol::TypingEvent{from, is_typing});
    flush_evictions_locked();
}

// ---- queries ----

std::vector<ConversationSummary> Hub::list_conversations(const std::string& identity) const {
    std::shared_lock<std::shared_mutex> lk(mu_);

    std::vector<ConversationSummary> out;
    std::unordered_set<std::string> seen;

    for (const auto& [key, log] : conversations_) {
        if (log.empty()) continue;

        const Message& last = log.back();
        const std::string* peer = nullptr;
        if (last.from == identity) {
            peer = &last.to;
        } else if (last.to == identity) {
            peer = &last.from;
        } else {
            continue;
        }

        if (!seen.insert(*peer).second) continue;

        bool peer_online = false;
        if (auto user = users_.find(*peer); user != users_.end()) peer_online = user->second.online();

        out.push_back(ConversationSummary{*peer, last.content, last.created_at, peer_online});
    }

    std::sort(out.begin(), out.end(), [](const ConversationSummary& a, const ConversationSummary& b) {
        return a.last_message_time > b.last_message_time;
    });
    return out;
}

std::vector<Message> Hub::get_conversation(const std::string& a, const std::string& b) const {
    std::shared_lock<std::shared_mutex> lk(mu_);

    auto it = conversations_.find(conversation_key(a, b));
    if (it == conversations_.end()) return {};
    return it->second;
}

std::vector<UserSummary> Hub::search_identities(std::string_view fragment, std::string_view exclude) const {
    std::shared_lock<std::shared_mutex> lk(mu_);

    std::vector<UserSummary> out;
    for (const auto& [name, user] : users_) {
        if (name == exclude) continue;
        if (contains_ci(name, fragment)) out.push_back(UserSummary{name, user.online()});
    }

    std::sort(out.begin(), out.end(), [](const UserSummary& a, const UserSummary& b) {
        return a.username < b.username;
    });
    return out;
}

bool Hub::is_connected(const std::string& identity) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return connection_locked(identity) != nullptr;
}

std::optional<Presence> Hub::presence_of(const std::string& identity) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = users_.find(identity);
    if (it == users_.end()) return std::nullopt;
    return it->second.presence();
}

std::size_t Hub::connection_count() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return connections_.size();
}

// ---- internals ----

Hub::ConnectionPtr Hub::connection_locked(const std::string& identity) const {
    auto it = connections_.find(identity);
    if (it == connections_.end()) return nullptr;
    return it->second.lock();
}

bool Hub::send_locked(const ConnectionPtr& connection, const protocol::Outbound& event) {
    switch (connection->queue().push(protocol::encode(event))) {
        case OutboundQueue::PushResult::Queued:
            spdlog::trace("[hub] queued {} for {}", protocol::kind_of(event), connection->identity());
            return true;
        case OutboundQueue::PushResult::Closed:
            return false;
        case OutboundQueue::PushResult::Full:
            spdlog::warn("[hub] {}: {}, closing connection", connection->identity(),
                         make_error_code(Errc::backpressure_overflow).message());
            evict_locked(connection);
            return false;
    }
    return false;
}

void Hub::evict_locked(const ConnectionPtr& connection) {
    connection->queue().close();

    const std::string& identity = connection->identity();
    auto it = connections_.find(identity);
    if (it == connections_.end() || it->second.lock() != connection) return;

    connections_.erase(it);
    if (auto user = users_.find(identity); user != users_.end()) user->second.mark_offline();
    pending_offline_.push_back(identity);
}

void Hub::broadcast_status_locked(const std::string& identity, bool online) {
    // Snapshot first: an overflowing target is erased from connections_.
    std::vector<ConnectionPtr> targets;
    targets.reserve(connections_.size());
    for (const auto& [name, weak] : connections_) {
        if (name == identity) continue;
        if (ConnectionPtr c = weak.lock()) targets.push_back(std::move(c));
    }

    const protocol::Outbound event = protocol::StatusEvent{identity, online};
    for (const auto& c : targets) send_locked(c, event);
}

void Hub::flush_evictions_locked() {
    while (!pending_offline_.empty()) {
        std::string identity = std::move(pending_offline_.back());
        pending_offline_.pop_back();
        broadcast_status_locked(identity, false);
    }
}

bool Hub::contains_ci(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

} // namespace duochat::chat
