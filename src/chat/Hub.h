#pragma once

#include "chat/Connection.h"
#include "chat/IDGenerator.hpp"
#include "chat/Message.h"
#include "chat/User.h"
#include "protocol/Envelope.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace duochat::chat {

// Presence and routing table. The single authority over who is connected,
// who is online and what was said between whom.
//
// Every mutation runs under the exclusive lock, every query under the shared
// lock. Queue pushes never block, so the lock is never held across socket
// I/O. Register, unregister and typing events may additionally be funnelled
// through post_*(), which serializes them on the hub's strand; message
// routing is called directly from the sender's reader pump.
class Hub {
public:
    using ConnectionPtr = std::shared_ptr<Connection>;

    explicit Hub(boost::asio::io_context& ioc);

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    // ---- event loop ----

    // `on_registered` runs on the hub's strand once the connection is in
    // the table, so callers can hold back their reader until then.
    void post_register(ConnectionPtr connection, std::function<void()> on_registered = {});
    void post_unregister(ConnectionPtr connection);
    void post_typing(std::string from, std::string to, bool is_typing);

    // ---- connection churn ----

    // Evicts any connection already registered for the same identity, then
    // announces the newcomer and sends it the current online set.
    bool register_connection(const ConnectionPtr& connection);

    // Ignored when `connection` is no longer the registered one.
    void unregister_connection(const ConnectionPtr& connection);

    // Unregisters whatever connection `identity` currently has.
    bool disconnect(const std::string& identity);

    // ---- routing ----
    Message route_message(const std::string& from, const std::string& to, std::string content);
    void route_typing(const std::string& from, const std::string& to, bool is_typing);

    // ---- queries ----
    std::vector<ConversationSummary> list_conversations(const std::string& identity) const;
    std::vector<Message> get_conversation(const std::string& a, const std::string& b) const;
    std::vector<UserSummary> search_identities(std::string_view fragment, std::string_view exclude) const;

    bool is_connected(const std::string& identity) const;
    std::optional<Presence> presence_of(const std::string& identity) const;
    std::size_t connection_count() const;

private:
    // All *_locked() members require mu_ held exclusively.
    ConnectionPtr connection_locked(const std::string& identity) const;
    bool send_locked(const ConnectionPtr& connection, const protocol::Outbound& event);
    void evict_locked(const ConnectionPtr& connection);
    void broadcast_status_locked(const std::string& identity, bool online);
    void flush_evictions_locked();

    static bool contains_ci(std::string_view haystack, std::string_view needle);

private:
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;

    IDGenerator ids_;

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::weak_ptr<Connection>> connections_;
    std::unordered_map<std::string, User> users_;
    std::unordered_map<std::string, std::vector<Message>> conversations_;

    // Identities dropped for backpressure whose offline status is not yet broadcast.
    std::vector<std::string> pending_offline_;
};

} // namespace duochat::chat
