#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace duochat::chat {

using Timestamp = std::chrono::system_clock::time_point;

enum class DeliveryState { Sent, Delivered };

const char* to_string(DeliveryState state) noexcept;

struct Message {
    std::string id;
    std::string from;
    std::string to;
    std::string content;
    Timestamp created_at{};
    DeliveryState state = DeliveryState::Sent;
};

// One row of a participant's conversation list.
struct ConversationSummary {
    std::string peer;
    std::string last_message_preview;
    Timestamp last_message_time{};
    bool peer_online = false;
};

struct UserSummary {
    std::string username;
    bool online = false;
};

// Order-independent log key: "min|max". '|' never appears in a valid name.
std::string conversation_key(std::string_view a, std::string_view b);

// RFC3339 in UTC, second precision ("2024-05-01T12:00:00Z").
std::string format_rfc3339(Timestamp t);

} // namespace duochat::chat
