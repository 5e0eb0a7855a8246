#pragma once

#include "chat/Message.h"

#include <boost/json.hpp>
#include <boost/system/error_code.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace duochat::protocol {

// Every frame on the wire is {"type": <kind>, "payload": {...}}.
namespace kind {
inline constexpr std::string_view message = "message";
inline constexpr std::string_view typing  = "typing";
inline constexpr std::string_view status  = "status";
inline constexpr std::string_view ack     = "ack";
} // namespace kind

// ---- client -> server ----

struct ChatRequest {
    std::string to;
    std::string content;
    std::optional<std::string> temp_id;
};

struct TypingRequest {
    std::string to;
    bool is_typing = false;
};

using Inbound = std::variant<ChatRequest, TypingRequest>;

// Parses one text frame. On failure returns a default Inbound and sets `ec`
// to malformed_envelope, unknown_envelope_kind or missing_recipient.
Inbound decode(std::string_view frame, boost::system::error_code& ec);

// ---- server -> client ----

struct MessageEvent {
    chat::Message message;
    chat::DeliveryState status = chat::DeliveryState::Sent;
};

struct TypingEvent {
    std::string from;
    bool is_typing = false;
};

struct StatusEvent {
    std::string username;
    bool online = false;
};

struct AckEvent {
    std::string message_id;
    chat::DeliveryState status = chat::DeliveryState::Delivered;
};

using Outbound = std::variant<MessageEvent, TypingEvent, StatusEvent, AckEvent>;

std::string_view kind_of(const Outbound& event) noexcept;

boost::json::object payload_of(const Outbound& event);

std::string encode(const Outbound& event);

// Shapes shared with the HTTP API.
boost::json::object to_json(const chat::Message& m);
boost::json::object to_json(const chat::ConversationSummary& c);
boost::json::object to_json(const chat::UserSummary& u);

} // namespace duochat::protocol
