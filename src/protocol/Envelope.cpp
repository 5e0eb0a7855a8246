#include "protocol/Envelope.h"

#include "chat/Error.h"

#include <type_traits>

namespace duochat::protocol {

namespace json = boost::json;

namespace {

std::string to_std(const json::string& s) {
    return std::string(s.data(), s.size());
}

// Absent keys keep `out` unchanged; present keys of the wrong type fail.
bool read_string(const json::object& obj, const char* key, std::string& out) {
    const json::value* v = obj.if_contains(key);
    if (!v) return true;
    const json::string* s = v->if_string();
    if (!s) return false;
    out = to_std(*s);
    return true;
}

bool read_bool(const json::object& obj, const char* key, bool& out) {
    const json::value* v = obj.if_contains(key);
    if (!v) return true;
    const bool* b = v->if_bool();
    if (!b) return false;
    out = *b;
    return true;
}

Inbound fail(boost::system::error_code& ec, Errc e) {
    ec = make_error_code(e);
    return Inbound{};
}

} // namespace

Inbound decode(std::string_view frame, boost::system::error_code& ec) {
    ec.clear();

    boost::system::error_code parse_ec;
    json::value v = json::parse(json::string_view(frame.data(), frame.size()), parse_ec);
    if (parse_ec) return fail(ec, Errc::malformed_envelope);

    const json::object* envelope = v.if_object();
    if (!envelope) return fail(ec, Errc::malformed_envelope);

    const json::value* type = envelope->if_contains("type");
    if (!type || !type->is_string()) return fail(ec, Errc::malformed_envelope);

    const json::value* payload_value = envelope->if_contains("payload");
    if (!payload_value || !payload_value->is_object()) return fail(ec, Errc::malformed_envelope);
    const json::object& payload = payload_value->get_object();

    const std::string kind_name = to_std(type->get_string());

    if (kind_name == kind::message) {
        ChatRequest req;
        std::string temp_id;
        if (!read_string(payload, "to", req.to) ||
            !read_string(payload, "content", req.content) ||
            !read_string(payload, "tempId", temp_id)) {
            return fail(ec, Errc::malformed_envelope);
        }
        if (req.to.empty()) return fail(ec, Errc::missing_recipient);
        if (payload.contains("tempId")) req.temp_id = std::move(temp_id);
        return req;
    }

    if (kind_name == kind::typing) {
        TypingRequest req;
        if (!read_string(payload, "to", req.to) ||
            !read_bool(payload, "isTyping", req.is_typing)) {
            return fail(ec, Errc::malformed_envelope);
        }
        if (req.to.empty()) return fail(ec, Errc::missing_recipient);
        return req;
    }

    return fail(ec, Errc::unknown_envelope_kind);
}

std::string_view kind_of(const Outbound& event) noexcept {
    switch (event.index()) {
        case 0: return kind::message;
        case 1: return kind::typing;
        case 2: return kind::status;
        default: return kind::ack;
    }
}

boost::json::object payload_of(const Outbound& event) {
    return std::visit([](const auto& e) -> json::object {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MessageEvent>) {
            json::object obj = to_json(e.message);
            obj["status"] = chat::to_string(e.status);
            return obj;
        } else if constexpr (std::is_same_v<T, TypingEvent>) {
            return {{"from", e.from}, {"isTyping", e.is_typing}};
        } else if constexpr (std::is_same_v<T, StatusEvent>) {
            return {{"username", e.username}, {"online", e.online}};
        } else {
            return {{"messageId", e.message_id}, {"status", chat::to_string(e.status)}};
        }
    }, event);
}

std::string encode(const Outbound& event) {
    const std::string_view k = kind_of(event);
    json::object envelope{
        {"type", json::string_view(k.data(), k.size())},
        {"payload", payload_of(event)}
    };
    return json::serialize(envelope);
}

boost::json::object to_json(const chat::Message& m) {
    return {
        {"id", m.id},
        {"from", m.from},
        {"to", m.to},
        {"content", m.content},
        {"timestamp", chat::format_rfc3339(m.created_at)},
        {"status", chat::to_string(m.state)}
    };
}

boost::json::object to_json(const chat::ConversationSummary& c) {
    return {
        {"peerUsername", c.peer},
        {"lastMessagePreview", c.last_message_preview},
        {"lastMessageTime", chat::format_rfc3339(c.last_message_time)},
        {"peerOnline", c.peer_online}
    };
}

boost::json::object to_json(const chat::UserSummary& u) {
    return {{"username", u.username}, {"online", u.online}};
}

} // namespace duochat::protocol
