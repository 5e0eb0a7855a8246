#include "chat/Message.h"

#include <ctime>
#include <utility>

namespace duochat::chat {

const char* to_string(DeliveryState state) noexcept {
    switch (state) {
        case DeliveryState::Sent:      return "sent";
        case DeliveryState::Delivered: return "delivered";
    }
    return "sent";
}

std::string conversation_key(std::string_view a, std::string_view b) {
    if (b < a) std::swap(a, b);

    std::string key;
    key.reserve(a.size() + b.size() + 1);
    key.append(a);
    key.push_back('|');
    key.append(b);
    return key;
}

std::string format_rfc3339(Timestamp t) {
    const std::time_t secs = std::chrono::system_clock::to_time_t(t);
    std::tm utc{};
    gmtime_r(&secs, &utc);

    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf, n);
}

} // namespace duochat::chat
