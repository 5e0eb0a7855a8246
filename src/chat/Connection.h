#pragma once

#include "chat/OutboundQueue.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace duochat::chat {

// The hub-facing half of one live socket: who is on the other end and the
// queue the writer pump drains. The pump pair owns the Connection; the hub
// only keeps a weak handle to it.
class Connection {
public:
    using Clock = std::chrono::steady_clock;

    Connection(std::string identity, std::size_t queue_capacity);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& identity() const noexcept { return identity_; }

    OutboundQueue& queue() noexcept { return queue_; }
    const OutboundQueue& queue() const noexcept { return queue_; }

    Clock::time_point connected_at() const noexcept { return connected_at_; }

private:
    std::string identity_;
    OutboundQueue queue_;
    Clock::time_point connected_at_;
};

} // namespace duochat::chat
