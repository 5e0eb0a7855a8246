#include "chat/Connection.h"

#include <utility>

namespace duochat::chat {

Connection::Connection(std::string identity, std::size_t queue_capacity)
    : identity_(std::move(identity)),
      queue_(queue_capacity),
      connected_at_(Clock::now()) {}

} // namespace duochat::chat
