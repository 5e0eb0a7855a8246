#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace duochat::chat {

// Bounded frame queue between the hub (many producers) and one writer pump.
// Pushing never blocks: a full queue is reported to the caller, who decides
// what overflow means. Closing is idempotent; frames queued before close()
// remain poppable so the writer can flush them before it stops.
class OutboundQueue {
public:
    enum class PushResult { Queued, Full, Closed };

    // Invoked after every successful push and after the closing call to
    // close(), outside the queue's lock. Must not block.
    using Notify = std::function<void()>;

    explicit OutboundQueue(std::size_t capacity);

    OutboundQueue(const OutboundQueue&) = delete;
    OutboundQueue& operator=(const OutboundQueue&) = delete;

    PushResult push(std::string frame);

    std::optional<std::string> pop();

    // Everything queued at this instant, in push order.
    std::vector<std::string> drain();

    // True only for the call that actually closed the queue.
    bool close();

    bool closed() const;
    std::size_t size() const;
    std::size_t capacity() const noexcept { return capacity_; }

    void set_notify(Notify cb);

private:
    void fire_notify();

    const std::size_t capacity_;

    mutable std::mutex mu_;
    std::deque<std::string> frames_;
    bool closed_ = false;
    Notify notify_;
};

} // namespace duochat::chat
