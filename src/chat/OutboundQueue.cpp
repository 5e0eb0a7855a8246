#include "chat/OutboundQueue.h"

#include <utility>

namespace duochat::chat {

OutboundQueue::OutboundQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

OutboundQueue::PushResult OutboundQueue::push(std::string frame) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return PushResult::Closed;
        if (frames_.size() >= capacity_) return PushResult::Full;
        frames_.push_back(std::move(frame));
    }
    fire_notify();
    return PushResult::Queued;
}

std::optional<std::string> OutboundQueue::pop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (frames_.empty()) return std::nullopt;
    std::string frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

std::vector<std::string> OutboundQueue::drain() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(frames_.size());
    for (auto& f : frames_) out.push_back(std::move(f));
    frames_.clear();
    return out;
}

bool OutboundQueue::close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return false;
        closed_ = true;
    }
    fire_notify();
    return true;
}

bool OutboundQueue::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

std::size_t OutboundQueue::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return frames_.size();
}

void OutboundQueue::set_notify(Notify cb) {
    std::lock_guard<std::mutex> lk(mu_);
    notify_ = std::move(cb);
}

void OutboundQueue::fire_notify() {
    Notify cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = notify_;
    }
    if (cb) cb();
}

} // namespace duochat::chat
