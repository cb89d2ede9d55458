#include "outbound_queue.hpp"

namespace chathub {

const char* to_string(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::Queued: return "queued";
        case DeliveryStatus::Full: return "queue full";
        case DeliveryStatus::Closed: return "channel closed";
        default: return "unknown";
    }
}

OutboundQueue::OutboundQueue(size_t capacity) : capacity_(capacity) {}

DeliveryStatus OutboundQueue::try_push(Payload payload) {
    ReadyHandler notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return DeliveryStatus::Closed;
        if (items_.size() >= capacity_) return DeliveryStatus::Full;
        items_.push_back(std::move(payload));
        notify = on_ready_;
    }

    if (notify) notify();
    return DeliveryStatus::Queued;
}

DeliveryStatus OutboundQueue::try_push(std::string text) {
    return try_push(std::make_shared<const std::string>(std::move(text)));
}

OutboundQueue::Payload OutboundQueue::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) return nullptr;
    Payload front = std::move(items_.front());
    items_.pop_front();
    return front;
}

void OutboundQueue::close() {
    ReadyHandler notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        notify = on_ready_;
    }

    // Wake the send loop so it can observe the close.
    if (notify) notify();
}

bool OutboundQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t OutboundQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

void OutboundQueue::set_ready_handler(ReadyHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_ready_ = std::move(handler);
}

}
