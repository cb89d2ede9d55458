#include "client.hpp"

namespace chathub {

Client::Client(std::string id, std::string name, std::string ip,
               std::shared_ptr<OutboundQueue> outbound)
    : id_(std::move(id))
    , ip_(std::move(ip))
    , connected_at_(std::chrono::system_clock::now())
    , outbound_(std::move(outbound))
    , name_(std::move(name))
{}

std::string Client::name() const {
    std::lock_guard<std::mutex> lock(name_mutex_);
    return name_;
}

std::string Client::rename(const std::string& new_name) {
    std::lock_guard<std::mutex> lock(name_mutex_);
    std::string old = std::move(name_);
    name_ = new_name;
    return old;
}

DeliveryStatus Client::send(const Outgoing& message) {
    return outbound_->try_push(serialize(message));
}

DeliveryStatus Client::send(OutboundQueue::Payload payload) {
    return outbound_->try_push(std::move(payload));
}

RateLimitResult Client::check_rate_limit(int messages_per_minute, SlidingWindow::Clock::time_point now) {
    std::lock_guard<std::mutex> lock(window_mutex_);
    return message_window_.check(messages_per_minute, now);
}

}
