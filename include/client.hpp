#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "outbound_queue.hpp"
#include "protocol.hpp"
#include "rate_limiter.hpp"

namespace chathub {

// State of one live connection. Identity, origin and the outbound queue are fixed at
// construction; the display name and the chat rate window are guarded separately.
class Client {
public:
    Client(std::string id, std::string name, std::string ip,
           std::shared_ptr<OutboundQueue> outbound);

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    const std::string& id() const { return id_; }
    const std::string& ip() const { return ip_; }
    std::chrono::system_clock::time_point connected_at() const { return connected_at_; }

    std::string name() const;

    // Replaces the display name and returns the previous one.
    std::string rename(const std::string& new_name);

    // Serializes and enqueues without blocking.
    DeliveryStatus send(const Outgoing& message);
    DeliveryStatus send(OutboundQueue::Payload payload);

    RateLimitResult check_rate_limit(int messages_per_minute,
                                     SlidingWindow::Clock::time_point now = SlidingWindow::Clock::now());

    OutboundQueue& outbound() { return *outbound_; }

private:
    const std::string id_;
    const std::string ip_;
    const std::chrono::system_clock::time_point connected_at_;
    std::shared_ptr<OutboundQueue> outbound_;

    std::string name_;
    mutable std::mutex name_mutex_;

    SlidingWindow message_window_;
    std::mutex window_mutex_;
};

}
