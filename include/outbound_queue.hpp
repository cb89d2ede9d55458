#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace chathub {

enum class DeliveryStatus {
    Queued,
    Full,
    Closed
};

const char* to_string(DeliveryStatus status);

// Bounded mailbox between producers (dispatcher, fan-out) and one connection's send loop.
// Producers never block: a full or closed queue rejects the payload immediately.
class OutboundQueue {
public:
    using Payload = std::shared_ptr<const std::string>;
    using ReadyHandler = std::function<void()>;

    explicit OutboundQueue(size_t capacity);

    OutboundQueue(const OutboundQueue&) = delete;
    OutboundQueue& operator=(const OutboundQueue&) = delete;

    DeliveryStatus try_push(Payload payload);
    DeliveryStatus try_push(std::string text);

    // Next payload in FIFO order, or nullptr when empty.
    Payload pop();

    // Rejects all further pushes; payloads already queued can still be popped.
    void close();

    bool is_closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

    // Invoked (outside the lock) after every successful push.
    void set_ready_handler(ReadyHandler handler);

private:
    const size_t capacity_;
    std::deque<Payload> items_;
    bool closed_ = false;
    ReadyHandler on_ready_;
    mutable std::mutex mutex_;
};

}
