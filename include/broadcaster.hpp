#pragma once

#include <string>

#include "connection_manager.hpp"
#include "outbound_queue.hpp"
#include "protocol.hpp"

namespace chathub {

struct BroadcastReport {
    size_t delivered = 0;
    size_t dropped = 0;
};

// Fan-out of one serialized payload to every registered client.
// Enqueueing is non-blocking: a saturated or closed peer is logged and skipped.
class Broadcaster {
public:
    explicit Broadcaster(ConnectionManager& conn_manager);

    /**
     * Serializes `message` once and offers it to all clients except `except_id`
     * (empty string excludes nobody).
     */
    BroadcastReport broadcast(const Outgoing& message, const std::string& except_id = "");

    BroadcastReport broadcast_payload(const OutboundQueue::Payload& payload, const char* kind,
                                      const std::string& except_id = "");

private:
    ConnectionManager& conn_manager_;
};

}
