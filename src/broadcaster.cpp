#include "broadcaster.hpp"
#include "logger.hpp"

namespace chathub {

Broadcaster::Broadcaster(ConnectionManager& conn_manager)
    : conn_manager_(conn_manager)
{}

BroadcastReport Broadcaster::broadcast(const Outgoing& message, const std::string& except_id) {
    auto payload = std::make_shared<const std::string>(serialize(message));
    return broadcast_payload(payload, kind(message), except_id);
}

BroadcastReport Broadcaster::broadcast_payload(const OutboundQueue::Payload& payload, const char* kind,
                                               const std::string& except_id) {
    BroadcastReport report;

    conn_manager_.for_each_client([&](Client& client) {
        if (!except_id.empty() && client.id() == except_id) {
            return;
        }

        DeliveryStatus status = client.send(payload);
        if (status == DeliveryStatus::Queued) {
            ++report.delivered;
        } else {
            ++report.dropped;
            // A closed queue belongs to a connection already tearing down.
            auto level = status == DeliveryStatus::Full ? Logger::Level::WARNING : Logger::Level::DEBUG;
            Logger::log(level, Logger::EventType::DELIVERY_FAILED, client.ip(),
                        "Send to client " + client.id() + " failed (" + to_string(status) + ")");
        }
    });

    if (Logger::enabled(Logger::Level::DEBUG)) {
        Logger::log(Logger::Level::DEBUG, Logger::EventType::LIFECYCLE, "internal",
                    std::string("Broadcast ") + kind + " delivered=" + std::to_string(report.delivered) +
                    " dropped=" + std::to_string(report.dropped));
    }
    return report;
}

}
