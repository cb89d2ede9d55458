#pragma once

#include <string>

#include "ai_gateway.hpp"
#include "broadcaster.hpp"
#include "client.hpp"
#include "connection_manager.hpp"
#include "protocol.hpp"
#include "server_config.hpp"
#include "server_stats.hpp"

namespace chathub {

// Interprets inbound envelopes from one client and produces unicast replies and broadcasts.
// Protocol, validation and rate-limit failures are answered to the sender only and never
// touch the global counters.
class MessageDispatcher {
public:
    MessageDispatcher(const ServerConfig& config, ConnectionManager& conn_manager, ServerStats& stats,
                      Broadcaster& broadcaster, AiGateway& ai);
    ~MessageDispatcher() = default;

    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    // Entry point for every inbound text frame. Never throws.
    void handle_message(const std::string& client_id, const std::string& frame);

    outgoing::Status build_status() const;

private:
    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
    ServerStats& stats_;
    Broadcaster& broadcaster_;
    AiGateway& ai_;

    void handle(Client& client, const incoming::Chat& msg);
    void handle(Client& client, const incoming::SetName& msg);
    void handle(Client& client, const incoming::Status& msg);
    void handle(Client& client, const incoming::ListUsers& msg);
    void handle(Client& client, const incoming::Ping& msg);
    void handle(Client& client, const incoming::Ai& msg);

    void reply(Client& client, const Outgoing& message);
};

}
