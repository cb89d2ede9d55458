#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "ai_gateway.hpp"
#include "broadcaster.hpp"
#include "client.hpp"
#include "connection_manager.hpp"
#include "message_dispatcher.hpp"
#include "outbound_queue.hpp"
#include "server_config.hpp"
#include "server_stats.hpp"

namespace chathub {

// Shared service object for the single broadcast room. Constructed once at startup and
// passed by reference to every connection; all members are internally synchronized.
class ChatHub {
public:
    ChatHub(const ServerConfig& config, AiGateway& ai);
    ~ChatHub() = default;

    ChatHub(const ChatHub&) = delete;
    ChatHub& operator=(const ChatHub&) = delete;

    /**
     * Registers a new connection whose send loop already drains `outbound`.
     * Assigns a fresh identity and guest name, updates stats, acknowledges the
     * name to the newcomer and announces the join to everyone else.
     * Once close_all has run, closes `outbound` and throws std::runtime_error.
     */
    std::shared_ptr<Client> connect(const std::string& origin_ip, std::shared_ptr<OutboundQueue> outbound);

    void handle_text(const std::string& client_id, const std::string& frame);

    /**
     * Removes the client, closes its outbound queue and announces the departure
     * under the name it had at that moment. Safe to call more than once.
     */
    void disconnect(const std::string& client_id);

    // Graceful shutdown: every send loop flushes and closes its socket. No chat notice is sent.
    // Later connect() calls are refused.
    void close_all();

    bool is_closing() const { return closing_.load(); }

    ConnectionManager& connections() { return conn_manager_; }
    const ServerStats& stats() const { return stats_; }
    const MessageDispatcher& dispatcher() const { return dispatcher_; }
    const ServerConfig& config() const { return config_; }

private:
    const ServerConfig& config_;
    ConnectionManager conn_manager_;
    ServerStats stats_;
    Broadcaster broadcaster_;
    MessageDispatcher dispatcher_;
    std::atomic<bool> closing_{false};
};

}
