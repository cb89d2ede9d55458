#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "client.hpp"
#include "protocol.hpp"

namespace chathub {

// Registry of live clients keyed by connection identity.
// Readers (fan-out, lookups) share the lock; only insert and remove take it exclusively.
class ConnectionManager {
public:
    using ClientPtr = std::shared_ptr<Client>;

    ConnectionManager() = default;
    ~ConnectionManager() = default;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Returns false if the identity is already registered.
    bool add_client(ClientPtr client);

    // Removes and returns the client, or nullptr if it was not registered.
    ClientPtr remove_client(const std::string& id);

    ClientPtr get_client(const std::string& id) const;

    bool is_online(const std::string& id) const;

    size_t connection_count() const;

    std::vector<UserInfo> list_users() const;

    /**
     * Visits every registered client under a shared lock. The visitor must not
     * block and must not call back into add/remove.
     */
    void for_each_client(const std::function<void(Client&)>& visitor) const;

    // Closes every outbound queue so each send loop flushes and ends its connection.
    void close_all_connections();

private:
    std::unordered_map<std::string, ClientPtr> connections_;
    mutable std::shared_mutex connections_mutex_;
};

}
