#include "connection_manager.hpp"

#include <mutex>

namespace chathub {

// Registers a client in the connection pool.
bool ConnectionManager::add_client(ClientPtr client) {
    if (!client) return false;

    std::unique_lock lock(connections_mutex_);
    return connections_.emplace(client->id(), std::move(client)).second;
}

// Drops a client from the pool once its receive loop has finished.
ConnectionManager::ClientPtr ConnectionManager::remove_client(const std::string& id) {
    std::unique_lock lock(connections_mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return nullptr;
    }
    ClientPtr client = std::move(it->second);
    connections_.erase(it);
    return client;
}

ConnectionManager::ClientPtr ConnectionManager::get_client(const std::string& id) const {
    std::shared_lock lock(connections_mutex_);
    auto it = connections_.find(id);
    if (it != connections_.end()) {
        return it->second;
    }
    return nullptr;
}

bool ConnectionManager::is_online(const std::string& id) const {
    if (id.empty()) return false;
    std::shared_lock lock(connections_mutex_);
    return connections_.find(id) != connections_.end();
}

size_t ConnectionManager::connection_count() const {
    std::shared_lock lock(connections_mutex_);
    return connections_.size();
}

std::vector<UserInfo> ConnectionManager::list_users() const {
    std::vector<UserInfo> users;
    std::shared_lock lock(connections_mutex_);
    users.reserve(connections_.size());
    for (const auto& [id, client] : connections_) {
        users.push_back(UserInfo{id, client->name(), client->ip()});
    }
    return users;
}

void ConnectionManager::for_each_client(const std::function<void(Client&)>& visitor) const {
    std::shared_lock lock(connections_mutex_);
    for (const auto& [id, client] : connections_) {
        visitor(*client);
    }
}

// Closes all tracked outbound queues.
void ConnectionManager::close_all_connections() {
    std::vector<ClientPtr> active;
    {
        std::shared_lock lock(connections_mutex_);
        for (const auto& [id, client] : connections_) {
            active.push_back(client);
        }
    }

    for (const auto& client : active) {
        client->outbound().close();
    }
}

}
