#include "chat_hub.hpp"
#include "id_generator.hpp"
#include "logger.hpp"

#include <chrono>
#include <stdexcept>

namespace chathub {

ChatHub::ChatHub(const ServerConfig& config, AiGateway& ai)
    : config_(config)
    , broadcaster_(conn_manager_)
    , dispatcher_(config_, conn_manager_, stats_, broadcaster_, ai)
{}

std::shared_ptr<Client> ChatHub::connect(const std::string& origin_ip, std::shared_ptr<OutboundQueue> outbound) {
    if (closing_) {
        outbound->close();
        throw std::runtime_error("Server is shutting down");
    }

    std::shared_ptr<Client> client;

    // A v4 collision is practically impossible, but an identity must never be shared.
    for (int attempt = 0; attempt < 8 && !client; ++attempt) {
        std::string id = IdGenerator::generate_id();
        auto candidate = std::make_shared<Client>(id, IdGenerator::default_name(id), origin_ip, outbound);
        if (conn_manager_.add_client(candidate)) {
            client = std::move(candidate);
        }
    }
    if (!client) {
        throw std::runtime_error("Unable to allocate a unique connection id");
    }

    // close_all may have swept the registry between the check above and add_client.
    if (closing_) {
        conn_manager_.remove_client(client->id());
        outbound->close();
        throw std::runtime_error("Server is shutting down");
    }

    stats_.record_connection(conn_manager_.connection_count());

    Logger::log(Logger::Level::INFO, Logger::EventType::CONNECTION_OPENED, origin_ip,
                "Client connected id=" + client->id() + " name=" + client->name());

    const std::string name = client->name();
    if (client->send(outgoing::AckName{name, now_ms()}) != DeliveryStatus::Queued) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::DELIVERY_FAILED, origin_ip,
                    "Could not queue name acknowledgement for " + client->id());
    }
    broadcaster_.broadcast(outgoing::System{name + " heeft de chat betreden.", now_ms()}, client->id());

    return client;
}

void ChatHub::handle_text(const std::string& client_id, const std::string& frame) {
    dispatcher_.handle_message(client_id, frame);
}

void ChatHub::disconnect(const std::string& client_id) {
    auto client = conn_manager_.remove_client(client_id);
    if (!client) {
        return;
    }

    const std::string final_name = client->name();
    client->outbound().close();

    broadcaster_.broadcast(outgoing::System{final_name + " heeft de chat verlaten.", now_ms()}, client_id);

    auto duration = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - client->connected_at());
    Logger::log(Logger::Level::INFO, Logger::EventType::CONNECTION_CLOSED, client->ip(),
                "Client disconnected id=" + client_id + " name=" + final_name +
                " duration=" + std::to_string(duration.count()) + "s");
}

void ChatHub::close_all() {
    closing_ = true;
    Logger::log(Logger::Level::INFO, Logger::EventType::LIFECYCLE, "internal",
                "Closing " + std::to_string(conn_manager_.connection_count()) + " connections");
    conn_manager_.close_all_connections();
}

}
