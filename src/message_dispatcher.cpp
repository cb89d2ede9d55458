#include "message_dispatcher.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "logger.hpp"

#include <thread>

namespace chathub {

namespace {

const char* platform_name() {
#if defined(__linux__)
    return "linux";
#elif defined(__APPLE__)
    return "macos";
#elif defined(_WIN32)
    return "windows";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

}

MessageDispatcher::MessageDispatcher(const ServerConfig& config, ConnectionManager& conn_manager,
                                     ServerStats& stats, Broadcaster& broadcaster, AiGateway& ai)
    : config_(config)
    , conn_manager_(conn_manager)
    , stats_(stats)
    , broadcaster_(broadcaster)
    , ai_(ai)
{}

void MessageDispatcher::handle_message(const std::string& client_id, const std::string& frame) {
    auto client = conn_manager_.get_client(client_id);
    if (!client) {
        // Frame raced with cleanup; the connection is already gone.
        return;
    }

    try {
        Incoming message = parse_incoming(frame, config_.max_json_depth);
        std::visit([&](const auto& m) { handle(*client, m); }, message);
    } catch (const RateLimitError& e) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::RATE_LIMIT_HIT, client->ip(),
                    "Chat rate limit exceeded for " + client->id() +
                    ", wait " + std::to_string(e.wait_seconds()) + "s");
        reply(*client, outgoing::Error{e.what()});
    } catch (const ClientError& e) {
        Logger::log(Logger::Level::DEBUG, Logger::EventType::INVALID_INPUT, client->ip(), e.what());
        reply(*client, outgoing::Error{e.what()});
    }
}

// Chat is echoed to everyone including the sender; clients render the server copy only.
void MessageDispatcher::handle(Client& client, const incoming::Chat& msg) {
    std::string text = InputValidator::normalize_chat_text(msg.text, config_.max_chat_length);

    if (config_.chat_rate_limit_enabled) {
        auto limit = client.check_rate_limit(config_.chat_messages_per_minute);
        if (!limit.allowed) {
            throw RateLimitError("Rate limit exceeded. Please wait " +
                                 std::to_string(limit.reset_after_sec) + " seconds.",
                                 limit.reset_after_sec);
        }
    }

    stats_.increment_messages();
    broadcaster_.broadcast(outgoing::Chat{client.name(), text, now_ms()});
}

void MessageDispatcher::handle(Client& client, const incoming::SetName& msg) {
    std::string name = InputValidator::normalize_display_name(
        msg.name, config_.min_name_length, config_.max_name_length);

    std::string old_name = client.rename(name);
    reply(client, outgoing::AckName{name, now_ms()});
    broadcaster_.broadcast(outgoing::System{old_name + " heet nu " + name + ".", now_ms()}, client.id());

    Logger::log(Logger::Level::DEBUG, Logger::EventType::LIFECYCLE, client.ip(),
                "Client " + client.id() + " renamed from " + old_name + " to " + name);
}

void MessageDispatcher::handle(Client& client, const incoming::Status&) {
    reply(client, build_status());
}

void MessageDispatcher::handle(Client& client, const incoming::ListUsers&) {
    reply(client, outgoing::ListUsers{conn_manager_.list_users()});
}

void MessageDispatcher::handle(Client& client, const incoming::Ping& msg) {
    reply(client, outgoing::Pong{msg.token, now_ms()});
}

// The completion call runs asynchronously; only the client id and name are carried
// into the callback so a departed client is simply skipped on failure.
void MessageDispatcher::handle(Client& client, const incoming::Ai& msg) {
    std::string rate_key = client.ip();
    if (rate_key.empty() || rate_key == "unknown") {
        rate_key = client.id();
    }

    ai_.query(rate_key, msg.prompt,
              [this, id = client.id(), name = client.name(), prompt = msg.prompt](AiResult result) {
        if (auto* response = std::get_if<AiResponse>(&result)) {
            broadcaster_.broadcast(outgoing::Ai{
                name,
                prompt,
                std::move(response->content),
                response->response_ms,
                response->tokens,
                response->cost,
                now_ms()
            });
            return;
        }

        const auto& error = std::get<AiError>(result);
        if (auto sender = conn_manager_.get_client(id)) {
            reply(*sender, outgoing::Error{error.message});
        }
    });
}

outgoing::Status MessageDispatcher::build_status() const {
    unsigned cores = std::thread::hardware_concurrency();

    outgoing::Status status{};
    status.version = CHATHUB_VERSION;
    status.os = platform_name();
    status.cpu_cores = cores == 0 ? 1 : cores;
    status.uptime_seconds = stats_.uptime_seconds();
    status.user_count = conn_manager_.connection_count();
    status.peak_users = stats_.peak_users();
    status.connections_total = stats_.connections_total();
    status.messages_sent = stats_.messages_sent();
    status.messages_per_second = stats_.messages_per_second();
    status.memory_mb = ServerStats::memory_mb();
    status.ai_enabled = ai_.is_enabled();
    if (status.ai_enabled) {
        status.ai_model = ai_.model();
    }
    return status;
}

void MessageDispatcher::reply(Client& client, const Outgoing& message) {
    DeliveryStatus status = client.send(message);
    if (status != DeliveryStatus::Queued) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::DELIVERY_FAILED, client.ip(),
                    std::string("Reply ") + kind(message) + " to " + client.id() + " dropped (" +
                    to_string(status) + ")");
    }
}

}
