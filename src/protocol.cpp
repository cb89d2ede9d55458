#include "protocol.hpp"
#include "errors.hpp"
#include "input_validator.hpp"

#include <chrono>

namespace json = boost::json;

namespace chathub {

namespace {

constexpr const char* kInvalidJson = "Bericht moet geldig JSON zijn.";
constexpr const char* kUnknownType = "Onbekend berichttype.";
constexpr const char* kIncomplete = "Onvolledig bericht.";

std::string required_string(const json::object& obj, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end() || !it->value().is_string()) {
        throw ProtocolError(kIncomplete);
    }
    return std::string(it->value().as_string());
}

std::optional<std::string> optional_string(const json::object& obj, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end() || it->value().is_null()) {
        return std::nullopt;
    }
    if (!it->value().is_string()) {
        throw ProtocolError(kIncomplete);
    }
    return std::string(it->value().as_string());
}

// Builds the JSON body of each outbound envelope; "type" is written first.
struct JsonWriter {
    json::object operator()(const outgoing::Chat& m) const {
        json::object obj;
        obj["type"] = "chat";
        obj["from"] = m.from;
        obj["text"] = m.text;
        obj["at"] = m.at;
        return obj;
    }

    json::object operator()(const outgoing::System& m) const {
        json::object obj;
        obj["type"] = "system";
        obj["text"] = m.text;
        obj["at"] = m.at;
        return obj;
    }

    json::object operator()(const outgoing::AckName& m) const {
        json::object obj;
        obj["type"] = "ackName";
        obj["name"] = m.name;
        obj["at"] = m.at;
        return obj;
    }

    json::object operator()(const outgoing::Status& m) const {
        json::object obj;
        obj["type"] = "status";
        obj["version"] = m.version;
        obj["os"] = m.os;
        obj["cpuCores"] = m.cpu_cores;
        obj["uptimeSeconds"] = m.uptime_seconds;
        obj["userCount"] = m.user_count;
        obj["peakUsers"] = m.peak_users;
        obj["connectionsTotal"] = m.connections_total;
        obj["messagesSent"] = m.messages_sent;
        obj["messagesPerSecond"] = m.messages_per_second;
        obj["memoryMb"] = m.memory_mb;
        obj["aiEnabled"] = m.ai_enabled;
        if (m.ai_model) obj["aiModel"] = *m.ai_model;
        return obj;
    }

    json::object operator()(const outgoing::ListUsers& m) const {
        json::array users;
        for (const auto& u : m.users) {
            json::object entry;
            entry["id"] = u.id;
            entry["name"] = u.name;
            entry["ip"] = u.ip;
            users.push_back(std::move(entry));
        }
        json::object obj;
        obj["type"] = "listUsers";
        obj["users"] = std::move(users);
        return obj;
    }

    json::object operator()(const outgoing::Error& m) const {
        json::object obj;
        obj["type"] = "error";
        obj["message"] = m.message;
        return obj;
    }

    json::object operator()(const outgoing::Pong& m) const {
        json::object obj;
        obj["type"] = "pong";
        if (m.token) {
            obj["token"] = *m.token;
        } else {
            obj["token"] = nullptr;
        }
        obj["at"] = m.at;
        return obj;
    }

    json::object operator()(const outgoing::Ai& m) const {
        json::object obj;
        obj["type"] = "ai";
        obj["from"] = m.from;
        obj["prompt"] = m.prompt;
        obj["response"] = m.response;
        obj["responseMs"] = m.response_ms;
        if (m.tokens) obj["tokens"] = *m.tokens;
        if (m.cost) obj["cost"] = *m.cost;
        obj["at"] = m.at;
        return obj;
    }
};

struct KindName {
    const char* operator()(const outgoing::Chat&) const { return "chat"; }
    const char* operator()(const outgoing::System&) const { return "system"; }
    const char* operator()(const outgoing::AckName&) const { return "ackName"; }
    const char* operator()(const outgoing::Status&) const { return "status"; }
    const char* operator()(const outgoing::ListUsers&) const { return "listUsers"; }
    const char* operator()(const outgoing::Error&) const { return "error"; }
    const char* operator()(const outgoing::Pong&) const { return "pong"; }
    const char* operator()(const outgoing::Ai&) const { return "ai"; }
};

}

Incoming parse_incoming(std::string_view frame, size_t max_depth) {
    json::value value;
    try {
        value = InputValidator::safe_parse_json(frame, max_depth);
    } catch (const std::exception&) {
        throw ProtocolError(kInvalidJson);
    }

    if (!value.is_object()) {
        throw ProtocolError(kInvalidJson);
    }
    const auto& obj = value.as_object();

    auto type_it = obj.find("type");
    if (type_it == obj.end() || !type_it->value().is_string()) {
        throw ProtocolError(kInvalidJson);
    }
    std::string_view type = type_it->value().as_string();

    if (type == "chat") return incoming::Chat{required_string(obj, "text")};
    if (type == "setName") return incoming::SetName{required_string(obj, "name")};
    if (type == "status") return incoming::Status{};
    if (type == "listUsers") return incoming::ListUsers{};
    if (type == "ping") return incoming::Ping{optional_string(obj, "token")};
    if (type == "ai") return incoming::Ai{required_string(obj, "prompt")};

    throw ProtocolError(kUnknownType);
}

json::object to_json(const Outgoing& message) {
    return std::visit(JsonWriter{}, message);
}

std::string serialize(const Outgoing& message) {
    return json::serialize(to_json(message));
}

const char* kind(const Outgoing& message) {
    return std::visit(KindName{}, message);
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}
