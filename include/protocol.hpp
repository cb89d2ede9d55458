#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <variant>
#include <vector>
#include <cstdint>
#include <boost/json.hpp>

namespace chathub {

// Inbound envelopes, one JSON object per text frame tagged by "type".
namespace incoming {

struct Chat { std::string text; };
struct SetName { std::string name; };
struct Status {};
struct ListUsers {};
struct Ping { std::optional<std::string> token; };
struct Ai { std::string prompt; };

}

using Incoming = std::variant<
    incoming::Chat,
    incoming::SetName,
    incoming::Status,
    incoming::ListUsers,
    incoming::Ping,
    incoming::Ai
>;

struct UserInfo {
    std::string id;
    std::string name;
    std::string ip;
};

// Outbound envelopes. Timestamps (`at`) are Unix epoch milliseconds.
namespace outgoing {

struct Chat {
    std::string from;
    std::string text;
    int64_t at;
};

struct System {
    std::string text;
    int64_t at;
};

struct AckName {
    std::string name;
    int64_t at;
};

struct Status {
    std::string version;
    std::string os;
    unsigned cpu_cores;
    uint64_t uptime_seconds;
    uint64_t user_count;
    uint64_t peak_users;
    uint64_t connections_total;
    uint64_t messages_sent;
    double messages_per_second;
    double memory_mb;
    bool ai_enabled;
    std::optional<std::string> ai_model;
};

struct ListUsers {
    std::vector<UserInfo> users;
};

struct Error {
    std::string message;
};

struct Pong {
    std::optional<std::string> token;
    int64_t at;
};

struct Ai {
    std::string from;
    std::string prompt;
    std::string response;
    uint64_t response_ms;
    std::optional<uint32_t> tokens;
    std::optional<double> cost;
    int64_t at;
};

}

using Outgoing = std::variant<
    outgoing::Chat,
    outgoing::System,
    outgoing::AckName,
    outgoing::Status,
    outgoing::ListUsers,
    outgoing::Error,
    outgoing::Pong,
    outgoing::Ai
>;

/**
 * Decodes one inbound text frame.
 * Throws ProtocolError for malformed JSON, a missing or unknown "type",
 * or a missing/mistyped required field.
 */
Incoming parse_incoming(std::string_view frame, size_t max_depth = 16);

boost::json::object to_json(const Outgoing& message);

std::string serialize(const Outgoing& message);

// Wire tag of an outbound envelope, e.g. "ackName".
const char* kind(const Outgoing& message);

int64_t now_ms();

}
