#include "server_config.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace chathub {

namespace {

// Parses an integer environment variable into `out`. Malformed or out-of-range values
// are reported and leave `out` untouched.
template <class T>
void read_int(const char* name, T& out, long long min_value, long long max_value) {
    const char* raw = std::getenv(name);
    if (!raw) return;

    try {
        size_t consumed = 0;
        long long value = std::stoll(raw, &consumed);
        if (consumed != std::string(raw).size() || value < min_value || value > max_value) {
            throw std::out_of_range(name);
        }
        out = static_cast<T>(value);
    } catch (const std::exception&) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::LIFECYCLE, "internal",
                    std::string("Ignoring invalid value for ") + name + ": " + raw);
    }
}

void read_string(const char* name, std::string& out) {
    if (const char* raw = std::getenv(name)) {
        out = raw;
    }
}

void read_flag(const char* name, bool& out) {
    if (const char* raw = std::getenv(name)) {
        out = parse_env_flag(raw);
    }
}

}

bool parse_env_flag(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "true" || lower == "1";
}

void apply_env_overrides(ServerConfig& config) {
    read_int("WS_PORT", config.port, 1, std::numeric_limits<uint16_t>::max());
    read_string("WS_ADDR", config.address);
    read_int("WS_THREADS", config.thread_count, 0, 1024);
    read_flag("TRUST_PROXY_HEADERS", config.trust_proxy_headers);

    read_flag("RATE_LIMIT_ENABLED", config.chat_rate_limit_enabled);
    read_int("RATE_LIMIT_MSG_PER_MIN", config.chat_messages_per_minute, 1, 1000000);

    read_flag("AI_ENABLED", config.ai.enabled);
    read_string("OPENROUTER_API_KEY", config.ai.api_key);
    read_string("AI_MODEL", config.ai.model);
    read_string("AI_API_URL", config.ai.api_url);
    read_int("AI_RATE_LIMIT", config.ai.requests_per_minute, 1, 1000000);
    read_int("AI_TIMEOUT_SECS", config.ai.timeout_secs, 1, 3600);
    read_int("AI_MAX_TOKENS", config.ai.max_tokens, 1, 1000000);

    read_string("LOG_LEVEL", config.log_level);
}

}
