#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

// Set by the build from the CMake project version.
#ifndef CHATHUB_VERSION
#define CHATHUB_VERSION "0.0.0-dev"
#endif

namespace chathub {

// Settings for the outbound completion API used by the `ai` command.
struct AiConfig {
    bool enabled = false;
    std::string api_key = "";
    std::string model = "openai/gpt-4o";
    std::string api_url = "https://openrouter.ai/api/v1/chat/completions";
    int requests_per_minute = 5;   // per user, sliding 60s window
    int timeout_secs = 30;
    int max_tokens = 1024;
    size_t max_prompt_length = 1000;

    // Feature flag alone is not enough, a credential must be present too.
    bool is_available() const { return enabled && !api_key.empty(); }
};

// Core server configuration. Defaults are overridden from the environment at startup.
struct ServerConfig {
    // --- Network ---
    std::string address = "0.0.0.0";
    uint16_t port = 3001;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // Forwarded-for headers are honoured for loopback peers, or for everyone when set.
    bool trust_proxy_headers = false;

    // --- Connection & Resource Management ---
    size_t max_message_size = 64 * 1024;
    size_t client_queue_capacity = 256;
    int handshake_timeout_sec = 15;
    int idle_timeout_sec = 300;

    // --- Chat Rate Limiting (sliding 60s window per connection) ---
    bool chat_rate_limit_enabled = false;
    int chat_messages_per_minute = 60;

    // --- Protocol Constraints ---
    size_t max_chat_length = 500;
    size_t min_name_length = 2;
    size_t max_name_length = 32;
    size_t max_json_depth = 16;

    // --- Logging ---
    std::string log_level = "warn";

    AiConfig ai;
};

/**
 * Applies WS_PORT, WS_ADDR, WS_THREADS, TRUST_PROXY_HEADERS, RATE_LIMIT_*, AI_*,
 * OPENROUTER_API_KEY and LOG_LEVEL from the process environment.
 * Values that fail to parse are reported and the previous value is kept.
 */
void apply_env_overrides(ServerConfig& config);

// Accepts "true"/"1" in any letter case.
bool parse_env_flag(const std::string& value);

}
