#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "rate_limiter.hpp"
#include "server_config.hpp"

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

namespace chathub {

struct AiResponse {
    std::string content;
    uint64_t response_ms = 0;
    std::optional<uint32_t> tokens;
    std::optional<double> cost;
};

enum class AiErrorKind {
    Disabled,       // feature flag off or no credential
    InvalidPrompt,
    RateLimited,
    Timeout,
    Transport,      // resolve/connect/TLS/read/write failure
    BadStatus,      // non-2xx HTTP status
    BadResponse     // body does not match the completion schema
};

struct AiError {
    AiErrorKind kind;
    std::string message;
};

using AiResult = std::variant<AiResponse, AiError>;

// Target of the completion endpoint split into connection parameters.
struct ApiEndpoint {
    bool use_tls = true;
    std::string host;       // resolvable name, IPv6 literals without brackets
    std::string port;
    std::string authority;  // Host header value as written in the URL
    std::string target;
};

// Accepts http:// and https:// URLs with optional port and path. IPv6 hosts are bracketed.
std::optional<ApiEndpoint> parse_api_url(const std::string& url);

/**
 * Client for an OpenAI-compatible chat-completion API.
 * Every query is an independent asynchronous HTTP exchange bounded by the
 * configured timeout; no shared lock is held while it is in flight.
 */
class AiGateway {
public:
    using Handler = std::function<void(AiResult)>;

    AiGateway(net::any_io_executor executor, ssl::context& ssl_ctx, const AiConfig& config);
    ~AiGateway() = default;

    AiGateway(const AiGateway&) = delete;
    AiGateway& operator=(const AiGateway&) = delete;

    bool is_enabled() const { return config_.is_available(); }
    const std::string& model() const { return config_.model; }

    /**
     * Validates, rate-limits per `user_key` and sends `prompt`. `handler` is always
     * invoked exactly once, on the gateway's executor, never inline.
     */
    void query(const std::string& user_key, const std::string& prompt, Handler handler);

    static std::string build_request_body(const std::string& model, const std::string& prompt, int max_tokens);

    // Maps a response body onto AiResponse, or BadResponse when the shape is wrong.
    static AiResult parse_completion(std::string_view body, uint64_t response_ms);

private:
    net::any_io_executor executor_;
    ssl::context& ssl_ctx_;
    AiConfig config_;
    std::optional<ApiEndpoint> endpoint_;
    RateLimiter limiter_;

    void complete(Handler handler, AiResult result);
};

}
