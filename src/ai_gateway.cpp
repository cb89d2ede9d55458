#include "ai_gateway.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "logger.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = boost::asio::ip::tcp;

namespace chathub {

namespace {

constexpr size_t kMaxResponseBody = 4 * 1024 * 1024;

constexpr const char* kDisabled = "AI is niet geactiveerd op deze server.";
constexpr const char* kUnavailable = "AI service tijdelijk niet beschikbaar.";
constexpr const char* kUnparsable = "Kon AI antwoord niet verwerken.";
constexpr const char* kNoAnswer = "Geen antwoord ontvangen.";

std::optional<double> optional_number(const json::object& obj, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end() || it->value().is_null()) return std::nullopt;
    if (!it->value().is_number()) throw std::invalid_argument(field);
    return it->value().to_number<double>();
}

// One HTTP exchange with the completion endpoint. Every handler runs on the
// request's strand; `deadline_` bounds the whole exchange from resolve to read.
class AiRequest : public std::enable_shared_from_this<AiRequest> {
public:
    using Stream = std::variant<beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;

    AiRequest(net::any_io_executor executor, ssl::context& ssl_ctx, const ApiEndpoint& endpoint,
              const AiConfig& config, std::string body, AiGateway::Handler handler)
        : strand_(net::make_strand(executor))
        , resolver_(strand_)
        , stream_(make_stream(strand_, ssl_ctx, endpoint.use_tls))
        , deadline_(strand_)
        , endpoint_(endpoint)
        , timeout_secs_(config.timeout_secs)
        , handler_(std::move(handler))
    {
        req_.method(http::verb::post);
        req_.target(endpoint_.target);
        req_.version(11);
        req_.set(http::field::host, endpoint_.authority);
        req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req_.set(http::field::authorization, "Bearer " + config.api_key);
        req_.set(http::field::content_type, "application/json");
        req_.body() = std::move(body);
        req_.prepare_payload();

        parser_.body_limit(kMaxResponseBody);
    }

    void run() {
        net::dispatch(strand_, [self = shared_from_this()]() { self->start(); });
    }

private:
    net::strand<net::any_io_executor> strand_;
    tcp::resolver resolver_;
    Stream stream_;
    net::steady_timer deadline_;
    ApiEndpoint endpoint_;
    int timeout_secs_;
    AiGateway::Handler handler_;

    http::request<http::string_body> req_;
    http::response_parser<http::string_body> parser_;
    beast::flat_buffer buffer_;

    std::chrono::steady_clock::time_point started_;
    bool timed_out_ = false;
    bool done_ = false;

    static Stream make_stream(const net::strand<net::any_io_executor>& strand, ssl::context& ctx, bool use_tls) {
        if (use_tls) {
            return Stream(std::in_place_type<beast::ssl_stream<beast::tcp_stream>>, strand, ctx);
        }
        return Stream(std::in_place_type<beast::tcp_stream>, strand);
    }

    beast::tcp_stream& lowest_layer() {
        return std::visit([](auto& s) -> beast::tcp_stream& { return beast::get_lowest_layer(s); }, stream_);
    }

    void start() {
        started_ = std::chrono::steady_clock::now();

        deadline_.expires_after(std::chrono::seconds(timeout_secs_));
        deadline_.async_wait([self = shared_from_this()](beast::error_code ec) {
            self->on_deadline(ec);
        });

        resolver_.async_resolve(
            endpoint_.host, endpoint_.port,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, results);
            });
    }

    void on_deadline(beast::error_code ec) {
        if (ec || done_) return;

        timed_out_ = true;
        resolver_.cancel();
        lowest_layer().cancel();
        beast::error_code ignored;
        lowest_layer().socket().close(ignored);
    }

    void on_resolve(beast::error_code ec, const tcp::resolver::results_type& results) {
        if (ec) return fail(ec, "resolve");

        lowest_layer().async_connect(
            results,
            [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
                self->on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec) {
        if (ec) return fail(ec, "connect");

        if (auto* tls = std::get_if<beast::ssl_stream<beast::tcp_stream>>(&stream_)) {
            // SNI is required by most hosted APIs
            if (!SSL_set_tlsext_host_name(tls->native_handle(), endpoint_.host.c_str())) {
                beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                return fail(sni_ec, "sni");
            }
            tls->set_verify_mode(ssl::verify_peer);
            tls->set_verify_callback(ssl::host_name_verification(endpoint_.host));
            tls->async_handshake(
                ssl::stream_base::client,
                [self = shared_from_this()](beast::error_code ec) {
                    self->on_handshake(ec);
                });
            return;
        }

        do_write();
    }

    void on_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "handshake");
        do_write();
    }

    void do_write() {
        std::visit([this](auto& s) {
            http::async_write(
                s, req_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    self->on_write(ec);
                });
        }, stream_);
    }

    void on_write(beast::error_code ec) {
        if (ec) return fail(ec, "write");

        std::visit([this](auto& s) {
            http::async_read(
                s, buffer_, parser_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    self->on_read(ec);
                });
        }, stream_);
    }

    void on_read(beast::error_code ec) {
        if (ec) return fail(ec, "read");

        auto elapsed = std::chrono::steady_clock::now() - started_;
        auto response_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

        const auto& res = parser_.get();
        beast::error_code ignored;
        lowest_layer().socket().shutdown(tcp::socket::shutdown_both, ignored);

        if (res.result_int() < 200 || res.result_int() >= 300) {
            Logger::log(Logger::Level::ERROR, Logger::EventType::AI_FAILURE, "internal",
                        "Completion API returned " + std::to_string(res.result_int()) + ": " +
                        res.body().substr(0, 512));
            std::string reason(res.reason());
            std::string status = std::to_string(res.result_int());
            if (!reason.empty()) status += " " + reason;
            return finish(AiError{AiErrorKind::BadStatus, "AI service error: " + status});
        }

        finish(AiGateway::parse_completion(res.body(), response_ms));
    }

    void fail(beast::error_code ec, const char* stage) {
        if (done_) return;

        Logger::log(Logger::Level::ERROR, Logger::EventType::AI_FAILURE, "internal",
                    std::string("Completion request failed at ") + stage + ": " + ec.message());

        if (timed_out_) {
            return finish(AiError{AiErrorKind::Timeout,
                                  "AI request timed out after " + std::to_string(timeout_secs_) + " seconds."});
        }
        finish(AiError{AiErrorKind::Transport, kUnavailable});
    }

    void finish(AiResult result) {
        if (done_) return;
        done_ = true;
        deadline_.cancel();

        auto handler = std::move(handler_);
        handler(std::move(result));
    }
};

}

std::optional<ApiEndpoint> parse_api_url(const std::string& url) {
    ApiEndpoint endpoint;
    std::string rest;

    if (url.rfind("https://", 0) == 0) {
        endpoint.use_tls = true;
        endpoint.port = "443";
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        endpoint.use_tls = false;
        endpoint.port = "80";
        rest = url.substr(7);
    } else {
        return std::nullopt;
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    endpoint.target = slash == std::string::npos ? "/" : rest.substr(slash);

    if (authority.empty()) return std::nullopt;
    endpoint.authority = authority;

    std::string port_part;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        endpoint.host = authority.substr(1, close - 1);
        std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return std::nullopt;
            port_part = after.substr(1);
            if (port_part.empty()) return std::nullopt;
        }
    } else {
        auto colon = authority.rfind(':');
        endpoint.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_part = authority.substr(colon + 1);
            if (port_part.empty()) return std::nullopt;
        }
    }

    if (endpoint.host.empty()) return std::nullopt;
    if (!port_part.empty()) endpoint.port = port_part;
    return endpoint;
}

AiGateway::AiGateway(net::any_io_executor executor, ssl::context& ssl_ctx, const AiConfig& config)
    : executor_(std::move(executor))
    , ssl_ctx_(ssl_ctx)
    , config_(config)
    , endpoint_(parse_api_url(config.api_url))
    , limiter_(config.requests_per_minute)
{
    if (config_.enabled && config_.api_key.empty()) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::LIFECYCLE, "internal",
                    "AI_ENABLED=true but OPENROUTER_API_KEY is not set");
    }
    if (!endpoint_) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::LIFECYCLE, "internal",
                    "Invalid AI_API_URL: " + config_.api_url);
    }
    Logger::log(Logger::Level::INFO, Logger::EventType::LIFECYCLE, "internal",
                "AI configuration loaded: enabled=" + std::string(is_enabled() ? "true" : "false") +
                " model=" + config_.model +
                " rate_limit=" + std::to_string(config_.requests_per_minute) +
                " timeout_secs=" + std::to_string(config_.timeout_secs) +
                " max_tokens=" + std::to_string(config_.max_tokens));
}

void AiGateway::complete(Handler handler, AiResult result) {
    net::post(executor_, [handler = std::move(handler), result = std::move(result)]() mutable {
        handler(std::move(result));
    });
}

void AiGateway::query(const std::string& user_key, const std::string& prompt, Handler handler) {
    if (!is_enabled()) {
        return complete(std::move(handler), AiError{AiErrorKind::Disabled, kDisabled});
    }

    std::string clean_prompt;
    try {
        clean_prompt = InputValidator::normalize_prompt(prompt, config_.max_prompt_length);
    } catch (const ValidationError& e) {
        return complete(std::move(handler), AiError{AiErrorKind::InvalidPrompt, e.what()});
    }

    auto limit = limiter_.check(user_key);
    if (!limit.allowed) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::RATE_LIMIT_HIT, user_key,
                    "AI rate limit exceeded");
        return complete(std::move(handler), AiError{
            AiErrorKind::RateLimited,
            "Rate limit bereikt (max " + std::to_string(limiter_.limit()) + "/min). Probeer over " +
                std::to_string(limit.reset_after_sec) + " seconden."});
    }

    if (!endpoint_) {
        return complete(std::move(handler), AiError{AiErrorKind::Transport, kUnavailable});
    }

    Logger::log(Logger::Level::DEBUG, Logger::EventType::AI_REQUEST, user_key,
                "Sending AI request, prompt_len=" + std::to_string(clean_prompt.size()));

    std::make_shared<AiRequest>(
        executor_, ssl_ctx_, *endpoint_, config_,
        build_request_body(config_.model, clean_prompt, config_.max_tokens),
        std::move(handler)
    )->run();
}

std::string AiGateway::build_request_body(const std::string& model, const std::string& prompt, int max_tokens) {
    json::object message;
    message["role"] = "user";
    message["content"] = prompt;

    json::array messages;
    messages.push_back(std::move(message));

    json::object request;
    request["model"] = model;
    request["messages"] = std::move(messages);
    request["max_tokens"] = max_tokens;
    return json::serialize(request);
}

AiResult AiGateway::parse_completion(std::string_view body, uint64_t response_ms) {
    try {
        json::value root = json::parse(body);
        const auto& obj = root.as_object();

        const auto& choices = obj.at("choices").as_array();

        AiResponse response;
        response.response_ms = response_ms;
        if (choices.empty()) {
            response.content = kNoAnswer;
        } else {
            const auto& message = choices.front().as_object().at("message").as_object();
            response.content = std::string(message.at("content").as_string());
        }

        auto usage_it = obj.find("usage");
        if (usage_it != obj.end() && !usage_it->value().is_null()) {
            const auto& usage = usage_it->value().as_object();
            if (auto tokens = optional_number(usage, "total_tokens")) {
                if (*tokens < 0 || *tokens > 4294967295.0) throw std::out_of_range("total_tokens");
                response.tokens = static_cast<uint32_t>(*tokens);
            }
            response.cost = optional_number(usage, "cost");
        }

        Logger::log(Logger::Level::DEBUG, Logger::EventType::AI_REQUEST, "internal",
                    "AI response received, response_len=" + std::to_string(response.content.size()) +
                    " response_ms=" + std::to_string(response_ms));
        return response;
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::AI_FAILURE, "internal",
                    std::string("Failed to parse completion response: ") + e.what());
        return AiError{AiErrorKind::BadResponse, kUnparsable};
    }
}

}
