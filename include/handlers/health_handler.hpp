#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "chat_hub.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace chathub {

// Plain HTTP endpoints served next to the WebSocket upgrade: liveness, status and metrics.
class HealthHandler {
public:
    explicit HealthHandler(ChatHub& hub) : hub_(hub) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_status(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);
    http::response<http::string_body> handle_not_found(unsigned version);

    // Answered to every request, upgrades included, once shutdown has begun.
    http::response<http::string_body> handle_unavailable(unsigned version);

private:
    ChatHub& hub_;

    http::response<http::string_body> json_response(http::status status, unsigned version,
                                                    const json::object& body);

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set(http::field::cache_control, "no-store");
    }
};

} // namespace chathub
