#include "handlers/health_handler.hpp"
#include "protocol.hpp"

namespace chathub {

http::response<http::string_body> HealthHandler::json_response(http::status status, unsigned version,
                                                               const json::object& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(body);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    json::object response;
    response["status"] = "healthy";
    response["userCount"] = static_cast<uint64_t>(hub_.connections().connection_count());
    response["uptimeSeconds"] = hub_.stats().uptime_seconds();
    return json_response(http::status::ok, version, response);
}

// Same figures as the `status` envelope, without the wire tag.
http::response<http::string_body> HealthHandler::handle_status(unsigned version) {
    json::object response = to_json(hub_.dispatcher().build_status());
    response.erase("type");
    return json_response(http::status::ok, version, response);
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    std::string body = hub_.stats().collect_prometheus(hub_.connections().connection_count());

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> HealthHandler::handle_not_found(unsigned version) {
    json::object response;
    response["error"] = "Not found";
    return json_response(http::status::not_found, version, response);
}

http::response<http::string_body> HealthHandler::handle_unavailable(unsigned version) {
    json::object response;
    response["error"] = "Server is shutting down";
    return json_response(http::status::service_unavailable, version, response);
}

} // namespace chathub
