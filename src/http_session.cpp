#include "http_session.hpp"
#include "client_origin.hpp"
#include "logger.hpp"
#include "websocket_session.hpp"

namespace chathub {

HttpSession::HttpSession(beast::tcp_stream&& stream, const ServerConfig& config, ChatHub& hub)
    : stream_(std::move(stream))
    , config_(config)
    , hub_(hub)
    , health_handler_(hub)
{
    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        peer_address_ = ep.address();
        remote_addr_ = peer_address_.to_string();
    } else {
        remote_addr_ = "unknown";
    }
}

void HttpSession::run() {
    net::dispatch(stream_.get_executor(),
                  [self = shared_from_this()]() { self->do_read(); });
}

// Initiates the asynchronous read of an HTTP request
void HttpSession::do_read() {
    req_ = {};

    // Enforce a request timeout to prevent slow-loris connections
    stream_.expires_after(std::chrono::seconds(30));

    parser_.emplace();
    parser_->body_limit(config_.max_message_size);

    http::async_read(
        stream_,
        buffer_,
        *parser_,
        [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_shutdown();
        return;
    }
    if (ec) {
        Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION_REJECTED, remote_addr_,
                    "HTTP read error: " + ec.message());
        return;
    }

    req_ = parser_->release();
    handle_request();
}

void HttpSession::handle_request() {
    if (hub_.is_closing()) {
        Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION_REJECTED, remote_addr_,
                    "Request refused during shutdown: " + std::string(req_.target()));
        send_response(health_handler_.handle_unavailable(req_.version()));
        return;
    }

    if (websocket::is_upgrade(req_)) {
        upgrade_to_websocket();
        return;
    }

    auto target = req_.target();
    auto version = req_.version();

    if (req_.method() != http::verb::get) {
        send_response(health_handler_.handle_not_found(version));
    } else if (target == "/health") {
        send_response(health_handler_.handle_health(version));
    } else if (target == "/status") {
        send_response(health_handler_.handle_status(version));
    } else if (target == "/metrics") {
        send_response(health_handler_.handle_metrics(version));
    } else {
        send_response(health_handler_.handle_not_found(version));
    }
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    res.keep_alive(req_.keep_alive() && !hub_.is_closing());
    bool close = res.need_eof();

    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    http::async_write(
        stream_,
        *sp,
        [self = shared_from_this(), sp, close](beast::error_code ec, std::size_t bytes) {
            self->on_write(close, ec, bytes);
        });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION_CLOSED, remote_addr_,
                    "HTTP write error: " + ec.message());
        return;
    }

    if (close) {
        do_shutdown();
        return;
    }

    do_read();
}

void HttpSession::do_shutdown() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

void HttpSession::upgrade_to_websocket() {
    // Origin is derived once, here, from the upgrade request headers.
    std::string origin = remote_addr_;
    if (remote_addr_ != "unknown") {
        origin = resolve_client_ip(req_, peer_address_, config_.trust_proxy_headers);
    }

    stream_.expires_never();

    auto ws_session = std::make_shared<WebSocketSession>(
        std::move(stream_),
        hub_,
        config_,
        std::move(origin)
    );
    ws_session->accept(std::move(req_));
}

}
