#include "websocket_session.hpp"
#include "logger.hpp"

#include <boost/asio/post.hpp>

namespace chathub {

WebSocketSession::WebSocketSession(
    beast::tcp_stream&& stream,
    ChatHub& hub,
    const ServerConfig& config,
    std::string remote_addr
)
    : ws_(std::move(stream))
    , hub_(hub)
    , config_(config)
    , remote_addr_(std::move(remote_addr))
{
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = std::chrono::seconds(config_.handshake_timeout_sec);
    opt.idle_timeout = std::chrono::seconds(config_.idle_timeout_sec);
    opt.keep_alive_pings = true;
    ws_.set_option(opt);

    // Disable underlying socket-level timeout to let WebSocket layer handle it
    beast::get_lowest_layer(ws_).expires_never();

    websocket::permessage_deflate pmd;
    pmd.server_enable = true;
    pmd.client_enable = true;
    ws_.set_option(pmd);

    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, std::string("chathub/") + CHATHUB_VERSION);
    }));

    ws_.read_message_max(config_.max_message_size);

    // Transport pings are answered with a pong by the stream itself.
    ws_.control_callback([this](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::ping && Logger::enabled(Logger::Level::DEBUG)) {
            Logger::log(Logger::Level::DEBUG, Logger::EventType::LIFECYCLE, remote_addr_,
                        "Transport ping from " + client_id_);
        }
    });
}

void WebSocketSession::accept(http::request<http::string_body>&& req) {
    upgrade_req_ = std::move(req);
    ws_.async_accept(
        upgrade_req_,
        [self = shared_from_this()](beast::error_code ec) {
            self->on_accept(ec);
        });
}

void WebSocketSession::on_accept(beast::error_code ec) {
    if (ec) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::CONNECTION_REJECTED, remote_addr_,
                    "WebSocket handshake failed: " + ec.message());
        state_ = State::Closed;
        return;
    }

    // The send loop exists before the client becomes visible to broadcasters.
    outbound_ = std::make_shared<OutboundQueue>(config_.client_queue_capacity);
    outbound_->set_ready_handler([weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
            net::post(self->ws_.get_executor(), [self]() { self->do_write(); });
        }
    });

    try {
        client_id_ = hub_.connect(remote_addr_, outbound_)->id();
    } catch (const std::exception& e) {
        Logger::log(hub_.is_closing() ? Logger::Level::INFO : Logger::Level::ERROR,
                    Logger::EventType::CONNECTION_REJECTED, remote_addr_,
                    std::string("Registration failed: ") + e.what());
        outbound_->close();
        cleaned_up_ = true;
        do_close(websocket::close_code::going_away);
        return;
    }

    state_ = State::Active;
    do_read();
}

void WebSocketSession::do_read() {
    ws_.async_read(
        read_buffer_,
        [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
}

// Close frames, transport errors and EOF all end the session the same way.
void WebSocketSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec == websocket::error::closed) {
        cleanup("closed by peer");
        return;
    }

    if (ec) {
        cleanup("read error: " + ec.message());
        return;
    }

    if (ws_.got_text()) {
        std::string message = beast::buffers_to_string(read_buffer_.data());
        read_buffer_.consume(bytes_transferred);
        hub_.handle_text(client_id_, message);
    } else {
        read_buffer_.consume(bytes_transferred);
    }

    do_read();
}

void WebSocketSession::do_write() {
    if (is_writing_ || !outbound_) {
        return;
    }

    auto payload = outbound_->pop();
    if (!payload) {
        // Queue closed by shutdown: flush is complete, say goodbye.
        if (outbound_->is_closed() && state_ == State::Active) {
            do_close(websocket::close_code::normal);
        }
        return;
    }

    is_writing_ = true;
    ws_.text(true);
    ws_.async_write(
        net::buffer(*payload),
        [self = shared_from_this(), payload](beast::error_code ec, std::size_t bytes) {
            self->on_write(ec, bytes);
        });
}

void WebSocketSession::on_write(beast::error_code ec, std::size_t) {
    is_writing_ = false;

    if (ec) {
        Logger::log(Logger::Level::DEBUG, Logger::EventType::DELIVERY_FAILED, remote_addr_,
                    "WS write error: " + ec.message());
        // The receive loop notices the dead socket and performs cleanup.
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        return;
    }

    do_write();
}

void WebSocketSession::do_close(websocket::close_code code) {
    state_ = State::Closing;
    ws_.async_close(
        code,
        [self = shared_from_this()](beast::error_code ec) {
            if (ec) {
                Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION_CLOSED,
                            self->remote_addr_, "WS close error: " + ec.message());
            }
        });
}

void WebSocketSession::cleanup(const std::string& reason) {
    if (cleaned_up_.exchange(true)) return;

    state_ = State::Closing;
    Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION_CLOSED, remote_addr_,
                "Session " + client_id_ + " ending: " + reason);

    hub_.disconnect(client_id_);
    state_ = State::Closed;
}

}
