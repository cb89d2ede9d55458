#pragma once

#include "chat_hub.hpp"
#include "outbound_queue.hpp"
#include "server_config.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;

namespace chathub {

// One upgraded chat connection. The receive loop feeds text frames to the hub; the
// send loop drains the client's bounded outbound queue. Both run on the stream's strand.
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(beast::tcp_stream&& stream, ChatHub& hub, const ServerConfig& config,
                     std::string remote_addr);
    ~WebSocketSession() = default;

    WebSocketSession(const WebSocketSession&) = delete;
    WebSocketSession& operator=(const WebSocketSession&) = delete;

    // Completes the WebSocket handshake for an upgrade request already read by HttpSession.
    void accept(http::request<http::string_body>&& req);

private:
    enum class State {
        Connecting,
        Active,
        Closing,
        Closed
    };

    websocket::stream<beast::tcp_stream> ws_;
    ChatHub& hub_;
    const ServerConfig& config_;
    std::string remote_addr_;
    std::string client_id_;

    http::request<http::string_body> upgrade_req_;
    beast::flat_buffer read_buffer_;
    std::shared_ptr<OutboundQueue> outbound_;
    bool is_writing_ = false;

    std::atomic<State> state_{State::Connecting};
    std::atomic<bool> cleaned_up_{false};

    void on_accept(beast::error_code ec);

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    void do_close(websocket::close_code code);
    void cleanup(const std::string& reason);
};

}
