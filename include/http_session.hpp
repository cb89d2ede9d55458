#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>

#include "chat_hub.hpp"
#include "server_config.hpp"
#include "handlers/health_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace chathub {

// Reads HTTP requests on a fresh connection. A WebSocket upgrade hands the stream to a
// WebSocketSession; anything else is answered by the health endpoints.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(beast::tcp_stream&& stream, const ServerConfig& config, ChatHub& hub);
    ~HttpSession() = default;

    void run();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;
    ChatHub& hub_;
    HealthHandler health_handler_;

    net::ip::address peer_address_;
    std::string remote_addr_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_shutdown();

    void upgrade_to_websocket();
};

}
