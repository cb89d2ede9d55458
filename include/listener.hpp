#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <memory>

#include "chat_hub.hpp"
#include "server_config.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace chathub {

// Accepts TCP connections and hands each one, on its own strand, to an HttpSession.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    // Throws std::runtime_error if the endpoint cannot be opened, bound or listened on.
    Listener(net::io_context& ioc, tcp::endpoint endpoint, const ServerConfig& config, ChatHub& hub);

    void run();
    void stop();

    // Port actually bound; differs from the configured one when it was 0.
    unsigned short local_port() const;

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    const ServerConfig& config_;
    ChatHub& hub_;

    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
};

}
