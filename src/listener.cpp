#include "listener.hpp"
#include "http_session.hpp"
#include "logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <stdexcept>

namespace chathub {

Listener::Listener(net::io_context& ioc, tcp::endpoint endpoint, const ServerConfig& config, ChatHub& hub)
    : ioc_(ioc)
    , acceptor_(net::make_strand(ioc))
    , config_(config)
    , hub_(hub)
{
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Failed to bind: " + ec.message());
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
}

void Listener::run() {
    do_accept();
}

void Listener::stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

unsigned short Listener::local_port() const {
    beast::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void Listener::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            self->on_accept(ec, std::move(socket));
        });
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
        return;
    }

    if (ec) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::CONNECTION_REJECTED, "internal",
                    "Accept error: " + ec.message());
    } else {
        std::make_shared<HttpSession>(
            beast::tcp_stream(std::move(socket)),
            config_,
            hub_
        )->run();
    }

    do_accept();
}

}
