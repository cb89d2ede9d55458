#include "client_origin.hpp"
#include "input_validator.hpp"

namespace http = boost::beast::http;

namespace chathub {

bool should_trust_proxy_headers(const boost::asio::ip::address& peer, bool trust_configured) {
    if (trust_configured) return true;
    if (peer.is_loopback()) return true;

    // ::ffff:127.0.0.1 on dual-stack sockets
    if (peer.is_v6() && peer.to_v6().is_v4_mapped()) {
        return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, peer.to_v6()).is_loopback();
    }
    return false;
}

std::string resolve_client_ip(const http::fields& headers, const boost::asio::ip::address& peer,
                              bool trust_configured) {
    if (should_trust_proxy_headers(peer, trust_configured)) {
        auto forwarded = headers.find("X-Forwarded-For");
        if (forwarded != headers.end()) {
            std::string value(forwarded->value());
            std::string first = InputValidator::trim(value.substr(0, value.find(',')));
            if (!first.empty()) return first;
        }

        auto real_ip = headers.find("X-Real-IP");
        if (real_ip != headers.end()) {
            std::string value = InputValidator::trim(std::string(real_ip->value()));
            if (!value.empty()) return value;
        }
    }
    return peer.to_string();
}

}
