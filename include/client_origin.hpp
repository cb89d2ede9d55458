#pragma once

#include <boost/asio/ip/address.hpp>
#include <boost/beast/http/fields.hpp>
#include <string>

namespace chathub {

// Forwarding headers are only believed from a loopback peer (local reverse proxy)
// or when TRUST_PROXY_HEADERS opts in for every peer.
bool should_trust_proxy_headers(const boost::asio::ip::address& peer, bool trust_configured);

/**
 * Origin address of an upgrading client: the first X-Forwarded-For entry, then
 * X-Real-IP, when headers are trusted; otherwise (or when both are absent) the peer address.
 */
std::string resolve_client_ip(const boost::beast::http::fields& headers,
                              const boost::asio::ip::address& peer,
                              bool trust_configured);

}
