#include <gtest/gtest.h>
#include "client_origin.hpp"

#include <boost/beast/http.hpp>

using namespace chathub;
namespace http = boost::beast::http;
using boost::asio::ip::make_address;

TEST(ClientOriginTest, LoopbackPeersAreTrusted) {
    EXPECT_TRUE(should_trust_proxy_headers(make_address("127.0.0.1"), false));
    EXPECT_TRUE(should_trust_proxy_headers(make_address("::1"), false));
    EXPECT_TRUE(should_trust_proxy_headers(make_address("::ffff:127.0.0.1"), false));
    EXPECT_FALSE(should_trust_proxy_headers(make_address("203.0.113.9"), false));
    EXPECT_TRUE(should_trust_proxy_headers(make_address("203.0.113.9"), true));
}

TEST(ClientOriginTest, FirstForwardedForEntryWins) {
    http::fields headers;
    headers.set("X-Forwarded-For", " 198.51.100.7 , 10.0.0.2, 10.0.0.3");
    headers.set("X-Real-IP", "192.0.2.1");

    EXPECT_EQ(resolve_client_ip(headers, make_address("127.0.0.1"), false), "198.51.100.7");
}

TEST(ClientOriginTest, RealIpIsUsedWithoutForwardedFor) {
    http::fields headers;
    headers.set("X-Real-IP", "192.0.2.1");

    EXPECT_EQ(resolve_client_ip(headers, make_address("127.0.0.1"), false), "192.0.2.1");
}

TEST(ClientOriginTest, PeerAddressWhenHeadersAbsent) {
    http::fields headers;
    EXPECT_EQ(resolve_client_ip(headers, make_address("127.0.0.1"), false), "127.0.0.1");
}

TEST(ClientOriginTest, UntrustedPeerCannotSpoofOrigin) {
    http::fields headers;
    headers.set("X-Forwarded-For", "1.2.3.4");

    EXPECT_EQ(resolve_client_ip(headers, make_address("203.0.113.9"), false), "203.0.113.9");
    EXPECT_EQ(resolve_client_ip(headers, make_address("203.0.113.9"), true), "1.2.3.4");
}

TEST(ClientOriginTest, EmptyForwardedForFallsThrough) {
    http::fields headers;
    headers.set("X-Forwarded-For", " , 10.0.0.2");
    headers.set("X-Real-IP", "192.0.2.1");

    EXPECT_EQ(resolve_client_ip(headers, make_address("::1"), false), "192.0.2.1");
}
