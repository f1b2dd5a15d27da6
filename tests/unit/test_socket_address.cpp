#include <catch2/catch_test_macros.hpp>
#include "peerquic/net/socket_address.hpp"
using namespace peerquic;
using namespace peerquic::net;

TEST_CASE("SocketAddress - parsing", "[net][address]") {
    SECTION("IPv4 host:port") {
        const auto address = SocketAddress::Parse("127.0.0.1:4001").Unwrap();
        REQUIRE(address.GetFamily() == AddressFamily::IPv4);
        REQUIRE(address.GetPort() == 4001);
        REQUIRE(address.IpString() == "127.0.0.1");
        REQUIRE(address.ToString() == "127.0.0.1:4001");
        REQUIRE(address.GetLength() == sizeof(sockaddr_in));
    }
    SECTION("Bracketed IPv6") {
        const auto address = SocketAddress::Parse("[::1]:4001").Unwrap();
        REQUIRE(address.GetFamily() == AddressFamily::IPv6);
        REQUIRE(address.GetPort() == 4001);
        REQUIRE(address.ToString() == "[::1]:4001");
        REQUIRE(address.GetLength() == sizeof(sockaddr_in6));
    }
    SECTION("Malformed inputs are InvalidAddress") {
        for (const char* input : {"127.0.0.1", "localhost:80", "127.0.0.1:70000", "::1:80", "[::1]80", ":80", "1.2.3.4:x"}) {
            auto result = SocketAddress::Parse(input);
            INFO(input);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == TransportFailureType::InvalidAddress);
        }
    }
}

TEST_CASE("SocketAddress - value semantics", "[net][address]") {
    const auto a = SocketAddress::FromIp("10.0.0.1", 1000).Unwrap();
    const auto b = SocketAddress::FromIp("10.0.0.1", 1001).Unwrap();

    REQUIRE(a != b);
    REQUIRE(a < b);
    REQUIRE(a.WithPort(1001) == b);

    const auto any4 = SocketAddress::Unspecified(AddressFamily::IPv4);
    REQUIRE(any4.IsUnspecified());
    REQUIRE(any4.GetPort() == 0);
    REQUIRE(SocketAddress::Unspecified(AddressFamily::IPv6, 9).ToString() == "[::]:9");
    REQUIRE_FALSE(a.IsUnspecified());

    const auto copy = SocketAddress::FromSockaddr(a.GetSockaddr(), a.GetLength()).Unwrap();
    REQUIRE(copy == a);
    REQUIRE(std::hash<SocketAddress>{}(copy) == std::hash<SocketAddress>{}(a));
}
