#include <catch2/catch_test_macros.hpp>
#include "helpers/loopback.hpp"
#include "peerquic/net/multiaddr.hpp"
#include <algorithm>
#include <future>
using namespace peerquic;
using namespace peerquic::transport;
using namespace peerquic::test_helpers;
using namespace std::chrono_literals;

TEST_CASE("Dial and listen - mutual authentication", "[integration][transport]") {
    const auto server_identity = MakeIdentity();
    const auto client_identity = MakeIdentity();
    QuicTransport server(server_identity, TestConfig());
    QuicTransport client(client_identity, TestConfig());

    auto listener = server.Listen(LoopbackMultiaddr()).Unwrap();
    REQUIRE(listener->GetLocalAddress().GetPort() != 0);

    SECTION("Both sides learn the other's PeerId") {
        auto dialed = client.Dial(listener->GetLocalAddress(), StopAfter(5s).Token());
        REQUIRE(dialed.IsOk());
        const auto outbound = dialed.Unwrap();

        StopAfter timeout(5s);
        auto inbound = listener->Next(timeout.Token()).Unwrap();

        REQUIRE(outbound->RemoteIdentity() == server_identity->GetPeerId());
        REQUIRE(inbound->RemoteIdentity() == client_identity->GetPeerId());
        REQUIRE(outbound->GetStatus() == quic::ConnectionStatus::Established);
        REQUIRE(inbound->GetStatus() == quic::ConnectionStatus::Established);
        REQUIRE(outbound->RemoteAddress() == listener->GetLocalAddress());
        REQUIRE(inbound->RemoteAddress().GetPort() == outbound->LocalAddress().GetPort());
    }

    SECTION("Dial by multiaddr") {
        const std::string address = listener->GetMultiaddr();
        REQUIRE(address.starts_with("/ip4/127.0.0.1/udp/"));
        auto outbound = client.Dial(address).Unwrap();
        REQUIRE(outbound->RemoteIdentity() == server_identity->GetPeerId());
    }

    SECTION("One listener serves several dialers") {
        QuicTransport other(MakeIdentity(), TestConfig());
        auto first = client.Dial(listener->GetLocalAddress()).Unwrap();
        auto second = other.Dial(listener->GetLocalAddress()).Unwrap();

        StopAfter timeout(5s);
        std::vector<PeerId> seen;
        seen.push_back(listener->Next(timeout.Token()).Unwrap()->RemoteIdentity());
        seen.push_back(listener->Next(timeout.Token()).Unwrap()->RemoteIdentity());
        REQUIRE(std::find(seen.begin(), seen.end(), client.GetLocalPeerId()) != seen.end());
        REQUIRE(std::find(seen.begin(), seen.end(), other.GetLocalPeerId()) != seen.end());
    }

    SECTION("Repeated dials open independent connections") {
        auto first = client.Dial(listener->GetLocalAddress()).Unwrap();
        auto second = client.Dial(listener->GetLocalAddress()).Unwrap();
        REQUIRE(first.get() != second.get());
        first->Close();
        REQUIRE(second->GetStatus() == quic::ConnectionStatus::Established);
        REQUIRE(second->OpenStream().IsOk());
    }
}

TEST_CASE("Dial and listen - endpoint reuse", "[integration][transport]") {
    const auto identity = MakeIdentity();
    QuicTransport node(identity, TestConfig());
    QuicTransport peer(MakeIdentity(), TestConfig());

    auto node_listener = node.Listen("/ip4/0.0.0.0/udp/0/quic").Unwrap();
    auto peer_listener = peer.Listen(LoopbackMultiaddr()).Unwrap();

    SECTION("Dialing reuses the listening endpoint's port") {
        auto outbound = node.Dial(peer_listener->GetLocalAddress()).Unwrap();
        REQUIRE(outbound->LocalAddress().GetPort() == node_listener->GetLocalAddress().GetPort());

        StopAfter timeout(5s);
        auto inbound = peer_listener->Next(timeout.Token()).Unwrap();
        REQUIRE(inbound->RemoteAddress().GetPort() == node_listener->GetLocalAddress().GetPort());
    }

    SECTION("Listening twice on the same port shares the endpoint") {
        const auto port = node_listener->GetLocalAddress().GetPort();
        auto again = node.Listen(net::SocketAddress::Unspecified(net::AddressFamily::IPv4, port));
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap()->GetLocalAddress() == node_listener->GetLocalAddress());
    }

    SECTION("Dropping one of two listeners leaves the other accepting") {
        const auto port = node_listener->GetLocalAddress().GetPort();
        auto second = node.Listen(net::SocketAddress::Unspecified(net::AddressFamily::IPv4, port)).Unwrap();
        second.reset();

        auto dialed = peer.Dial(net::SocketAddress::FromIp("127.0.0.1", port).Unwrap(), StopAfter(5s).Token());
        REQUIRE(dialed.IsOk());

        StopAfter timeout(5s);
        auto inbound = node_listener->Next(timeout.Token());
        REQUIRE(inbound.IsOk());
        REQUIRE(inbound.Unwrap()->RemoteIdentity() == peer.GetLocalPeerId());
    }

    SECTION("Closing one listener wakes only its own Next") {
        const auto port = node_listener->GetLocalAddress().GetPort();
        auto second = node.Listen(net::SocketAddress::Unspecified(net::AddressFamily::IPv4, port)).Unwrap();

        StopAfter timeout(5s);
        auto blocked = std::async(std::launch::async, [&]() { return second->Next(timeout.Token()); });
        second->Close();
        auto woken = blocked.get();
        REQUIRE(woken.IsErr());
        REQUIRE(woken.UnwrapErr().type == TransportFailureType::ListenerClosed);

        auto dialed = peer.Dial(net::SocketAddress::FromIp("127.0.0.1", port).Unwrap(), StopAfter(5s).Token());
        REQUIRE(dialed.IsOk());
        REQUIRE(node_listener->Next(timeout.Token()).IsOk());
    }
}

TEST_CASE("Dial and listen - address family mismatch", "[integration][transport]") {
    auto endpoint = quic::Endpoint::Bind(
        net::SocketAddress::FromIp("127.0.0.1", 0).Unwrap(), MakeIdentity(), TestConfig()).Unwrap();

    auto dialed = endpoint->Dial(net::SocketAddress::FromIp("::1", 4001).Unwrap());
    REQUIRE(dialed.IsErr());
    REQUIRE(dialed.UnwrapErr().type == TransportFailureType::AddressFamilyMismatch);
    REQUIRE(endpoint->GetConnectionCount() == 0);
}
