#include <catch2/catch_test_macros.hpp>
#include "helpers/loopback.hpp"
#include "peerquic/net/udp_socket.hpp"
#include <future>
using namespace peerquic;
using namespace peerquic::transport;
using namespace peerquic::test_helpers;
using namespace std::chrono_literals;

TEST_CASE("Lifecycle - invalid dial targets", "[boundaries][transport]") {
    QuicTransport client(MakeIdentity(), TestConfig());

    for (const char* target : {"127.0.0.1:0", "0.0.0.0:4001", "[::]:4001"}) {
        INFO(target);
        auto dialed = client.Dial(net::SocketAddress::Parse(target).Unwrap());
        REQUIRE(dialed.IsErr());
        REQUIRE(dialed.UnwrapErr().type == TransportFailureType::InvalidAddress);
    }

    auto not_quic = client.Dial(std::string_view("/ip4/127.0.0.1/tcp/4001"));
    REQUIRE(not_quic.IsErr());
    REQUIRE(not_quic.UnwrapErr().type == TransportFailureType::InvalidAddress);

    auto bad_listen = client.Listen(std::string_view("/ip4/127.0.0.1/udp/4001"));
    REQUIRE(bad_listen.IsErr());
    REQUIRE(bad_listen.UnwrapErr().type == TransportFailureType::InvalidAddress);
}

TEST_CASE("Lifecycle - dialing a silent peer", "[boundaries][transport]") {
    // Holds a port that never answers.
    auto silent = net::UdpSocket::Bind(net::SocketAddress::FromIp("127.0.0.1", 0).Unwrap()).Unwrap();
    const auto target = silent.GetLocalAddress();

    SECTION("Cancellation aborts the dial") {
        QuicTransport client(MakeIdentity(), TestConfig());
        const auto started = std::chrono::steady_clock::now();
        auto dialed = client.Dial(target, StopAfter(200ms).Token());
        REQUIRE(dialed.IsErr());
        REQUIRE(dialed.UnwrapErr().type == TransportFailureType::Cancelled);
        REQUIRE(std::chrono::steady_clock::now() - started < 2s);
    }
    SECTION("Handshake timeout fails the dial") {
        QuicTransport client(MakeIdentity(), TestConfig().WithHandshakeTimeout(300ms));
        auto dialed = client.Dial(target, StopAfter(10s).Token());
        REQUIRE(dialed.IsErr());
        REQUIRE(dialed.UnwrapErr().type == TransportFailureType::HandshakeFailed);
    }
}

TEST_CASE("Lifecycle - operations after close", "[boundaries][transport]") {
    QuicTransport server(MakeIdentity(), TestConfig());
    QuicTransport client(MakeIdentity(), TestConfig());
    auto listener = server.Listen(LoopbackMultiaddr()).Unwrap();
    auto connection = client.Dial(listener->GetLocalAddress()).Unwrap();
    auto stream = connection->OpenStream().Unwrap();

    connection->Close();
    REQUIRE(connection->GetStatus() == quic::ConnectionStatus::Closed);

    SECTION("Opening and accepting fail") {
        auto opened = connection->OpenStream();
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransportFailureType::ConnectionClosed);
        auto accepted = connection->AcceptStream();
        REQUIRE(accepted.IsErr());
        REQUIRE(accepted.UnwrapErr().type == TransportFailureType::ConnectionClosed);
    }
    SECTION("Existing streams fail") {
        const std::vector<uint8_t> data{1, 2, 3};
        std::vector<uint8_t> buffer(8);
        REQUIRE(stream->Write(data).UnwrapErr().type == TransportFailureType::ConnectionClosed);
        REQUIRE(stream->Read(buffer).UnwrapErr().type == TransportFailureType::ConnectionClosed);
        REQUIRE(stream->Close().UnwrapErr().type == TransportFailureType::ConnectionClosed);
    }
    SECTION("Close is idempotent") {
        connection->Close();
        connection->Close();
        REQUIRE(connection->GetStatus() == quic::ConnectionStatus::Closed);
    }
}

TEST_CASE("Lifecycle - listener shutdown", "[boundaries][transport]") {
    QuicTransport server(MakeIdentity(), TestConfig());
    auto listener = server.Listen(LoopbackMultiaddr()).Unwrap();

    SECTION("Close wakes a blocked Next") {
        StopAfter timeout(10s);
        auto blocked = std::async(std::launch::async, [&]() { return listener->Next(timeout.Token()); });
        std::this_thread::sleep_for(50ms);
        listener->Close();

        auto next = blocked.get();
        REQUIRE(next.IsErr());
        REQUIRE(next.UnwrapErr().type == TransportFailureType::ListenerClosed);
        REQUIRE(listener->Next().UnwrapErr().type == TransportFailureType::ListenerClosed);
    }
    SECTION("Accepted connections outlive the listener") {
        QuicTransport client(MakeIdentity(), TestConfig());
        auto outbound = client.Dial(listener->GetLocalAddress()).Unwrap();
        StopAfter timeout(5s);
        auto inbound = listener->Next(timeout.Token()).Unwrap();

        listener->Close();
        REQUIRE(inbound->GetStatus() == quic::ConnectionStatus::Established);
        REQUIRE(outbound->OpenStream().IsOk());
    }
    SECTION("Closing the transport closes its listeners") {
        server.Close();
        REQUIRE(listener->Next().UnwrapErr().type == TransportFailureType::ListenerClosed);
    }
}
