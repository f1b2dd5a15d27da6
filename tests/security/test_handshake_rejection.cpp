#include <catch2/catch_test_macros.hpp>
#include "helpers/loopback.hpp"
using namespace peerquic;
using namespace peerquic::transport;
using namespace peerquic::test_helpers;
using namespace std::chrono_literals;

TEST_CASE("Handshake rejection - dialer refuses the listener", "[security][handshake]") {
    const auto server_identity = MakeIdentity();
    QuicTransport server(server_identity, TestConfig());
    auto listener = server.Listen(LoopbackMultiaddr()).Unwrap();

    auto verifier = std::make_shared<DenyListVerifier>(std::vector<PeerId>{server_identity->GetPeerId()});
    QuicTransport client(MakeIdentity(), TestConfig(), verifier);

    auto dialed = client.Dial(listener->GetLocalAddress(), StopAfter(5s).Token());
    REQUIRE(dialed.IsErr());
    REQUIRE(dialed.UnwrapErr().IsAuthenticationFailure());
    REQUIRE(dialed.UnwrapErr().type == TransportFailureType::IdentityBindingInvalid);

    SECTION("The refused peer never shows up as an inbound connection") {
        StopAfter timeout(500ms);
        auto next = listener->Next(timeout.Token());
        REQUIRE(next.IsErr());
        REQUIRE(next.UnwrapErr().type == TransportFailureType::Cancelled);
    }
    SECTION("A well-behaved dialer still connects") {
        QuicTransport honest(MakeIdentity(), TestConfig());
        auto connection = honest.Dial(listener->GetLocalAddress(), StopAfter(5s).Token());
        REQUIRE(connection.IsOk());
        REQUIRE(connection.Unwrap()->RemoteIdentity() == server_identity->GetPeerId());
    }
}

TEST_CASE("Handshake rejection - listener refuses a dialer", "[security][handshake]") {
    const auto denied_identity = MakeIdentity();
    auto verifier = std::make_shared<DenyListVerifier>(std::vector<PeerId>{denied_identity->GetPeerId()});
    QuicTransport server(MakeIdentity(), TestConfig(), verifier);
    auto listener = server.Listen(LoopbackMultiaddr()).Unwrap();

    QuicTransport honest(MakeIdentity(), TestConfig());
    auto established = honest.Dial(listener->GetLocalAddress()).Unwrap();
    StopAfter first_timeout(5s);
    auto accepted = listener->Next(first_timeout.Token()).Unwrap();
    REQUIRE(accepted->RemoteIdentity() == honest.GetLocalPeerId());

    QuicTransport denied(denied_identity, TestConfig());
    // The dialer may finish its side before the listener checks its
    // certificate, so only the listener's view is asserted.
    (void)denied.Dial(listener->GetLocalAddress(), StopAfter(2s).Token());

    StopAfter timeout(1s);
    auto next = listener->Next(timeout.Token());
    REQUIRE(next.IsErr());
    REQUIRE(next.UnwrapErr().type == TransportFailureType::Cancelled);

    SECTION("Existing connections are untouched") {
        REQUIRE(accepted->GetStatus() == quic::ConnectionStatus::Established);
        REQUIRE(established->GetStatus() == quic::ConnectionStatus::Established);
        auto stream = established->OpenStream().Unwrap();
        const std::vector<uint8_t> message{'o', 'k'};
        REQUIRE(stream->Write(message).IsOk());
        REQUIRE(stream->Close().IsOk());

        StopAfter stream_timeout(5s);
        auto inbound = accepted->AcceptStream(stream_timeout.Token()).Unwrap();
        std::vector<uint8_t> buffer(8);
        REQUIRE(inbound->Read(buffer, stream_timeout.Token()).Unwrap() == 2);
    }
}
