#include <catch2/catch_test_macros.hpp>
#include "peerquic/identity/identity_keypair.hpp"
#include "peerquic/identity/peer_id.hpp"
#include "peerquic/identity/public_key.hpp"
#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/core/constants.hpp"
#include <unordered_set>
using namespace peerquic;
using namespace peerquic::identity;

TEST_CASE("PublicKey - protobuf encoding", "[identity][peer_id]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> raw(kEd25519PublicKeyBytes, 0xAB);
    const auto key = PublicKey::FromEd25519(raw).Unwrap();

    SECTION("Ed25519 key encodes as Type=1, Data=<32 bytes>") {
        const auto encoded = key.ToProtobuf().Unwrap();
        REQUIRE(encoded.size() == 36);
        REQUIRE(encoded[0] == 0x08);
        REQUIRE(encoded[1] == 0x01);
        REQUIRE(encoded[2] == 0x12);
        REQUIRE(encoded[3] == 0x20);
        REQUIRE(PublicKey::FromProtobuf(encoded).Unwrap() == key);
    }
    SECTION("Non-Ed25519 key types are rejected") {
        auto encoded = key.ToProtobuf().Unwrap();
        encoded[1] = 0x02;
        auto parsed = PublicKey::FromProtobuf(encoded);
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == CertificateFailureType::MalformedCertificate);
    }
    SECTION("Truncated encoding is rejected") {
        auto encoded = key.ToProtobuf().Unwrap();
        encoded.resize(10);
        REQUIRE(PublicKey::FromProtobuf(encoded).IsErr());
    }
    SECTION("Wrong key length is rejected") {
        const std::vector<uint8_t> short_key(31, 0xAB);
        REQUIRE(PublicKey::FromEd25519(short_key).IsErr());
    }
}

TEST_CASE("PeerId - derivation from identity keys", "[identity][peer_id]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto keypair = IdentityKeyPair::Generate().Unwrap();
    const PeerId& peer_id = keypair.GetPeerId();

    SECTION("Ed25519 keys use the inline identity multihash") {
        const auto& bytes = peer_id.ToBytes();
        REQUIRE(bytes.size() == 38);
        REQUIRE(bytes[0] == kMultihashIdentityCode);
        REQUIRE(bytes[1] == 36);
        REQUIRE(peer_id.ToBase58().starts_with("12D3KooW"));
    }
    SECTION("Derivation is deterministic") {
        REQUIRE(PeerId::FromPublicKey(keypair.GetPublicKey()).Unwrap() == peer_id);
        REQUIRE(peer_id.IsDerivedFrom(keypair.GetPublicKey()));
    }
    SECTION("Different keys give different ids") {
        const auto other = IdentityKeyPair::Generate().Unwrap();
        REQUIRE(other.GetPeerId() != peer_id);
        REQUIRE_FALSE(peer_id.IsDerivedFrom(other.GetPublicKey()));

        std::unordered_set<PeerId> ids{peer_id, other.GetPeerId(), peer_id};
        REQUIRE(ids.size() == 2);
    }
    SECTION("Base58 and byte forms round-trip") {
        REQUIRE(PeerId::FromBase58(peer_id.ToBase58()).Unwrap() == peer_id);
        REQUIRE(PeerId::FromBytes(peer_id.ToBytes()).Unwrap() == peer_id);
    }
    SECTION("Seeded keypairs reproduce the same id") {
        const std::vector<uint8_t> seed(kEd25519SeedBytes, 0x11);
        const auto first = IdentityKeyPair::FromSeed(seed).Unwrap();
        const auto second = IdentityKeyPair::FromSeed(seed).Unwrap();
        REQUIRE(first.GetPeerId() == second.GetPeerId());
    }
}

TEST_CASE("PeerId - rejects malformed input", "[identity][peer_id]") {
    SECTION("Characters outside the base58 alphabet") {
        REQUIRE(PeerId::FromBase58("12D3KooW0OIl").IsErr());
    }
    SECTION("Empty string") {
        REQUIRE(PeerId::FromBase58("").IsErr());
    }
    SECTION("Unknown multihash code") {
        std::vector<uint8_t> bytes{0x13, 0x02, 0xAA, 0xBB};
        REQUIRE(PeerId::FromBytes(bytes).IsErr());
    }
    SECTION("Declared length does not match") {
        std::vector<uint8_t> bytes{0x12, 0x20, 0xAA};
        REQUIRE(PeerId::FromBytes(bytes).IsErr());
    }
    SECTION("SHA-256 multihash of the right length is accepted") {
        std::vector<uint8_t> bytes{0x12, 0x20};
        bytes.resize(34, 0x5A);
        REQUIRE(PeerId::FromBytes(bytes).IsOk());
    }
}
