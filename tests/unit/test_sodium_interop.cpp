#include <catch2/catch_test_macros.hpp>
#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/crypto/sodium_secure_memory_handle.hpp"
#include "peerquic/core/constants.hpp"
#include <algorithm>
#include <string_view>
using namespace peerquic;
using namespace peerquic::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Ed25519", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto [secret_key, public_key] = SodiumInterop::GenerateEd25519KeyPair().Unwrap();
    REQUIRE(public_key.size() == kEd25519PublicKeyBytes);
    REQUIRE(secret_key.Size() == kEd25519SecretKeyBytes);

    const std::string_view text = "libp2p-tls-handshake:payload";
    const std::span<const uint8_t> message(reinterpret_cast<const uint8_t*>(text.data()), text.size());

    SECTION("Signature verifies under the matching public key") {
        auto signature = SodiumInterop::SignDetached(secret_key, message).Unwrap();
        REQUIRE(signature.size() == kEd25519SignatureBytes);
        REQUIRE(SodiumInterop::VerifyDetached(public_key, message, signature));
    }
    SECTION("Tampered message does not verify") {
        auto signature = SodiumInterop::SignDetached(secret_key, message).Unwrap();
        std::vector<uint8_t> tampered(message.begin(), message.end());
        tampered.back() ^= 0x01;
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(public_key, tampered, signature));
    }
    SECTION("Wrong-length key or signature is rejected") {
        auto signature = SodiumInterop::SignDetached(secret_key, message).Unwrap();
        std::vector<uint8_t> short_key(public_key.begin(), public_key.end() - 1);
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(short_key, message, signature));
        signature.pop_back();
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(public_key, message, signature));
    }
    SECTION("Seed derivation is deterministic") {
        const std::vector<uint8_t> seed(kEd25519SeedBytes, 0x07);
        auto first = SodiumInterop::Ed25519KeyPairFromSeed(seed).Unwrap();
        auto second = SodiumInterop::Ed25519KeyPairFromSeed(seed).Unwrap();
        REQUIRE(first.second == second.second);
    }
    SECTION("Seed of the wrong length fails") {
        const std::vector<uint8_t> seed(kEd25519SeedBytes - 1, 0x07);
        REQUIRE(SodiumInterop::Ed25519KeyPairFromSeed(seed).IsErr());
    }
}

TEST_CASE("SodiumInterop - Hashing and randomness", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("SHA-256 of the empty string") {
        const auto digest = SodiumInterop::Sha256({});
        REQUIRE(digest.size() == kSha256DigestBytes);
        REQUIRE(digest[0] == 0xe3);
        REQUIRE(digest[1] == 0xb0);
        REQUIRE(digest[31] == 0x55);
    }
    SECTION("Random buffers differ") {
        REQUIRE(SodiumInterop::GetRandomBytes(32) != SodiumInterop::GetRandomBytes(32));
    }
    SECTION("SecureWipe zeroes the buffer") {
        std::vector<uint8_t> buffer(100, 0xFF);
        SodiumInterop::SecureWipe(buffer);
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
}
