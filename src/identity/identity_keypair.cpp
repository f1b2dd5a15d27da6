#include "peerquic/identity/identity_keypair.hpp"
#include "peerquic/crypto/sodium_interop.hpp"

namespace peerquic::identity {

IdentityKeyPair::IdentityKeyPair(crypto::SecureMemoryHandle secret_key, PublicKey public_key, PeerId peer_id)
    : secret_key_(std::move(secret_key))
    , public_key_(std::move(public_key))
    , peer_id_(std::move(peer_id)) {
}

Result<IdentityKeyPair, SodiumFailure> IdentityKeyPair::Generate() {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<IdentityKeyPair, SodiumFailure>::Err(std::move(init).UnwrapErr());
    }
    return FromKeyMaterial(crypto::SodiumInterop::GenerateEd25519KeyPair());
}

Result<IdentityKeyPair, SodiumFailure> IdentityKeyPair::FromSeed(const std::span<const uint8_t> seed) {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<IdentityKeyPair, SodiumFailure>::Err(std::move(init).UnwrapErr());
    }
    return FromKeyMaterial(crypto::SodiumInterop::Ed25519KeyPairFromSeed(seed));
}

Result<IdentityKeyPair, SodiumFailure> IdentityKeyPair::FromKeyMaterial(
    Result<std::pair<crypto::SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure> material) {
    if (material.IsErr()) {
        return Result<IdentityKeyPair, SodiumFailure>::Err(std::move(material).UnwrapErr());
    }
    auto [secret_key, public_bytes] = std::move(material).Unwrap();

    auto public_key_result = PublicKey::FromEd25519(public_bytes);
    if (public_key_result.IsErr()) {
        return Result<IdentityKeyPair, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(public_key_result.UnwrapErr().message));
    }
    auto public_key = std::move(public_key_result).Unwrap();

    auto peer_id_result = PeerId::FromPublicKey(public_key);
    if (peer_id_result.IsErr()) {
        return Result<IdentityKeyPair, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(peer_id_result.UnwrapErr().message));
    }

    return Result<IdentityKeyPair, SodiumFailure>::Ok(IdentityKeyPair(
        std::move(secret_key), std::move(public_key), std::move(peer_id_result).Unwrap()));
}

Result<std::vector<uint8_t>, SodiumFailure> IdentityKeyPair::Sign(const std::span<const uint8_t> message) const {
    return crypto::SodiumInterop::SignDetached(secret_key_, message);
}

}
