#pragma once
#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/crypto/sodium_secure_memory_handle.hpp"
#include "peerquic/identity/public_key.hpp"
#include "peerquic/identity/peer_id.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace peerquic::identity {

/**
 * @brief Long-term Ed25519 identity of the local node
 *
 * The secret key stays in guarded memory and never leaves this object; only
 * signatures do. Shared read-only by every Endpoint of a transport.
 */
class IdentityKeyPair {
public:
    [[nodiscard]] static Result<IdentityKeyPair, SodiumFailure> Generate();

    /**
     * @brief Deterministically rebuild an identity from a persisted 32-byte seed
     */
    [[nodiscard]] static Result<IdentityKeyPair, SodiumFailure> FromSeed(std::span<const uint8_t> seed);

    [[nodiscard]] Result<std::vector<uint8_t>, SodiumFailure> Sign(std::span<const uint8_t> message) const;

    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept {
        return public_key_;
    }

    [[nodiscard]] const PeerId& GetPeerId() const noexcept {
        return peer_id_;
    }

    IdentityKeyPair(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair& operator=(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair(const IdentityKeyPair&) = delete;
    IdentityKeyPair& operator=(const IdentityKeyPair&) = delete;
    ~IdentityKeyPair() = default;

private:
    IdentityKeyPair(crypto::SecureMemoryHandle secret_key, PublicKey public_key, PeerId peer_id);

    static Result<IdentityKeyPair, SodiumFailure> FromKeyMaterial(
        Result<std::pair<crypto::SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure> material);

    crypto::SecureMemoryHandle secret_key_;
    PublicKey public_key_;
    PeerId peer_id_;
};

}
