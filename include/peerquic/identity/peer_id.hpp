#pragma once
#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/identity/public_key.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace peerquic::identity {

/**
 * @brief Stable identity of a peer, derived from its identity public key
 *
 * Multihash of the protobuf-encoded public key: the key is inlined with the
 * identity multihash when its encoding is short enough, otherwise it is
 * hashed with SHA-256. Two peers are the same peer iff their PeerIds are
 * byte-equal.
 */
class PeerId {
public:
    [[nodiscard]] static Result<PeerId, CertificateFailure> FromPublicKey(const PublicKey& public_key);

    /**
     * @brief Rebuild a PeerId from its multihash bytes
     *
     * Accepts identity and SHA-256 multihashes with a consistent length byte.
     */
    [[nodiscard]] static Result<PeerId, CertificateFailure> FromBytes(std::span<const uint8_t> multihash);

    [[nodiscard]] static Result<PeerId, CertificateFailure> FromBase58(std::string_view encoded);

    [[nodiscard]] const std::vector<uint8_t>& ToBytes() const noexcept {
        return multihash_;
    }

    [[nodiscard]] std::string ToBase58() const;

    /// Matches a public key against this id by recomputing the multihash
    [[nodiscard]] bool IsDerivedFrom(const PublicKey& public_key) const;

    bool operator==(const PeerId& other) const noexcept {
        return multihash_ == other.multihash_;
    }
    bool operator!=(const PeerId& other) const noexcept {
        return !(*this == other);
    }
    bool operator<(const PeerId& other) const noexcept {
        return multihash_ < other.multihash_;
    }

private:
    explicit PeerId(std::vector<uint8_t> multihash) noexcept
        : multihash_(std::move(multihash)) {}

    std::vector<uint8_t> multihash_;
};

}

template<>
struct std::hash<peerquic::identity::PeerId> {
    size_t operator()(const peerquic::identity::PeerId& peer_id) const noexcept {
        size_t seed = 0;
        for (const uint8_t byte : peer_id.ToBytes()) {
            seed ^= std::hash<uint8_t>{}(byte) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};
