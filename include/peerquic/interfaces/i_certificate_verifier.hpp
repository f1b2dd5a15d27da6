#pragma once
#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/identity/peer_id.hpp"
#include <cstdint>
#include <span>
namespace peerquic::interfaces {
/**
 * @brief Trust decision over the single certificate a peer presented
 *
 * Installed in place of CA-chain validation on both sides of the handshake.
 */
class ICertificateVerifier {
public:
    virtual ~ICertificateVerifier() = default;

    [[nodiscard]] virtual Result<identity::PeerId, CertificateFailure> Verify(
        std::span<const uint8_t> certificate_der) const = 0;
};
}
