#pragma once

#include "peerquic/interfaces/i_certificate_verifier.hpp"
#include "peerquic/tls/identity_certificate.hpp"

#include <ctime>
#include <optional>

namespace peerquic::tls {

/**
 * @brief Trusts a certificate solely through its identity binding
 *
 * In order: parse, validity period, self-signature against the
 * certificate's own key, identity signature over
 * "libp2p-tls-handshake:" || SPKI against the embedded identity key.
 * The first failing step decides the error. There is no CA fallback.
 */
class IdentityBindingVerifier final : public interfaces::ICertificateVerifier {
public:
    IdentityBindingVerifier() = default;

    /// Pin the clock used for the validity check
    explicit IdentityBindingVerifier(std::time_t fixed_time) noexcept
        : fixed_time_(fixed_time) {}

    [[nodiscard]] Result<identity::PeerId, CertificateFailure> Verify(
        std::span<const uint8_t> certificate_der) const override;

    [[nodiscard]] Result<identity::PeerId, CertificateFailure> VerifyParsed(
        const ParsedCertificate& parsed) const;

private:
    std::optional<std::time_t> fixed_time_;
};

}
