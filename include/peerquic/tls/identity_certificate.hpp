#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/identity/identity_keypair.hpp"
#include "peerquic/identity/public_key.hpp"
#include "peerquic/tls/openssl_handles.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace peerquic::tls {

/**
 * @brief ECDSA P-256 keypair that signs the handshake certificate
 *
 * Lives as long as its owner (an Endpoint, or a single connection under
 * EphemeralKeyPolicy::PerConnection) and is never reused elsewhere.
 */
class EphemeralKeyPair {
public:
    [[nodiscard]] static Result<EphemeralKeyPair, CertificateFailure> Generate();

    [[nodiscard]] EVP_PKEY* Get() const noexcept {
        return key_.get();
    }

    /// DER SubjectPublicKeyInfo, the bytes the identity signature covers
    [[nodiscard]] Result<std::vector<uint8_t>, CertificateFailure> SubjectPublicKeyInfo() const;

private:
    explicit EphemeralKeyPair(EvpPkeyPtr key) noexcept
        : key_(std::move(key)) {}

    EvpPkeyPtr key_;
};

struct CertificateMaterial {
    EphemeralKeyPair ephemeral_key;
    std::vector<uint8_t> certificate_der;
};

/**
 * @brief Structure of a presented certificate, before any signature check
 */
struct ParsedCertificate {
    X509Ptr certificate;
    std::vector<uint8_t> subject_public_key_info;
    identity::PublicKey identity_key;
    std::vector<uint8_t> identity_signature;
};

class IdentityCertificate {
public:
    /**
     * @brief Build a self-signed certificate bound to the given identity
     *
     * Generates a fresh ephemeral keypair, signs
     * "libp2p-tls-handshake:" || SPKI(ephemeral) with the identity key, embeds
     * {identity public key, signature} as the identity extension and
     * self-signs the certificate with the ephemeral key.
     *
     * @return The ephemeral keypair and the DER certificate, or Encoding
     */
    [[nodiscard]] static Result<CertificateMaterial, CertificateFailure> Generate(
        const identity::IdentityKeyPair& identity);

    /**
     * @brief Decode a DER certificate and its identity extension
     *
     * No signature is checked here.
     *
     * @return MalformedCertificate for structural violations (bad DER,
     *         trailing bytes, duplicate extensions, unknown critical
     *         extensions, undecodable extension value or identity key),
     *         MissingIdentityExtension when the identity extension is absent
     */
    [[nodiscard]] static Result<ParsedCertificate, CertificateFailure> Parse(
        std::span<const uint8_t> certificate_der);

    /// OID of the identity extension as an OpenSSL object
    [[nodiscard]] static Result<Asn1ObjectPtr, CertificateFailure> IdentityExtensionObject();

private:
    IdentityCertificate() = delete;
};

}
