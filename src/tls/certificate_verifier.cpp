#include "peerquic/tls/certificate_verifier.hpp"
#include "peerquic/core/constants.hpp"
#include "peerquic/debug/logger.hpp"

#include <openssl/err.h>

namespace peerquic::tls {

namespace {

constexpr std::string_view kComponent = "verifier";

using VerifyResult = Result<identity::PeerId, CertificateFailure>;

Result<Unit, CertificateFailure> CheckValidity(X509* cert, std::time_t* at) {
    // X509_cmp_time: -1 earlier than `at`, 1 later, 0 on error
    const int not_before = X509_cmp_time(X509_get0_notBefore(cert), at);
    const int not_after = X509_cmp_time(X509_get0_notAfter(cert), at);
    if (not_before == 0 || not_after == 0) {
        return Result<Unit, CertificateFailure>::Err(CertificateFailure::ValidityPeriodInvalid(
            "Certificate validity period cannot be decoded"));
    }
    if (not_before > 0) {
        return Result<Unit, CertificateFailure>::Err(
            CertificateFailure::ValidityPeriodInvalid("Certificate is not yet valid"));
    }
    if (not_after < 0) {
        return Result<Unit, CertificateFailure>::Err(
            CertificateFailure::ValidityPeriodInvalid("Certificate has expired"));
    }
    return Result<Unit, CertificateFailure>::Ok(unit);
}

}

VerifyResult IdentityBindingVerifier::Verify(const std::span<const uint8_t> certificate_der) const {
    auto parsed_result = IdentityCertificate::Parse(certificate_der);
    if (parsed_result.IsErr()) {
        PEERQUIC_LOG_DEBUG(kComponent, "rejecting certificate: {}", parsed_result.UnwrapErr().message);
        return VerifyResult::Err(std::move(parsed_result).UnwrapErr());
    }
    return VerifyParsed(parsed_result.Unwrap());
}

VerifyResult IdentityBindingVerifier::VerifyParsed(const ParsedCertificate& parsed) const {
    X509* cert = parsed.certificate.get();

    std::time_t now = fixed_time_.value_or(std::time(nullptr));
    if (auto validity = CheckValidity(cert, &now); validity.IsErr()) {
        PEERQUIC_LOG_DEBUG(kComponent, "rejecting certificate: {}", validity.UnwrapErr().message);
        return VerifyResult::Err(std::move(validity).UnwrapErr());
    }

    if (X509_verify(cert, X509_get0_pubkey(cert)) != OpenSSLConstants::SUCCESS) {
        ERR_clear_error();
        PEERQUIC_LOG_DEBUG(kComponent, "rejecting certificate: bad self-signature");
        return VerifyResult::Err(CertificateFailure::SelfSignatureInvalid(
            "Certificate self-signature does not verify against its own key"));
    }

    std::vector<uint8_t> message(kIdentitySigningPrefix.begin(), kIdentitySigningPrefix.end());
    message.insert(message.end(), parsed.subject_public_key_info.begin(), parsed.subject_public_key_info.end());
    if (!parsed.identity_key.Verify(message, parsed.identity_signature)) {
        PEERQUIC_LOG_DEBUG(kComponent, "rejecting certificate: identity binding does not verify");
        return VerifyResult::Err(CertificateFailure::IdentityBindingInvalid(
            "Identity signature over the certificate key does not verify"));
    }

    auto peer_id = identity::PeerId::FromPublicKey(parsed.identity_key);
    if (peer_id.IsOk()) {
        PEERQUIC_LOG_TRACE(kComponent, "verified peer {}", peer_id.Unwrap().ToBase58());
    }
    return peer_id;
}

}
