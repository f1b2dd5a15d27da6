#include <catch2/catch_test_macros.hpp>
#include "peerquic/tls/certificate_verifier.hpp"
#include "peerquic/crypto/sodium_interop.hpp"
#include "helpers/certificate_forge.hpp"
using namespace peerquic;
using namespace peerquic::tls;
using namespace peerquic::identity;
using namespace peerquic::test_helpers;

namespace {

CertificateFailureType RejectionOf(const std::vector<uint8_t>& der) {
    const IdentityBindingVerifier verifier;
    auto result = verifier.Verify(der);
    REQUIRE(result.IsErr());
    return result.UnwrapErr().type;
}

}

TEST_CASE("Certificate verification - genuine certificates", "[security][certificate]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto identity = IdentityKeyPair::Generate().Unwrap();
    const IdentityBindingVerifier verifier;

    SECTION("Generated certificate yields the signer's PeerId") {
        const auto material = IdentityCertificate::Generate(identity).Unwrap();
        REQUIRE(verifier.Verify(material.certificate_der).Unwrap() == identity.GetPeerId());
    }
    SECTION("Forged but well-formed certificate is accepted") {
        const auto der = ForgeCertificate(identity);
        REQUIRE(verifier.Verify(der).Unwrap() == identity.GetPeerId());
    }
    SECTION("Non-critical unknown extensions are ignored") {
        ForgeOptions options;
        options.add_unknown_extension = true;
        REQUIRE(verifier.Verify(ForgeCertificate(identity, options)).IsOk());
    }
}

TEST_CASE("Certificate verification - identity binding attacks", "[security][certificate]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto identity = IdentityKeyPair::Generate().Unwrap();
    const auto impostor = IdentityKeyPair::Generate().Unwrap();

    SECTION("Flipped bit in the identity signature") {
        ForgeOptions options;
        options.corrupt_identity_signature = true;
        REQUIRE(RejectionOf(ForgeCertificate(identity, options)) ==
                CertificateFailureType::IdentityBindingInvalid);
    }
    SECTION("Claiming another peer's key with our own signature") {
        ForgeOptions options;
        options.embedded_identity = &impostor;
        REQUIRE(RejectionOf(ForgeCertificate(identity, options)) ==
                CertificateFailureType::IdentityBindingInvalid);
    }
    SECTION("Certificate signed by a key other than its own") {
        ForgeOptions options;
        options.sign_with_foreign_key = true;
        REQUIRE(RejectionOf(ForgeCertificate(identity, options)) ==
                CertificateFailureType::SelfSignatureInvalid);
    }
    SECTION("Flipped last byte of the certificate signature") {
        auto der = IdentityCertificate::Generate(identity).Unwrap().certificate_der;
        der.back() ^= 0x01;
        REQUIRE(RejectionOf(der) == CertificateFailureType::SelfSignatureInvalid);
    }
}

TEST_CASE("Certificate verification - structural violations", "[security][certificate]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto identity = IdentityKeyPair::Generate().Unwrap();

    SECTION("Missing identity extension") {
        ForgeOptions options;
        options.include_identity_extension = false;
        REQUIRE(RejectionOf(ForgeCertificate(identity, options)) ==
                CertificateFailureType::MissingIdentityExtension);
    }
    SECTION("Unknown critical extension") {
        ForgeOptions options;
        options.add_unknown_critical_extension = true;
        REQUIRE(RejectionOf(ForgeCertificate(identity, options)) ==
                CertificateFailureType::MalformedCertificate);
    }
    SECTION("Duplicate identity extension") {
        ForgeOptions options;
        options.duplicate_identity_extension = true;
        REQUIRE(RejectionOf(ForgeCertificate(identity, options)) ==
                CertificateFailureType::MalformedCertificate);
    }
    SECTION("Undecodable identity extension") {
        ForgeOptions options;
        options.truncate_extension_value = true;
        REQUIRE(RejectionOf(ForgeCertificate(identity, options)) ==
                CertificateFailureType::MalformedCertificate);
    }
}

TEST_CASE("Certificate verification - validity period", "[security][certificate]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto identity = IdentityKeyPair::Generate().Unwrap();

    SECTION("Expired certificate") {
        ForgeOptions options;
        options.not_before = "19900101000000Z";
        options.not_after = "20000101000000Z";
        REQUIRE(RejectionOf(ForgeCertificate(identity, options)) ==
                CertificateFailureType::ValidityPeriodInvalid);
    }
    SECTION("Not yet valid certificate") {
        ForgeOptions options;
        options.not_before = "30000101000000Z";
        REQUIRE(RejectionOf(ForgeCertificate(identity, options)) ==
                CertificateFailureType::ValidityPeriodInvalid);
    }
    SECTION("Pinned clock before the generated validity window") {
        const auto material = IdentityCertificate::Generate(identity).Unwrap();
        const IdentityBindingVerifier verifier(std::time_t{0});
        auto result = verifier.Verify(material.certificate_der);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CertificateFailureType::ValidityPeriodInvalid);
    }
    SECTION("Validity is checked before signatures") {
        ForgeOptions options;
        options.not_after = "20000101000000Z";
        options.not_before = "19900101000000Z";
        options.corrupt_identity_signature = true;
        options.sign_with_foreign_key = true;
        REQUIRE(RejectionOf(ForgeCertificate(identity, options)) ==
                CertificateFailureType::ValidityPeriodInvalid);
    }
}
