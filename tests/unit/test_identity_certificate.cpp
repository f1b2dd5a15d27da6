#include <catch2/catch_test_macros.hpp>
#include "peerquic/tls/identity_certificate.hpp"
#include "peerquic/tls/signed_key_codec.hpp"
#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/core/constants.hpp"
using namespace peerquic;
using namespace peerquic::tls;
using namespace peerquic::identity;

TEST_CASE("IdentityCertificate - Generate", "[tls][certificate]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto identity = IdentityKeyPair::Generate().Unwrap();
    auto material = IdentityCertificate::Generate(identity).Unwrap();

    SECTION("Certificate key is the ephemeral key") {
        const auto parsed = IdentityCertificate::Parse(material.certificate_der).Unwrap();
        REQUIRE(parsed.subject_public_key_info == material.ephemeral_key.SubjectPublicKeyInfo().Unwrap());
    }
    SECTION("Embedded identity is the signer") {
        const auto parsed = IdentityCertificate::Parse(material.certificate_der).Unwrap();
        REQUIRE(parsed.identity_key == identity.GetPublicKey());
        REQUIRE(parsed.identity_signature.size() == kEd25519SignatureBytes);
    }
    SECTION("Identity signature covers prefix and SPKI") {
        const auto parsed = IdentityCertificate::Parse(material.certificate_der).Unwrap();
        std::vector<uint8_t> message(kIdentitySigningPrefix.begin(), kIdentitySigningPrefix.end());
        message.insert(message.end(), parsed.subject_public_key_info.begin(),
                       parsed.subject_public_key_info.end());
        REQUIRE(identity.GetPublicKey().Verify(message, parsed.identity_signature));
        REQUIRE_FALSE(identity.GetPublicKey().Verify(parsed.subject_public_key_info, parsed.identity_signature));
    }
    SECTION("Each call uses a fresh ephemeral key") {
        const auto other = IdentityCertificate::Generate(identity).Unwrap();
        REQUIRE(other.ephemeral_key.SubjectPublicKeyInfo().Unwrap() !=
                material.ephemeral_key.SubjectPublicKeyInfo().Unwrap());
    }
}

TEST_CASE("IdentityCertificate - Parse rejects non-certificates", "[tls][certificate]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto identity = IdentityKeyPair::Generate().Unwrap();
    const auto material = IdentityCertificate::Generate(identity).Unwrap();

    SECTION("Garbage bytes") {
        const std::vector<uint8_t> garbage{0xDE, 0xAD, 0xBE, 0xEF};
        auto result = IdentityCertificate::Parse(garbage);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CertificateFailureType::MalformedCertificate);
    }
    SECTION("Trailing bytes after the certificate") {
        auto der = material.certificate_der;
        der.push_back(0x00);
        auto result = IdentityCertificate::Parse(der);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CertificateFailureType::MalformedCertificate);
    }
    SECTION("Truncated certificate") {
        auto der = material.certificate_der;
        der.resize(der.size() - 10);
        REQUIRE(IdentityCertificate::Parse(der).IsErr());
    }
}
