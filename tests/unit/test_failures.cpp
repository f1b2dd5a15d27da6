#include <catch2/catch_test_macros.hpp>
#include "peerquic/core/failures.hpp"
using namespace peerquic;

TEST_CASE("TransportFailure - certificate failures map one to one", "[failures][core]") {
    const std::pair<CertificateFailure, TransportFailureType> cases[] = {
        {CertificateFailure::Encoding("e"), TransportFailureType::Encoding},
        {CertificateFailure::Malformed("m"), TransportFailureType::MalformedCertificate},
        {CertificateFailure::MissingIdentityExtension("x"), TransportFailureType::MissingIdentityExtension},
        {CertificateFailure::SelfSignatureInvalid("s"), TransportFailureType::SelfSignatureInvalid},
        {CertificateFailure::IdentityBindingInvalid("i"), TransportFailureType::IdentityBindingInvalid},
        {CertificateFailure::ValidityPeriodInvalid("v"), TransportFailureType::ValidityPeriodInvalid},
    };
    for (const auto& [certificate_failure, expected] : cases) {
        const auto mapped = TransportFailure::FromCertificateFailure(certificate_failure);
        REQUIRE(mapped.type == expected);
        REQUIRE(mapped.message == certificate_failure.message);
    }
}

TEST_CASE("TransportFailure - authentication classification", "[failures][core]") {
    SECTION("Handshake-time certificate failures are authentication failures") {
        REQUIRE(TransportFailure::FromCertificateFailure(
            CertificateFailure::IdentityBindingInvalid("")).IsAuthenticationFailure());
        REQUIRE(TransportFailure::FromCertificateFailure(
            CertificateFailure::MissingIdentityExtension("")).IsAuthenticationFailure());
    }
    SECTION("Usage and I/O failures are not") {
        REQUIRE_FALSE(TransportFailure::ConnectionClosed("").IsAuthenticationFailure());
        REQUIRE_FALSE(TransportFailure::Socket("").IsAuthenticationFailure());
        REQUIRE_FALSE(TransportFailure::FromCertificateFailure(
            CertificateFailure::Encoding("")).IsAuthenticationFailure());
    }
}

TEST_CASE("Failure types have stable names", "[failures][core]") {
    REQUIRE(ToString(CertificateFailureType::Encoding) == "EncodingError");
    REQUIRE(ToString(TransportFailureType::AddressFamilyMismatch) == "AddressFamilyMismatch");
    REQUIRE(ToString(TransportFailureType::StreamLimitExceeded) == "StreamLimitExceeded");
    REQUIRE(ToString(TransportFailureType::InvalidArgument) == "InvalidArgument");
}
