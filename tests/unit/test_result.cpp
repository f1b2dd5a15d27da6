#include <catch2/catch_test_macros.hpp>
#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include <memory>
#include <string>
using namespace peerquic;

TEST_CASE("Result - Success and failure sides", "[result][core]") {
    SECTION("Ok holds the value") {
        auto result = Result<int, std::string>::Ok(7);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 7);
    }
    SECTION("Err holds the failure") {
        auto result = Result<int, TransportFailure>::Err(TransportFailure::Cancelled("stopped"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransportFailureType::Cancelled);
        REQUIRE(result.UnwrapErr().message == "stopped");
    }
    SECTION("Unit result") {
        REQUIRE(Result<Unit, TransportFailure>::Ok(unit).IsOk());
    }
}

TEST_CASE("Result - Unwrapping the wrong side", "[result][core]") {
    const auto failed = Result<int, std::string>::Err("no value");
    REQUIRE_THROWS_AS(failed.Unwrap(), BadResultAccess);

    const auto succeeded = Result<int, std::string>::Ok(1);
    REQUIRE_THROWS_AS(succeeded.UnwrapErr(), BadResultAccess);
}

TEST_CASE("Result - Move-only payloads", "[result][core]") {
    auto result = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(5));
    std::unique_ptr<int> owned = std::move(result).Unwrap();
    REQUIRE(owned != nullptr);
    REQUIRE(*owned == 5);
}

TEST_CASE("Result - MapErr at the transport boundary", "[result][core]") {
    SECTION("Certificate failure becomes the matching transport failure") {
        auto mapped = Result<int, CertificateFailure>::Err(CertificateFailure::ValidityPeriodInvalid("expired"))
            .MapErr(&TransportFailure::FromCertificateFailure);
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().type == TransportFailureType::ValidityPeriodInvalid);
    }
    SECTION("Success passes through untouched") {
        auto mapped = Result<int, CertificateFailure>::Ok(3)
            .MapErr(&TransportFailure::FromCertificateFailure);
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 3);
    }
}
