#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace peerquic::tls {

/**
 * @brief Value of the identity extension
 *
 * ```
 * SignedKey ::= SEQUENCE {
 *     publicKey OCTET STRING,   -- protobuf-encoded identity public key
 *     signature OCTET STRING    -- identity signature over prefix || SPKI
 * }
 * ```
 */
struct SignedKey {
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> signature;
};

class SignedKeyCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CertificateFailure> Encode(const SignedKey& signed_key);

    /**
     * @brief Decode the DER of a SignedKey
     *
     * Rejects anything but exactly one SEQUENCE of two OCTET STRINGs,
     * trailing bytes included.
     */
    [[nodiscard]] static Result<SignedKey, CertificateFailure> Decode(std::span<const uint8_t> der);

private:
    SignedKeyCodec() = delete;
};

}
