#include "peerquic/tls/signed_key_codec.hpp"
#include "peerquic/tls/openssl_handles.hpp"
#include "peerquic/core/constants.hpp"

#include <openssl/asn1t.h>
#include <openssl/err.h>

#include <fmt/core.h>

extern "C" {

typedef struct peerquic_signed_key_st {
    ASN1_OCTET_STRING* public_key;
    ASN1_OCTET_STRING* signature;
} PEERQUIC_SIGNED_KEY;

DECLARE_ASN1_FUNCTIONS(PEERQUIC_SIGNED_KEY)

ASN1_SEQUENCE(PEERQUIC_SIGNED_KEY) = {
    ASN1_SIMPLE(PEERQUIC_SIGNED_KEY, public_key, ASN1_OCTET_STRING),
    ASN1_SIMPLE(PEERQUIC_SIGNED_KEY, signature, ASN1_OCTET_STRING)
} ASN1_SEQUENCE_END(PEERQUIC_SIGNED_KEY)

IMPLEMENT_ASN1_FUNCTIONS(PEERQUIC_SIGNED_KEY)

}

namespace peerquic::tls {

namespace {

struct SignedKeyDeleter {
    void operator()(PEERQUIC_SIGNED_KEY* value) const {
        if (value) {
            PEERQUIC_SIGNED_KEY_free(value);
        }
    }
};
using SignedKeyPtr = std::unique_ptr<PEERQUIC_SIGNED_KEY, SignedKeyDeleter>;

std::vector<uint8_t> ToBytes(const ASN1_OCTET_STRING* value) {
    const unsigned char* data = ASN1_STRING_get0_data(value);
    const int length = ASN1_STRING_length(value);
    return std::vector<uint8_t>(data, data + length);
}

}

Result<std::vector<uint8_t>, CertificateFailure> SignedKeyCodec::Encode(const SignedKey& signed_key) {
    SignedKeyPtr value(PEERQUIC_SIGNED_KEY_new());
    if (!value) {
        return Result<std::vector<uint8_t>, CertificateFailure>::Err(
            CertificateFailure::Encoding(fmt::format("Failed to allocate SignedKey: {}", GetOpenSSLError())));
    }
    if (ASN1_OCTET_STRING_set(value->public_key, signed_key.public_key.data(),
                              static_cast<int>(signed_key.public_key.size())) != OpenSSLConstants::SUCCESS ||
        ASN1_OCTET_STRING_set(value->signature, signed_key.signature.data(),
                              static_cast<int>(signed_key.signature.size())) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, CertificateFailure>::Err(
            CertificateFailure::Encoding(fmt::format("Failed to fill SignedKey: {}", GetOpenSSLError())));
    }

    const int length = i2d_PEERQUIC_SIGNED_KEY(value.get(), nullptr);
    if (length <= 0) {
        return Result<std::vector<uint8_t>, CertificateFailure>::Err(
            CertificateFailure::Encoding(fmt::format("Failed to size SignedKey DER: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> der(static_cast<size_t>(length));
    unsigned char* out = der.data();
    if (i2d_PEERQUIC_SIGNED_KEY(value.get(), &out) != length) {
        return Result<std::vector<uint8_t>, CertificateFailure>::Err(
            CertificateFailure::Encoding(fmt::format("Failed to encode SignedKey DER: {}", GetOpenSSLError())));
    }
    return Result<std::vector<uint8_t>, CertificateFailure>::Ok(std::move(der));
}

Result<SignedKey, CertificateFailure> SignedKeyCodec::Decode(const std::span<const uint8_t> der) {
    const unsigned char* in = der.data();
    SignedKeyPtr value(d2i_PEERQUIC_SIGNED_KEY(nullptr, &in, static_cast<long>(der.size())));
    if (!value) {
        ERR_clear_error();
        return Result<SignedKey, CertificateFailure>::Err(
            CertificateFailure::Malformed("Identity extension is not a DER SignedKey"));
    }
    if (in != der.data() + der.size()) {
        return Result<SignedKey, CertificateFailure>::Err(
            CertificateFailure::Malformed(fmt::format(
                "Identity extension has {} trailing bytes", der.data() + der.size() - in)));
    }
    return Result<SignedKey, CertificateFailure>::Ok(SignedKey{
        ToBytes(value->public_key),
        ToBytes(value->signature)
    });
}

}
