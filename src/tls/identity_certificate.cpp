#include "peerquic/tls/identity_certificate.hpp"
#include "peerquic/tls/signed_key_codec.hpp"
#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/core/constants.hpp"
#include "peerquic/debug/logger.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/objects.h>

#include <fmt/core.h>

#include <algorithm>
#include <string>
#include <unordered_set>

namespace peerquic::tls {

namespace {

constexpr std::string_view kComponent = "certificate";

using CertResult = Result<CertificateMaterial, CertificateFailure>;

struct BignumDeleter {
    void operator()(BIGNUM* bn) const {
        if (bn) {
            BN_free(bn);
        }
    }
};
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

CertificateFailure EncodingFailure(const std::string_view what) {
    return CertificateFailure::Encoding(fmt::format("{}: {}", what, GetOpenSSLError()));
}

Result<Unit, CertificateFailure> SetRandomSerial(X509* cert) {
    std::vector<uint8_t> serial_bytes =
        crypto::SodiumInterop::GetRandomBytes(CertificateConstants::SERIAL_BYTES);
    BignumPtr serial(BN_bin2bn(serial_bytes.data(), static_cast<int>(serial_bytes.size()), nullptr));
    if (!serial || !BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert))) {
        return Result<Unit, CertificateFailure>::Err(EncodingFailure("Failed to set certificate serial"));
    }
    return Result<Unit, CertificateFailure>::Ok(unit);
}

Result<Unit, CertificateFailure> SetSubject(X509* cert) {
    X509_NAME* name = X509_get_subject_name(cert);
    const std::string_view organization = CertificateConstants::SUBJECT_ORGANIZATION;
    if (X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(organization.data()),
                                   static_cast<int>(organization.size()), -1, 0) != OpenSSLConstants::SUCCESS ||
        X509_set_issuer_name(cert, name) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, CertificateFailure>::Err(EncodingFailure("Failed to set certificate names"));
    }
    return Result<Unit, CertificateFailure>::Ok(unit);
}

Result<Unit, CertificateFailure> AddIdentityExtension(X509* cert, const std::vector<uint8_t>& extension_value) {
    auto oid_result = IdentityCertificate::IdentityExtensionObject();
    if (oid_result.IsErr()) {
        return Result<Unit, CertificateFailure>::Err(std::move(oid_result).UnwrapErr());
    }
    auto oid = std::move(oid_result).Unwrap();

    Asn1OctetStringPtr value(ASN1_OCTET_STRING_new());
    if (!value || ASN1_OCTET_STRING_set(value.get(), extension_value.data(),
                                        static_cast<int>(extension_value.size())) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, CertificateFailure>::Err(EncodingFailure("Failed to wrap identity extension"));
    }

    X509ExtensionPtr extension(X509_EXTENSION_create_by_OBJ(nullptr, oid.get(), 0, value.get()));
    if (!extension || X509_add_ext(cert, extension.get(), -1) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, CertificateFailure>::Err(EncodingFailure("Failed to add identity extension"));
    }
    return Result<Unit, CertificateFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, CertificateFailure> BuildExtensionValue(
    const identity::IdentityKeyPair& identity,
    const std::vector<uint8_t>& subject_public_key_info) {
    std::vector<uint8_t> message(kIdentitySigningPrefix.begin(), kIdentitySigningPrefix.end());
    message.insert(message.end(), subject_public_key_info.begin(), subject_public_key_info.end());

    auto signature_result = identity.Sign(message);
    if (signature_result.IsErr()) {
        return Result<std::vector<uint8_t>, CertificateFailure>::Err(
            CertificateFailure::FromSodiumFailure(signature_result.UnwrapErr()));
    }
    auto encoded_key_result = identity.GetPublicKey().ToProtobuf();
    if (encoded_key_result.IsErr()) {
        return Result<std::vector<uint8_t>, CertificateFailure>::Err(std::move(encoded_key_result).UnwrapErr());
    }
    return SignedKeyCodec::Encode(SignedKey{
        std::move(encoded_key_result).Unwrap(),
        std::move(signature_result).Unwrap()
    });
}

Result<std::vector<uint8_t>, CertificateFailure> SpkiOf(X509* cert) {
    X509_PUBKEY* spki = X509_get_X509_PUBKEY(cert);
    if (!spki) {
        return Result<std::vector<uint8_t>, CertificateFailure>::Err(
            CertificateFailure::Malformed("Certificate has no subject public key"));
    }
    const int length = i2d_X509_PUBKEY(spki, nullptr);
    if (length <= 0) {
        return Result<std::vector<uint8_t>, CertificateFailure>::Err(
            CertificateFailure::Malformed("Certificate subject public key cannot be encoded"));
    }
    std::vector<uint8_t> der(static_cast<size_t>(length));
    unsigned char* out = der.data();
    i2d_X509_PUBKEY(spki, &out);
    return Result<std::vector<uint8_t>, CertificateFailure>::Ok(std::move(der));
}

std::string ObjectText(const ASN1_OBJECT* object) {
    char buffer[128];
    const int length = OBJ_obj2txt(buffer, sizeof(buffer), object, 1);
    if (length <= 0) {
        return {};
    }
    return std::string(buffer, std::min(static_cast<size_t>(length), sizeof(buffer) - 1));
}

}

// ============================================================================
// EphemeralKeyPair
// ============================================================================

Result<EphemeralKeyPair, CertificateFailure> EphemeralKeyPair::Generate() {
    EvpPkeyPtr key(EVP_EC_gen(CertificateConstants::EPHEMERAL_CURVE.data()));
    if (!key) {
        return Result<EphemeralKeyPair, CertificateFailure>::Err(
            EncodingFailure("Failed to generate ephemeral P-256 key"));
    }
    return Result<EphemeralKeyPair, CertificateFailure>::Ok(EphemeralKeyPair(std::move(key)));
}

Result<std::vector<uint8_t>, CertificateFailure> EphemeralKeyPair::SubjectPublicKeyInfo() const {
    const int length = i2d_PUBKEY(key_.get(), nullptr);
    if (length <= 0) {
        return Result<std::vector<uint8_t>, CertificateFailure>::Err(
            EncodingFailure("Failed to size ephemeral SubjectPublicKeyInfo"));
    }
    std::vector<uint8_t> der(static_cast<size_t>(length));
    unsigned char* out = der.data();
    if (i2d_PUBKEY(key_.get(), &out) != length) {
        return Result<std::vector<uint8_t>, CertificateFailure>::Err(
            EncodingFailure("Failed to encode ephemeral SubjectPublicKeyInfo"));
    }
    return Result<std::vector<uint8_t>, CertificateFailure>::Ok(std::move(der));
}

// ============================================================================
// IdentityCertificate
// ============================================================================

Result<Asn1ObjectPtr, CertificateFailure> IdentityCertificate::IdentityExtensionObject() {
    const std::string oid(kIdentityExtensionOid);
    Asn1ObjectPtr object(OBJ_txt2obj(oid.c_str(), 1));
    if (!object) {
        return Result<Asn1ObjectPtr, CertificateFailure>::Err(
            EncodingFailure("Failed to build identity extension OID"));
    }
    return Result<Asn1ObjectPtr, CertificateFailure>::Ok(std::move(object));
}

CertResult IdentityCertificate::Generate(const identity::IdentityKeyPair& identity) {
    auto key_result = EphemeralKeyPair::Generate();
    if (key_result.IsErr()) {
        return CertResult::Err(std::move(key_result).UnwrapErr());
    }
    auto ephemeral_key = std::move(key_result).Unwrap();

    auto spki_result = ephemeral_key.SubjectPublicKeyInfo();
    if (spki_result.IsErr()) {
        return CertResult::Err(std::move(spki_result).UnwrapErr());
    }
    auto extension_result = BuildExtensionValue(identity, spki_result.Unwrap());
    if (extension_result.IsErr()) {
        return CertResult::Err(std::move(extension_result).UnwrapErr());
    }

    X509Ptr cert(X509_new());
    if (!cert) {
        return CertResult::Err(EncodingFailure("Failed to allocate certificate"));
    }
    if (X509_set_version(cert.get(), CertificateConstants::X509_VERSION_V3) != OpenSSLConstants::SUCCESS) {
        return CertResult::Err(EncodingFailure("Failed to set certificate version"));
    }
    if (auto serial = SetRandomSerial(cert.get()); serial.IsErr()) {
        return CertResult::Err(std::move(serial).UnwrapErr());
    }
    // Validity far wider than any plausible clock skew between peers.
    if (ASN1_TIME_set_string_X509(X509_getm_notBefore(cert.get()),
                                  CertificateConstants::NOT_BEFORE.data()) != OpenSSLConstants::SUCCESS ||
        ASN1_TIME_set_string_X509(X509_getm_notAfter(cert.get()),
                                  CertificateConstants::NOT_AFTER.data()) != OpenSSLConstants::SUCCESS) {
        return CertResult::Err(EncodingFailure("Failed to set certificate validity"));
    }
    if (auto subject = SetSubject(cert.get()); subject.IsErr()) {
        return CertResult::Err(std::move(subject).UnwrapErr());
    }
    if (X509_set_pubkey(cert.get(), ephemeral_key.Get()) != OpenSSLConstants::SUCCESS) {
        return CertResult::Err(EncodingFailure("Failed to set certificate public key"));
    }
    if (auto added = AddIdentityExtension(cert.get(), extension_result.Unwrap()); added.IsErr()) {
        return CertResult::Err(std::move(added).UnwrapErr());
    }
    if (X509_sign(cert.get(), ephemeral_key.Get(), EVP_sha256()) <= 0) {
        return CertResult::Err(EncodingFailure("Failed to self-sign certificate"));
    }

    const int length = i2d_X509(cert.get(), nullptr);
    if (length <= 0) {
        return CertResult::Err(EncodingFailure("Failed to size certificate DER"));
    }
    std::vector<uint8_t> der(static_cast<size_t>(length));
    unsigned char* out = der.data();
    if (i2d_X509(cert.get(), &out) != length) {
        return CertResult::Err(EncodingFailure("Failed to encode certificate DER"));
    }

    PEERQUIC_LOG_DEBUG(kComponent, "generated certificate for {} ({} bytes)",
                       identity.GetPeerId().ToBase58(), der.size());
    return CertResult::Ok(CertificateMaterial{std::move(ephemeral_key), std::move(der)});
}

Result<ParsedCertificate, CertificateFailure> IdentityCertificate::Parse(
    const std::span<const uint8_t> certificate_der) {
    using ParseResult = Result<ParsedCertificate, CertificateFailure>;

    const unsigned char* in = certificate_der.data();
    X509Ptr cert(d2i_X509(nullptr, &in, static_cast<long>(certificate_der.size())));
    if (!cert) {
        ERR_clear_error();
        return ParseResult::Err(CertificateFailure::Malformed("Certificate is not valid DER X.509"));
    }
    if (in != certificate_der.data() + certificate_der.size()) {
        return ParseResult::Err(CertificateFailure::Malformed("Certificate DER has trailing bytes"));
    }
    if (X509_get0_pubkey(cert.get()) == nullptr) {
        ERR_clear_error();
        return ParseResult::Err(CertificateFailure::Malformed("Certificate public key algorithm is unsupported"));
    }

    auto spki_result = SpkiOf(cert.get());
    if (spki_result.IsErr()) {
        return ParseResult::Err(std::move(spki_result).UnwrapErr());
    }

    auto oid_result = IdentityExtensionObject();
    if (oid_result.IsErr()) {
        return ParseResult::Err(std::move(oid_result).UnwrapErr());
    }
    const auto identity_oid = std::move(oid_result).Unwrap();

    std::unordered_set<std::string> seen;
    const ASN1_OCTET_STRING* identity_value = nullptr;
    const int extension_count = X509_get_ext_count(cert.get());
    for (int i = 0; i < extension_count; ++i) {
        X509_EXTENSION* extension = X509_get_ext(cert.get(), i);
        const ASN1_OBJECT* object = X509_EXTENSION_get_object(extension);
        std::string oid_text = ObjectText(object);
        if (!seen.insert(oid_text).second) {
            return ParseResult::Err(CertificateFailure::Malformed(
                fmt::format("Certificate repeats extension {}", oid_text)));
        }
        if (OBJ_cmp(object, identity_oid.get()) == 0) {
            identity_value = X509_EXTENSION_get_data(extension);
        } else if (X509_EXTENSION_get_critical(extension)) {
            return ParseResult::Err(CertificateFailure::Malformed(
                fmt::format("Certificate carries unsupported critical extension {}", oid_text)));
        }
    }
    if (identity_value == nullptr) {
        return ParseResult::Err(CertificateFailure::MissingIdentityExtension(
            "Certificate carries no identity extension"));
    }

    auto signed_key_result = SignedKeyCodec::Decode(std::span<const uint8_t>(
        ASN1_STRING_get0_data(identity_value), static_cast<size_t>(ASN1_STRING_length(identity_value))));
    if (signed_key_result.IsErr()) {
        return ParseResult::Err(std::move(signed_key_result).UnwrapErr());
    }
    auto signed_key = std::move(signed_key_result).Unwrap();

    auto identity_key_result = identity::PublicKey::FromProtobuf(signed_key.public_key);
    if (identity_key_result.IsErr()) {
        return ParseResult::Err(std::move(identity_key_result).UnwrapErr());
    }

    return ParseResult::Ok(ParsedCertificate{
        std::move(cert),
        std::move(spki_result).Unwrap(),
        std::move(identity_key_result).Unwrap(),
        std::move(signed_key.signature)
    });
}

}
