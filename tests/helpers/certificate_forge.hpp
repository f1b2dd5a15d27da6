#pragma once
#include "peerquic/core/constants.hpp"
#include "peerquic/identity/identity_keypair.hpp"
#include "peerquic/tls/identity_certificate.hpp"
#include "peerquic/tls/openssl_handles.hpp"
#include "peerquic/tls/signed_key_codec.hpp"
#include <openssl/objects.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace peerquic::test_helpers {

using identity::IdentityKeyPair;
using tls::Asn1ObjectPtr;
using tls::Asn1OctetStringPtr;
using tls::EvpPkeyPtr;
using tls::X509ExtensionPtr;
using tls::X509Ptr;

/**
 * Knobs for building certificates that break exactly one rule of the
 * identity binding. Defaults produce a certificate equivalent to
 * IdentityCertificate::Generate.
 */
struct ForgeOptions {
    bool include_identity_extension = true;
    bool duplicate_identity_extension = false;
    bool add_unknown_critical_extension = false;
    bool add_unknown_extension = false;
    bool corrupt_identity_signature = false;
    bool sign_with_foreign_key = false;
    bool truncate_extension_value = false;
    /// Identity whose key is embedded while the signature is made by the main identity
    const IdentityKeyPair* embedded_identity = nullptr;
    std::string not_before{CertificateConstants::NOT_BEFORE};
    std::string not_after{CertificateConstants::NOT_AFTER};
};

inline void Check(const bool ok, const char* what) {
    if (!ok) {
        throw std::runtime_error(std::string("certificate forge: ") + what);
    }
}

inline EvpPkeyPtr ForgeP256Key() {
    EvpPkeyPtr key(EVP_EC_gen("P-256"));
    Check(key != nullptr, "EVP_EC_gen");
    return key;
}

inline std::vector<uint8_t> SpkiDer(EVP_PKEY* key) {
    const int length = i2d_PUBKEY(key, nullptr);
    Check(length > 0, "i2d_PUBKEY");
    std::vector<uint8_t> der(static_cast<size_t>(length));
    unsigned char* out = der.data();
    i2d_PUBKEY(key, &out);
    return der;
}

inline void AddExtension(X509* cert, const char* oid, const bool critical, const std::vector<uint8_t>& value) {
    Asn1ObjectPtr object(OBJ_txt2obj(oid, 1));
    Check(object != nullptr, "OBJ_txt2obj");
    Asn1OctetStringPtr octets(ASN1_OCTET_STRING_new());
    Check(octets && ASN1_OCTET_STRING_set(octets.get(), value.data(), static_cast<int>(value.size())) == 1,
          "ASN1_OCTET_STRING_set");
    X509ExtensionPtr extension(X509_EXTENSION_create_by_OBJ(nullptr, object.get(), critical ? 1 : 0, octets.get()));
    Check(extension && X509_add_ext(cert, extension.get(), -1) == 1, "X509_add_ext");
}

inline std::vector<uint8_t> ForgeCertificate(const IdentityKeyPair& signer, const ForgeOptions& options = {}) {
    EvpPkeyPtr key = ForgeP256Key();
    const std::vector<uint8_t> spki = SpkiDer(key.get());

    std::vector<uint8_t> message(kIdentitySigningPrefix.begin(), kIdentitySigningPrefix.end());
    message.insert(message.end(), spki.begin(), spki.end());
    auto signature = signer.Sign(message).Unwrap();
    if (options.corrupt_identity_signature) {
        signature[0] ^= 0x01;
    }
    const IdentityKeyPair& embedded = options.embedded_identity ? *options.embedded_identity : signer;
    auto extension_value = tls::SignedKeyCodec::Encode(tls::SignedKey{
        embedded.GetPublicKey().ToProtobuf().Unwrap(),
        std::move(signature)
    }).Unwrap();
    if (options.truncate_extension_value) {
        extension_value.resize(extension_value.size() / 2);
    }

    X509Ptr cert(X509_new());
    Check(cert != nullptr, "X509_new");
    Check(X509_set_version(cert.get(), CertificateConstants::X509_VERSION_V3) == 1, "X509_set_version");
    Check(ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1) == 1, "serial");
    Check(ASN1_TIME_set_string_X509(X509_getm_notBefore(cert.get()), options.not_before.c_str()) == 1,
          "notBefore");
    Check(ASN1_TIME_set_string_X509(X509_getm_notAfter(cert.get()), options.not_after.c_str()) == 1,
          "notAfter");
    Check(X509_set_pubkey(cert.get(), key.get()) == 1, "X509_set_pubkey");

    const std::string oid(kIdentityExtensionOid);
    if (options.include_identity_extension) {
        AddExtension(cert.get(), oid.c_str(), false, extension_value);
    }
    if (options.duplicate_identity_extension) {
        AddExtension(cert.get(), oid.c_str(), false, extension_value);
    }
    if (options.add_unknown_critical_extension) {
        AddExtension(cert.get(), "1.3.6.1.4.1.53594.99.1", true, std::vector<uint8_t>{0x05, 0x00});
    }
    if (options.add_unknown_extension) {
        AddExtension(cert.get(), "1.3.6.1.4.1.53594.99.2", false, std::vector<uint8_t>{0x05, 0x00});
    }

    EvpPkeyPtr foreign_key;
    EVP_PKEY* signing_key = key.get();
    if (options.sign_with_foreign_key) {
        foreign_key = ForgeP256Key();
        signing_key = foreign_key.get();
    }
    Check(X509_sign(cert.get(), signing_key, EVP_sha256()) > 0, "X509_sign");

    const int length = i2d_X509(cert.get(), nullptr);
    Check(length > 0, "i2d_X509");
    std::vector<uint8_t> der(static_cast<size_t>(length));
    unsigned char* out = der.data();
    i2d_X509(cert.get(), &out);
    return der;
}

}
