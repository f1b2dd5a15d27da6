#pragma once
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <memory>
#include <string>
namespace peerquic::tls {
struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};
struct X509Deleter {
    void operator()(X509* cert) const {
        if (cert) {
            X509_free(cert);
        }
    }
};
struct X509ExtensionDeleter {
    void operator()(X509_EXTENSION* extension) const {
        if (extension) {
            X509_EXTENSION_free(extension);
        }
    }
};
struct Asn1ObjectDeleter {
    void operator()(ASN1_OBJECT* object) const {
        if (object) {
            ASN1_OBJECT_free(object);
        }
    }
};
struct Asn1OctetStringDeleter {
    void operator()(ASN1_OCTET_STRING* value) const {
        if (value) {
            ASN1_OCTET_STRING_free(value);
        }
    }
};
struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const {
        if (ctx) {
            SSL_CTX_free(ctx);
        }
    }
};
struct SslDeleter {
    void operator()(SSL* ssl) const {
        if (ssl) {
            SSL_free(ssl);
        }
    }
};
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using X509ExtensionPtr = std::unique_ptr<X509_EXTENSION, X509ExtensionDeleter>;
using Asn1ObjectPtr = std::unique_ptr<ASN1_OBJECT, Asn1ObjectDeleter>;
using Asn1OctetStringPtr = std::unique_ptr<ASN1_OCTET_STRING, Asn1OctetStringDeleter>;
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;

/// Drain the thread's OpenSSL error queue into one message
std::string GetOpenSSLError();
}
