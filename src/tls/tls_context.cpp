#include "peerquic/tls/tls_context.hpp"
#include "peerquic/core/constants.hpp"
#include "peerquic/debug/logger.hpp"

#include <ngtcp2/ngtcp2_crypto.h>
#include <ngtcp2/ngtcp2_crypto_ossl.h>

#include <openssl/err.h>

#include <fmt/core.h>

#include <cstring>
#include <mutex>
#include <vector>

namespace peerquic::tls {

namespace {

constexpr std::string_view kComponent = "tls";

int HandlerIndex() {
    static const int index = SSL_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
    return index;
}

Result<Unit, TransportFailure> InitializeCryptoBackend() {
    static std::once_flag once;
    static bool initialized = false;
    std::call_once(once, []() {
        initialized = ngtcp2_crypto_ossl_init() == 0;
    });
    if (!initialized) {
        return Result<Unit, TransportFailure>::Err(
            TransportFailure::Engine("ngtcp2_crypto_ossl_init failed"));
    }
    return Result<Unit, TransportFailure>::Ok(unit);
}

std::vector<uint8_t> AlpnWireFormat() {
    std::vector<uint8_t> wire;
    wire.push_back(static_cast<uint8_t>(kAlpnProtocol.size()));
    wire.insert(wire.end(), kAlpnProtocol.begin(), kAlpnProtocol.end());
    return wire;
}

int SelectAlpn(SSL*, const unsigned char** out, unsigned char* outlen,
               const unsigned char* in, const unsigned int inlen, void*) {
    for (unsigned int i = 0; i < inlen;) {
        const unsigned char len = in[i++];
        if (i + len > inlen) {
            break;
        }
        if (len == kAlpnProtocol.size() && std::memcmp(in + i, kAlpnProtocol.data(), len) == 0) {
            *out = in + i;
            *outlen = len;
            return SSL_TLSEXT_ERR_OK;
        }
        i += len;
    }
    return SSL_TLSEXT_ERR_ALERT_FATAL;
}

// Replaces the whole X.509 path validation; OpenSSL's own chain checks never run.
int VerifyPeerCertificate(X509_STORE_CTX* store, void* arg) {
    const auto* verifier = static_cast<const interfaces::ICertificateVerifier*>(arg);
    auto* ssl = static_cast<SSL*>(
        X509_STORE_CTX_get_ex_data(store, SSL_get_ex_data_X509_STORE_CTX_idx()));
    auto* handler = ssl ? static_cast<interfaces::IHandshakeEventHandler*>(
                              SSL_get_ex_data(ssl, HandlerIndex()))
                        : nullptr;

    auto reject = [&](CertificateFailure failure) {
        PEERQUIC_LOG_INFO(kComponent, "peer certificate rejected: {}", failure.message);
        if (handler) {
            handler->OnPeerRejected(failure);
        }
        X509_STORE_CTX_set_error(store, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    };

    STACK_OF(X509)* chain = X509_STORE_CTX_get0_untrusted(store);
    if (chain == nullptr || sk_X509_num(chain) != 1) {
        return reject(CertificateFailure::Malformed(fmt::format(
            "Peer must present exactly one certificate, got {}", chain ? sk_X509_num(chain) : 0)));
    }

    X509* leaf = X509_STORE_CTX_get0_cert(store);
    const int length = leaf ? i2d_X509(leaf, nullptr) : -1;
    if (length <= 0) {
        return reject(CertificateFailure::Malformed("Peer certificate cannot be re-encoded"));
    }
    std::vector<uint8_t> der(static_cast<size_t>(length));
    unsigned char* out = der.data();
    i2d_X509(leaf, &out);

    auto verified = verifier->Verify(der);
    if (verified.IsErr()) {
        return reject(std::move(verified).UnwrapErr());
    }
    if (handler) {
        handler->OnPeerVerified(verified.Unwrap());
    }
    X509_STORE_CTX_set_error(store, X509_V_OK);
    return 1;
}

TransportFailure ContextFailure(const std::string_view what) {
    return TransportFailure::Engine(fmt::format("{}: {}", what, GetOpenSSLError()));
}

}

TlsContext::TlsContext(const TlsRole role, SslCtxPtr ctx,
                       std::shared_ptr<const interfaces::ICertificateVerifier> verifier) noexcept
    : role_(role)
    , ctx_(std::move(ctx))
    , verifier_(std::move(verifier)) {
}

Result<TlsContext, TransportFailure> TlsContext::Create(
    const TlsRole role,
    const CertificateMaterial& material,
    std::shared_ptr<const interfaces::ICertificateVerifier> verifier) {
    using CreateResult = Result<TlsContext, TransportFailure>;

    if (!verifier) {
        return CreateResult::Err(TransportFailure::Engine("TLS context requires a certificate verifier"));
    }
    if (auto init = InitializeCryptoBackend(); init.IsErr()) {
        return CreateResult::Err(std::move(init).UnwrapErr());
    }

    SslCtxPtr ctx(SSL_CTX_new(role == TlsRole::Server ? TLS_server_method() : TLS_client_method()));
    if (!ctx) {
        return CreateResult::Err(ContextFailure("Failed to create SSL_CTX"));
    }
    if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_3_VERSION) != OpenSSLConstants::SUCCESS ||
        SSL_CTX_set_max_proto_version(ctx.get(), TLS1_3_VERSION) != OpenSSLConstants::SUCCESS) {
        return CreateResult::Err(ContextFailure("Failed to restrict SSL_CTX to TLS 1.3"));
    }

    const unsigned char* in = material.certificate_der.data();
    X509Ptr cert(d2i_X509(nullptr, &in, static_cast<long>(material.certificate_der.size())));
    if (!cert) {
        return CreateResult::Err(ContextFailure("Handshake certificate does not decode"));
    }
    if (SSL_CTX_use_certificate(ctx.get(), cert.get()) != OpenSSLConstants::SUCCESS ||
        SSL_CTX_use_PrivateKey(ctx.get(), material.ephemeral_key.Get()) != OpenSSLConstants::SUCCESS ||
        SSL_CTX_check_private_key(ctx.get()) != OpenSSLConstants::SUCCESS) {
        return CreateResult::Err(ContextFailure("Failed to install handshake certificate"));
    }

    int verify_mode = SSL_VERIFY_PEER;
    if (role == TlsRole::Server) {
        verify_mode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT | SSL_VERIFY_CLIENT_ONCE;
        SSL_CTX_set_alpn_select_cb(ctx.get(), SelectAlpn, nullptr);
    }
    SSL_CTX_set_verify(ctx.get(), verify_mode, nullptr);
    SSL_CTX_set_cert_verify_callback(ctx.get(), VerifyPeerCertificate,
                                     const_cast<interfaces::ICertificateVerifier*>(verifier.get()));

    PEERQUIC_LOG_TRACE(kComponent, "created {} TLS context",
                       role == TlsRole::Server ? "server" : "client");
    return CreateResult::Ok(TlsContext(role, std::move(ctx), std::move(verifier)));
}

Result<SslPtr, TransportFailure> TlsContext::NewSession(interfaces::IHandshakeEventHandler* handler) const {
    SslPtr ssl(SSL_new(ctx_.get()));
    if (!ssl) {
        return Result<SslPtr, TransportFailure>::Err(ContextFailure("Failed to create SSL session"));
    }
    if (SSL_set_ex_data(ssl.get(), HandlerIndex(), handler) != OpenSSLConstants::SUCCESS) {
        return Result<SslPtr, TransportFailure>::Err(ContextFailure("Failed to attach handshake handler"));
    }

    if (role_ == TlsRole::Client) {
        if (ngtcp2_crypto_ossl_configure_client_session(ssl.get()) != 0) {
            return Result<SslPtr, TransportFailure>::Err(
                TransportFailure::Engine("ngtcp2_crypto_ossl_configure_client_session failed"));
        }
        const auto alpn = AlpnWireFormat();
        // SSL_set_alpn_protos returns 0 on success
        if (SSL_set_alpn_protos(ssl.get(), alpn.data(), static_cast<unsigned int>(alpn.size())) != 0) {
            return Result<SslPtr, TransportFailure>::Err(ContextFailure("Failed to set ALPN"));
        }
        SSL_set_connect_state(ssl.get());
    } else {
        if (ngtcp2_crypto_ossl_configure_server_session(ssl.get()) != 0) {
            return Result<SslPtr, TransportFailure>::Err(
                TransportFailure::Engine("ngtcp2_crypto_ossl_configure_server_session failed"));
        }
        SSL_set_accept_state(ssl.get());
    }
    return Result<SslPtr, TransportFailure>::Ok(std::move(ssl));
}

}
