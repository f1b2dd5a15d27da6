#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/interfaces/i_certificate_verifier.hpp"
#include "peerquic/interfaces/i_handshake_event_handler.hpp"
#include "peerquic/tls/identity_certificate.hpp"
#include "peerquic/tls/openssl_handles.hpp"

#include <memory>

namespace peerquic::tls {

enum class TlsRole : uint8_t {
    Client,
    Server
};

/**
 * @brief SSL_CTX handed to the QUIC engine for one side of the handshake
 *
 * TLS 1.3 only, ALPN "libp2p", the handshake certificate and its ephemeral
 * key installed, mutual authentication required. Peer certificates go
 * through the injected verifier instead of any CA chain.
 */
class TlsContext {
public:
    [[nodiscard]] static Result<TlsContext, TransportFailure> Create(
        TlsRole role,
        const CertificateMaterial& material,
        std::shared_ptr<const interfaces::ICertificateVerifier> verifier);

    /**
     * @brief New SSL session for one connection
     *
     * The verification outcome for this session is reported to handler,
     * which must outlive the session.
     */
    [[nodiscard]] Result<SslPtr, TransportFailure> NewSession(
        interfaces::IHandshakeEventHandler* handler) const;

    [[nodiscard]] TlsRole GetRole() const noexcept {
        return role_;
    }

    [[nodiscard]] SSL_CTX* Get() const noexcept {
        return ctx_.get();
    }

private:
    TlsContext(TlsRole role, SslCtxPtr ctx,
               std::shared_ptr<const interfaces::ICertificateVerifier> verifier) noexcept;

    TlsRole role_;
    SslCtxPtr ctx_;
    std::shared_ptr<const interfaces::ICertificateVerifier> verifier_;
};

}
