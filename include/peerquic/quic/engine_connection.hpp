#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/configuration/transport_config.hpp"
#include "peerquic/interfaces/i_engine_event_handler.hpp"
#include "peerquic/interfaces/i_handshake_event_handler.hpp"
#include "peerquic/net/socket_address.hpp"
#include "peerquic/quic/event_loop.hpp"
#include "peerquic/tls/openssl_handles.hpp"
#include "peerquic/tls/tls_context.hpp"

#include <ngtcp2/ngtcp2.h>
#include <ngtcp2/ngtcp2_crypto.h>
#include <ngtcp2/ngtcp2_crypto_ossl.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace peerquic::quic {

/// Everything needed to start one engine connection
struct EngineSetup {
    tls::TlsRole role;
    const tls::TlsContext* tls;
    net::SocketAddress local;
    net::SocketAddress remote;
    configuration::TransportConfig config;
    std::span<const uint8_t> reset_secret;
    /// Header of the client's first Initial; server role only
    std::optional<ngtcp2_pkt_hd> initial_header;
    interfaces::IHandshakeEventHandler* handshake_handler;
    interfaces::IEngineEventHandler* event_handler;
};

enum class StreamWriteStatus : uint8_t {
    /// packet_length bytes are ready to send (possibly zero)
    Written,
    /// Data was accepted into a packet that still has room
    Coalescing,
    /// Stream or connection flow control is exhausted
    Blocked,
    /// The stream's write side is already shut
    WriteShut
};

struct StreamChunk {
    int64_t stream_id = -1;
    std::span<const uint8_t> data;
    bool fin = false;
    bool more = false;
};

struct WriteOutcome {
    StreamWriteStatus status = StreamWriteStatus::Written;
    size_t packet_length = 0;
    /// Stream bytes taken into the packet, when a stream was written
    std::optional<size_t> consumed;
};

/**
 * @brief One ngtcp2 connection together with its TLS session
 *
 * Thin owner of the engine handles. Not thread-safe: used only from the
 * endpoint loop thread under the owning ConnectionState's lock.
 */
class EngineConnection {
public:
    [[nodiscard]] static Result<std::unique_ptr<EngineConnection>, TransportFailure> Create(
        const EngineSetup& setup, Timestamp now);

    ~EngineConnection();

    EngineConnection(const EngineConnection&) = delete;
    EngineConnection& operator=(const EngineConnection&) = delete;

    /**
     * @brief Hand one received datagram to the engine
     *
     * Failure types: ConnectionClosed when the peer closed (draining),
     * HandshakeFailed on a TLS error, Engine otherwise. The matching
     * CONNECTION_CLOSE can then be produced with WriteClose.
     */
    [[nodiscard]] Result<Unit, TransportFailure> Feed(
        std::span<const uint8_t> datagram, const net::SocketAddress& remote, Timestamp now);

    [[nodiscard]] Result<Unit, TransportFailure> Expire(Timestamp now);

    [[nodiscard]] std::optional<Timestamp> GetExpiry() const noexcept;

    [[nodiscard]] Result<int64_t, TransportFailure> OpenBidiStream();

    [[nodiscard]] Result<WriteOutcome, TransportFailure> Write(
        std::span<uint8_t> out, const StreamChunk& chunk, Timestamp now);

    /**
     * @brief Serialize a CONNECTION_CLOSE packet
     *
     * Carries the engine error recorded by a failed Feed/Expire/Write when
     * there is one, the application error otherwise.
     *
     * @return 0 when the engine is already closing or draining
     */
    [[nodiscard]] size_t WriteClose(std::span<uint8_t> out, uint64_t app_error_code, Timestamp now);

    void ExtendStreamCredit(int64_t stream_id, uint64_t consumed);

    /// Give back connection-level credit for delivered bytes that were discarded unread
    void ExtendConnectionCredit(uint64_t discarded);

    void ShutdownStream(int64_t stream_id, uint64_t app_error_code);

    void ShutdownStreamRead(int64_t stream_id, uint64_t app_error_code);

    void UpdatePacketTxTime(Timestamp now);

    /// Every source connection ID currently issued to the peer
    [[nodiscard]] std::vector<std::vector<uint8_t>> GetSourceConnectionIds() const;

private:
    friend struct EngineCallbacks;

    explicit EngineConnection(const EngineSetup& setup);

    [[nodiscard]] TransportFailure RecordLibraryError(int rv, std::string_view operation);

    ngtcp2_conn* conn_ = nullptr;
    tls::SslPtr ssl_;
    ngtcp2_crypto_ossl_ctx* ossl_ctx_ = nullptr;
    ngtcp2_crypto_conn_ref conn_ref_{};
    ngtcp2_path_storage path_storage_{};
    ngtcp2_ccerr last_error_{};
    bool has_error_ = false;
    std::vector<uint8_t> reset_secret_;
    interfaces::IEngineEventHandler* events_;
    bool trace_;
};

}
