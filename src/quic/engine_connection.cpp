#include "peerquic/quic/engine_connection.hpp"
#include "peerquic/core/constants.hpp"
#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/debug/logger.hpp"

#include <fmt/core.h>

#include <cstdarg>
#include <cstdio>
#include <limits>

namespace peerquic::quic {

namespace {

constexpr std::string_view kComponent = "engine";

ngtcp2_addr ToEngineAddress(const net::SocketAddress& address) noexcept {
    ngtcp2_addr result{};
    result.addr = const_cast<ngtcp2_sockaddr*>(
        reinterpret_cast<const ngtcp2_sockaddr*>(address.GetSockaddr()));
    result.addrlen = static_cast<ngtcp2_socklen>(address.GetLength());
    return result;
}

void RandomConnectionId(ngtcp2_cid& cid, const size_t length) noexcept {
    cid.datalen = length;
    crypto::SodiumInterop::FillRandom(std::span<uint8_t>(cid.data, length));
}

}

// ============================================================================
// ngtcp2 callback trampolines
// ============================================================================

struct EngineCallbacks {
    static EngineConnection* Self(void* user_data) noexcept {
        return static_cast<EngineConnection*>(user_data);
    }

    static ngtcp2_conn* GetConnection(ngtcp2_crypto_conn_ref* ref) {
        return static_cast<EngineConnection*>(ref->user_data)->conn_;
    }

    static int HandshakeCompleted(ngtcp2_conn*, void* user_data) {
        Self(user_data)->events_->OnHandshakeCompleted();
        return 0;
    }

    static int StreamOpen(ngtcp2_conn* conn, const int64_t stream_id, void* user_data) {
        if (!ngtcp2_conn_is_local_stream(conn, stream_id)) {
            Self(user_data)->events_->OnRemoteStreamOpened(stream_id);
        }
        return 0;
    }

    static int RecvStreamData(ngtcp2_conn*, const uint32_t flags, const int64_t stream_id, uint64_t,
                              const uint8_t* data, const size_t length, void* user_data, void*) {
        Self(user_data)->events_->OnStreamData(
            stream_id, std::span<const uint8_t>(data, length),
            (flags & NGTCP2_STREAM_DATA_FLAG_FIN) != 0);
        return 0;
    }

    static int AckedStreamDataOffset(ngtcp2_conn*, const int64_t stream_id, const uint64_t offset,
                                     const uint64_t length, void* user_data, void*) {
        Self(user_data)->events_->OnStreamDataAcked(stream_id, offset, length);
        return 0;
    }

    static int StreamClose(ngtcp2_conn*, const uint32_t flags, const int64_t stream_id,
                           const uint64_t app_error_code, void* user_data, void*) {
        const uint64_t code = (flags & NGTCP2_STREAM_CLOSE_FLAG_APP_ERROR_CODE_SET) != 0
            ? app_error_code
            : QuicConstants::APPLICATION_NO_ERROR;
        Self(user_data)->events_->OnStreamClosed(stream_id, code);
        return 0;
    }

    static int StreamReset(ngtcp2_conn*, const int64_t stream_id, uint64_t,
                           const uint64_t app_error_code, void* user_data, void*) {
        Self(user_data)->events_->OnStreamReset(stream_id, app_error_code);
        return 0;
    }

    static int StreamStopSending(ngtcp2_conn*, const int64_t stream_id,
                                 const uint64_t app_error_code, void* user_data, void*) {
        Self(user_data)->events_->OnStreamStopSending(stream_id, app_error_code);
        return 0;
    }

    static void Rand(uint8_t* dest, const size_t length, const ngtcp2_rand_ctx*) {
        crypto::SodiumInterop::FillRandom(std::span<uint8_t>(dest, length));
    }

    static int GetNewConnectionId(ngtcp2_conn*, ngtcp2_cid* cid, uint8_t* token,
                                  const size_t cid_length, void* user_data) {
        EngineConnection* self = Self(user_data);
        RandomConnectionId(*cid, cid_length);
        if (ngtcp2_crypto_generate_stateless_reset_token(
                token, self->reset_secret_.data(), self->reset_secret_.size(), cid) != 0) {
            return NGTCP2_ERR_CALLBACK_FAILURE;
        }
        self->events_->OnConnectionIdIssued(std::span<const uint8_t>(cid->data, cid->datalen));
        return 0;
    }

    static int RemoveConnectionId(ngtcp2_conn*, const ngtcp2_cid* cid, void* user_data) {
        Self(user_data)->events_->OnConnectionIdRetired(std::span<const uint8_t>(cid->data, cid->datalen));
        return 0;
    }

    static int GetPathChallengeData(ngtcp2_conn*, uint8_t* data, void*) {
        crypto::SodiumInterop::FillRandom(std::span<uint8_t>(data, NGTCP2_PATH_CHALLENGE_DATALEN));
        return 0;
    }

    static void LogPrintf(void*, const char* format, ...) {
        char line[512];
        va_list args;
        va_start(args, format);
        std::vsnprintf(line, sizeof(line), format, args);
        va_end(args);
        PEERQUIC_LOG_TRACE("ngtcp2", "{}", line);
    }

    static ngtcp2_callbacks Build(const tls::TlsRole role) {
        ngtcp2_callbacks callbacks{};
        if (role == tls::TlsRole::Client) {
            callbacks.client_initial = ngtcp2_crypto_client_initial_cb;
            callbacks.recv_retry = ngtcp2_crypto_recv_retry_cb;
        } else {
            callbacks.recv_client_initial = ngtcp2_crypto_recv_client_initial_cb;
        }
        callbacks.recv_crypto_data = ngtcp2_crypto_recv_crypto_data_cb;
        callbacks.encrypt = ngtcp2_crypto_encrypt_cb;
        callbacks.decrypt = ngtcp2_crypto_decrypt_cb;
        callbacks.hp_mask = ngtcp2_crypto_hp_mask_cb;
        callbacks.update_key = ngtcp2_crypto_update_key_cb;
        callbacks.delete_crypto_aead_ctx = ngtcp2_crypto_delete_crypto_aead_ctx_cb;
        callbacks.delete_crypto_cipher_ctx = ngtcp2_crypto_delete_crypto_cipher_ctx_cb;
        callbacks.version_negotiation = ngtcp2_crypto_version_negotiation_cb;
        callbacks.handshake_completed = HandshakeCompleted;
        callbacks.stream_open = StreamOpen;
        callbacks.recv_stream_data = RecvStreamData;
        callbacks.acked_stream_data_offset = AckedStreamDataOffset;
        callbacks.stream_close = StreamClose;
        callbacks.stream_reset = StreamReset;
        callbacks.stream_stop_sending = StreamStopSending;
        callbacks.rand = Rand;
        callbacks.get_new_connection_id = GetNewConnectionId;
        callbacks.remove_connection_id = RemoveConnectionId;
        callbacks.get_path_challenge_data = GetPathChallengeData;
        return callbacks;
    }
};

// ============================================================================
// Lifecycle
// ============================================================================

EngineConnection::EngineConnection(const EngineSetup& setup)
    : reset_secret_(setup.reset_secret.begin(), setup.reset_secret.end())
    , events_(setup.event_handler)
    , trace_(setup.config.IsEngineTraceEnabled()) {
    ngtcp2_ccerr_default(&last_error_);
}

EngineConnection::~EngineConnection() {
    if (conn_ != nullptr) {
        ngtcp2_conn_del(conn_);
    }
    if (ssl_) {
        SSL_set_app_data(ssl_.get(), nullptr);
        ssl_.reset();
    }
    if (ossl_ctx_ != nullptr) {
        ngtcp2_crypto_ossl_ctx_del(ossl_ctx_);
    }
}

Result<std::unique_ptr<EngineConnection>, TransportFailure> EngineConnection::Create(
    const EngineSetup& setup, const Timestamp now) {
    using ResultType = Result<std::unique_ptr<EngineConnection>, TransportFailure>;

    if (setup.role == tls::TlsRole::Server && !setup.initial_header) {
        return ResultType::Err(TransportFailure::Engine("server connection requires the client's initial header"));
    }

    auto engine = std::unique_ptr<EngineConnection>(new EngineConnection(setup));

    auto session_result = setup.tls->NewSession(setup.handshake_handler);
    if (session_result.IsErr()) {
        return ResultType::Err(std::move(session_result).UnwrapErr());
    }
    engine->ssl_ = std::move(session_result).Unwrap();

    engine->conn_ref_.get_conn = EngineCallbacks::GetConnection;
    engine->conn_ref_.user_data = engine.get();
    SSL_set_app_data(engine->ssl_.get(), &engine->conn_ref_);

    if (ngtcp2_crypto_ossl_ctx_new(&engine->ossl_ctx_, engine->ssl_.get()) != 0) {
        return ResultType::Err(TransportFailure::Engine("ngtcp2_crypto_ossl_ctx_new failed"));
    }

    const ngtcp2_addr local = ToEngineAddress(setup.local);
    const ngtcp2_addr remote = ToEngineAddress(setup.remote);
    ngtcp2_path_storage_init(&engine->path_storage_,
                             local.addr, local.addrlen,
                             remote.addr, remote.addrlen,
                             nullptr);

    ngtcp2_settings settings;
    ngtcp2_settings_default(&settings);
    settings.initial_ts = now;
    settings.max_tx_udp_payload_size = QuicConstants::MAX_UDP_PAYLOAD;
    settings.handshake_timeout = static_cast<ngtcp2_duration>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(setup.config.GetHandshakeTimeout()).count());
    if (engine->trace_) {
        settings.log_printf = EngineCallbacks::LogPrintf;
    }

    ngtcp2_transport_params params;
    ngtcp2_transport_params_default(&params);
    params.initial_max_stream_data_bidi_local = setup.config.GetStreamWindow();
    params.initial_max_stream_data_bidi_remote = setup.config.GetStreamWindow();
    params.initial_max_stream_data_uni = 0;
    params.initial_max_data = setup.config.GetConnectionWindow();
    params.initial_max_streams_bidi = setup.config.GetMaxConcurrentStreams();
    params.initial_max_streams_uni = 0;
    params.max_idle_timeout = static_cast<ngtcp2_duration>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(setup.config.GetIdleTimeout()).count());

    ngtcp2_cid scid;
    RandomConnectionId(scid, QuicConstants::SCID_LENGTH);

    const ngtcp2_callbacks callbacks = EngineCallbacks::Build(setup.role);
    int rv;
    if (setup.role == tls::TlsRole::Client) {
        ngtcp2_cid dcid;
        RandomConnectionId(dcid, QuicConstants::SCID_LENGTH);
        rv = ngtcp2_conn_client_new(&engine->conn_, &dcid, &scid, &engine->path_storage_.path,
                                    NGTCP2_PROTO_VER_V1, &callbacks, &settings, &params,
                                    nullptr, engine.get());
    } else {
        const ngtcp2_pkt_hd& header = *setup.initial_header;
        params.original_dcid = header.dcid;
        params.original_dcid_present = 1;
        rv = ngtcp2_conn_server_new(&engine->conn_, &header.scid, &scid, &engine->path_storage_.path,
                                    header.version, &callbacks, &settings, &params,
                                    nullptr, engine.get());
    }
    if (rv != 0) {
        engine->conn_ = nullptr;
        return ResultType::Err(TransportFailure::Engine(
            fmt::format("ngtcp2 connection setup failed: {}", ngtcp2_strerror(rv))));
    }

    ngtcp2_conn_set_tls_native_handle(engine->conn_, engine->ossl_ctx_);

    if (setup.config.GetKeepAlive().count() > 0) {
        ngtcp2_conn_set_keep_alive_timeout(engine->conn_, static_cast<ngtcp2_duration>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(setup.config.GetKeepAlive()).count()));
    }

    return ResultType::Ok(std::move(engine));
}

// ============================================================================
// Packet I/O
// ============================================================================

Result<Unit, TransportFailure> EngineConnection::Feed(
    std::span<const uint8_t> datagram, const net::SocketAddress& remote, const Timestamp now) {
    ngtcp2_path path = path_storage_.path;
    path.remote = ToEngineAddress(remote);
    const ngtcp2_pkt_info packet_info{};

    const int rv = ngtcp2_conn_read_pkt(conn_, &path, &packet_info, datagram.data(), datagram.size(), now);
    if (rv == 0) {
        return Result<Unit, TransportFailure>::Ok(unit);
    }

    switch (rv) {
        case NGTCP2_ERR_DRAINING:
        case NGTCP2_ERR_CLOSING: {
            const ngtcp2_ccerr* peer_error = ngtcp2_conn_get_ccerr(conn_);
            return Result<Unit, TransportFailure>::Err(TransportFailure::ConnectionClosed(
                fmt::format("closed by peer (error code {:#x})", peer_error->error_code)));
        }
        case NGTCP2_ERR_DROP_CONN:
            return Result<Unit, TransportFailure>::Err(
                TransportFailure::ConnectionClosed("connection dropped by the engine"));
        case NGTCP2_ERR_CRYPTO: {
            const uint8_t alert = ngtcp2_conn_get_tls_alert(conn_);
            ngtcp2_ccerr_set_tls_alert(&last_error_, alert, nullptr, 0);
            has_error_ = true;
            return Result<Unit, TransportFailure>::Err(TransportFailure::HandshakeFailed(
                fmt::format("TLS handshake failed (alert {})", alert)));
        }
        default:
            return Result<Unit, TransportFailure>::Err(RecordLibraryError(rv, "ngtcp2_conn_read_pkt"));
    }
}

Result<Unit, TransportFailure> EngineConnection::Expire(const Timestamp now) {
    const int rv = ngtcp2_conn_handle_expiry(conn_, now);
    switch (rv) {
        case 0:
            return Result<Unit, TransportFailure>::Ok(unit);
        case NGTCP2_ERR_IDLE_CLOSE:
            return Result<Unit, TransportFailure>::Err(TransportFailure::ConnectionClosed("idle timeout"));
        case NGTCP2_ERR_HANDSHAKE_TIMEOUT:
            return Result<Unit, TransportFailure>::Err(TransportFailure::HandshakeFailed("handshake timed out"));
        default:
            return Result<Unit, TransportFailure>::Err(RecordLibraryError(rv, "ngtcp2_conn_handle_expiry"));
    }
}

std::optional<Timestamp> EngineConnection::GetExpiry() const noexcept {
    const ngtcp2_tstamp expiry = ngtcp2_conn_get_expiry(conn_);
    if (expiry == std::numeric_limits<ngtcp2_tstamp>::max()) {
        return std::nullopt;
    }
    return expiry;
}

Result<WriteOutcome, TransportFailure> EngineConnection::Write(
    std::span<uint8_t> out, const StreamChunk& chunk, const Timestamp now) {
    uint32_t flags = NGTCP2_WRITE_STREAM_FLAG_NONE;
    if (chunk.more) {
        flags |= NGTCP2_WRITE_STREAM_FLAG_MORE;
    }
    if (chunk.fin) {
        flags |= NGTCP2_WRITE_STREAM_FLAG_FIN;
    }

    ngtcp2_vec vector{const_cast<uint8_t*>(chunk.data.data()), chunk.data.size()};
    const bool has_data = chunk.stream_id >= 0 && !chunk.data.empty();
    ngtcp2_pkt_info packet_info{};
    ngtcp2_ssize consumed = -1;

    const ngtcp2_ssize written = ngtcp2_conn_writev_stream(
        conn_, nullptr, &packet_info, out.data(), out.size(), &consumed, flags,
        chunk.stream_id, has_data ? &vector : nullptr, has_data ? 1 : 0, now);

    WriteOutcome outcome;
    if (consumed >= 0) {
        outcome.consumed = static_cast<size_t>(consumed);
    }
    if (written >= 0) {
        outcome.status = StreamWriteStatus::Written;
        outcome.packet_length = static_cast<size_t>(written);
        return Result<WriteOutcome, TransportFailure>::Ok(outcome);
    }

    switch (written) {
        case NGTCP2_ERR_WRITE_MORE:
            outcome.status = StreamWriteStatus::Coalescing;
            break;
        case NGTCP2_ERR_STREAM_DATA_BLOCKED:
            outcome.status = StreamWriteStatus::Blocked;
            break;
        case NGTCP2_ERR_STREAM_SHUT_WR:
        case NGTCP2_ERR_STREAM_NOT_FOUND:
            outcome.status = StreamWriteStatus::WriteShut;
            break;
        default:
            return Result<WriteOutcome, TransportFailure>::Err(
                RecordLibraryError(static_cast<int>(written), "ngtcp2_conn_writev_stream"));
    }
    return Result<WriteOutcome, TransportFailure>::Ok(outcome);
}

size_t EngineConnection::WriteClose(std::span<uint8_t> out, const uint64_t app_error_code, const Timestamp now) {
    if (ngtcp2_conn_in_closing_period(conn_) || ngtcp2_conn_in_draining_period(conn_)) {
        return 0;
    }

    ngtcp2_ccerr error;
    if (has_error_) {
        error = last_error_;
    } else {
        ngtcp2_ccerr_default(&error);
        ngtcp2_ccerr_set_application_error(&error, app_error_code, nullptr, 0);
    }

    ngtcp2_pkt_info packet_info{};
    const ngtcp2_ssize written = ngtcp2_conn_write_connection_close(
        conn_, nullptr, &packet_info, out.data(), out.size(), &error, now);
    if (written < 0) {
        PEERQUIC_LOG_DEBUG(kComponent, "CONNECTION_CLOSE not written: {}",
                           ngtcp2_strerror(static_cast<int>(written)));
        return 0;
    }
    return static_cast<size_t>(written);
}

// ============================================================================
// Streams
// ============================================================================

Result<int64_t, TransportFailure> EngineConnection::OpenBidiStream() {
    int64_t stream_id = -1;
    const int rv = ngtcp2_conn_open_bidi_stream(conn_, &stream_id, nullptr);
    if (rv == NGTCP2_ERR_STREAM_ID_BLOCKED) {
        return Result<int64_t, TransportFailure>::Err(
            TransportFailure::StreamLimitExceeded("peer's concurrent stream limit reached"));
    }
    if (rv != 0) {
        return Result<int64_t, TransportFailure>::Err(TransportFailure::Engine(
            fmt::format("ngtcp2_conn_open_bidi_stream failed: {}", ngtcp2_strerror(rv))));
    }
    return Result<int64_t, TransportFailure>::Ok(stream_id);
}

void EngineConnection::ExtendStreamCredit(const int64_t stream_id, const uint64_t consumed) {
    if (const int rv = ngtcp2_conn_extend_max_stream_offset(conn_, stream_id, consumed); rv != 0) {
        PEERQUIC_LOG_DEBUG(kComponent, "stream {} credit not extended: {}", stream_id, ngtcp2_strerror(rv));
    }
    ngtcp2_conn_extend_max_offset(conn_, consumed);
}

void EngineConnection::ExtendConnectionCredit(const uint64_t discarded) {
    if (discarded > 0) {
        ngtcp2_conn_extend_max_offset(conn_, discarded);
    }
}

void EngineConnection::ShutdownStream(const int64_t stream_id, const uint64_t app_error_code) {
    if (const int rv = ngtcp2_conn_shutdown_stream(conn_, 0, stream_id, app_error_code); rv != 0) {
        PEERQUIC_LOG_DEBUG(kComponent, "stream {} shutdown ignored: {}", stream_id, ngtcp2_strerror(rv));
    }
}

void EngineConnection::ShutdownStreamRead(const int64_t stream_id, const uint64_t app_error_code) {
    if (const int rv = ngtcp2_conn_shutdown_stream_read(conn_, 0, stream_id, app_error_code); rv != 0) {
        PEERQUIC_LOG_DEBUG(kComponent, "stream {} read shutdown ignored: {}", stream_id, ngtcp2_strerror(rv));
    }
}

void EngineConnection::UpdatePacketTxTime(const Timestamp now) {
    ngtcp2_conn_update_pkt_tx_time(conn_, now);
}

std::vector<std::vector<uint8_t>> EngineConnection::GetSourceConnectionIds() const {
    std::vector<ngtcp2_cid> ids(ngtcp2_conn_get_num_scid(conn_));
    ngtcp2_conn_get_scid(conn_, ids.data());

    std::vector<std::vector<uint8_t>> result;
    result.reserve(ids.size());
    for (const ngtcp2_cid& id : ids) {
        result.emplace_back(id.data, id.data + id.datalen);
    }
    return result;
}

TransportFailure EngineConnection::RecordLibraryError(const int rv, const std::string_view operation) {
    ngtcp2_ccerr_set_liberr(&last_error_, rv, nullptr, 0);
    has_error_ = true;
    return TransportFailure::Engine(fmt::format("{} failed: {}", operation, ngtcp2_strerror(rv)));
}

}
