#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/configuration/transport_config.hpp"
#include "peerquic/identity/peer_id.hpp"
#include "peerquic/interfaces/i_connection_owner.hpp"
#include "peerquic/interfaces/i_engine_event_handler.hpp"
#include "peerquic/interfaces/i_handshake_event_handler.hpp"
#include "peerquic/net/socket_address.hpp"
#include "peerquic/quic/engine_connection.hpp"
#include "peerquic/quic/event_loop.hpp"
#include "peerquic/tls/tls_context.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <stop_token>
#include <vector>

namespace peerquic::quic {

enum class ConnectionStatus : uint8_t {
    Handshaking,
    Established,
    Closing,
    Closed,
    Failed
};

[[nodiscard]] std::string_view ToString(ConnectionStatus status) noexcept;

struct ConnectionSetup {
    tls::TlsRole role;
    std::shared_ptr<const tls::TlsContext> tls;
    net::SocketAddress local;
    net::SocketAddress remote;
    configuration::TransportConfig config;
    std::span<const uint8_t> reset_secret;
    std::optional<ngtcp2_pkt_hd> initial_header;
    interfaces::IConnectionOwner* owner;
    std::shared_ptr<EventLoop> loop;
};

/**
 * @brief One QUIC connection: engine instance, streams and handshake outcome
 *
 * Engine work happens on the endpoint loop thread (the *OnLoop and Handle*
 * methods). Application threads use the blocking stream methods, which only
 * touch buffered state and hand work to the loop by posting tasks.
 *
 * Stream handles are the engine's stream ids.
 */
class ConnectionState final : public interfaces::IHandshakeEventHandler,
                              public interfaces::IEngineEventHandler,
                              public std::enable_shared_from_this<ConnectionState> {
public:
    [[nodiscard]] static Result<std::shared_ptr<ConnectionState>, TransportFailure> Create(
        const ConnectionSetup& setup, Timestamp now);

    ~ConnectionState() override;

    ConnectionState(const ConnectionState&) = delete;
    ConnectionState& operator=(const ConnectionState&) = delete;

    // ========================================================================
    // Loop thread
    // ========================================================================

    /// Send whatever the engine has ready (the client's first flight)
    void Start(Timestamp now);

    void HandleDatagram(std::span<const uint8_t> datagram, const net::SocketAddress& remote, Timestamp now);

    void HandleExpiry(Timestamp now);

    void Flush(Timestamp now);

    [[nodiscard]] std::optional<Timestamp> NextExpiry() const;

    [[nodiscard]] Result<int64_t, TransportFailure> OpenStreamOnLoop();

    /// Idempotent local close: CONNECTION_CLOSE goes out, waiters wake up
    void CloseOnLoop(uint64_t app_error_code, Timestamp now);

    [[nodiscard]] std::vector<std::vector<uint8_t>> GetSourceConnectionIds() const;

    // ========================================================================
    // Any thread
    // ========================================================================

    /**
     * @brief Terminate without talking to the engine
     *
     * Used when the socket or the loop is gone; the failure is what
     * waiters observe.
     */
    void Abandon(const TransportFailure& failure);

    [[nodiscard]] Result<identity::PeerId, TransportFailure> WaitEstablished(std::stop_token stop);

    [[nodiscard]] Result<int64_t, TransportFailure> AcceptStream(std::stop_token stop);

    /// @return bytes copied; 0 at end of stream
    [[nodiscard]] Result<size_t, TransportFailure> Read(
        int64_t stream_id, std::span<uint8_t> buffer, std::stop_token stop);

    /// Queue all of data; blocks while the stream's unacknowledged bytes are at the limit
    [[nodiscard]] Result<Unit, TransportFailure> Write(
        int64_t stream_id, std::span<const uint8_t> data, std::stop_token stop);

    /// Queue FIN after the pending data
    [[nodiscard]] Result<Unit, TransportFailure> CloseStreamWrite(int64_t stream_id);

    [[nodiscard]] Result<Unit, TransportFailure> ResetStream(int64_t stream_id, uint64_t app_error_code);

    /// The handle for stream_id is gone; unfinished streams are cancelled
    void ReleaseStream(int64_t stream_id);

    [[nodiscard]] ConnectionStatus GetStatus() const;

    [[nodiscard]] std::optional<identity::PeerId> GetRemotePeerId() const;

    [[nodiscard]] tls::TlsRole GetRole() const noexcept {
        return role_;
    }

    [[nodiscard]] const net::SocketAddress& GetLocalAddress() const noexcept {
        return local_;
    }

    [[nodiscard]] const net::SocketAddress& GetRemoteAddress() const noexcept {
        return remote_;
    }

    // ========================================================================
    // Handshake and engine events (loop thread, lock held)
    // ========================================================================

    void OnPeerVerified(const identity::PeerId& peer_id) override;
    void OnPeerRejected(const CertificateFailure& failure) override;

    void OnHandshakeCompleted() override;
    void OnRemoteStreamOpened(int64_t stream_id) override;
    void OnStreamData(int64_t stream_id, std::span<const uint8_t> data, bool fin) override;
    void OnStreamDataAcked(int64_t stream_id, uint64_t offset, uint64_t length) override;
    void OnStreamReset(int64_t stream_id, uint64_t app_error_code) override;
    void OnStreamStopSending(int64_t stream_id, uint64_t app_error_code) override;
    void OnStreamClosed(int64_t stream_id, uint64_t app_error_code) override;
    void OnConnectionIdIssued(std::span<const uint8_t> cid) override;
    void OnConnectionIdRetired(std::span<const uint8_t> cid) override;

private:
    struct StreamRecord {
        std::deque<uint8_t> receive;
        bool fin_received = false;
        std::optional<uint64_t> reset_code;

        /// Queued data, kept until acknowledged because the engine does not copy it
        std::deque<std::vector<uint8_t>> send_chunks;
        uint64_t send_base = 0;
        uint64_t acked = 0;
        uint64_t sent = 0;
        uint64_t queued = 0;
        bool fin_queued = false;
        bool fin_sent = false;
        bool write_shut = false;

        bool closed = false;
        bool released = false;

        [[nodiscard]] bool HasPendingOutput() const noexcept {
            return !write_shut && (sent < queued || (fin_queued && !fin_sent));
        }

        [[nodiscard]] std::span<const uint8_t> UnsentData() const noexcept;

        void ReleaseAcknowledged() noexcept;

        void DropOutput() noexcept;
    };

    explicit ConnectionState(const ConnectionSetup& setup);

    [[nodiscard]] bool IsTerminalLocked() const noexcept {
        return status_ == ConnectionStatus::Closed || status_ == ConnectionStatus::Failed;
    }

    [[nodiscard]] TransportFailure ClosedFailureLocked() const;

    [[nodiscard]] Result<StreamRecord*, TransportFailure> FindStreamLocked(int64_t stream_id);

    void AdvanceHandshakeLocked(Timestamp now);
    void FailLocked(TransportFailure failure, bool send_close, Timestamp now);
    void TerminateLocked(ConnectionStatus status, TransportFailure failure);
    void DrainLocked(Timestamp now);
    [[nodiscard]] std::optional<int64_t> NextPendingStreamLocked(const std::set<int64_t>& skipped) const;

    void ScheduleFlush();
    void PostToLoop(EventLoop::Task task);
    void ReportTransitions();

    tls::TlsRole role_;
    net::SocketAddress local_;
    net::SocketAddress remote_;
    size_t send_buffer_limit_;
    std::shared_ptr<const tls::TlsContext> tls_;
    interfaces::IConnectionOwner* owner_;
    std::shared_ptr<EventLoop> loop_;

    mutable std::mutex mutex_;
    std::condition_variable_any changed_;

    std::unique_ptr<EngineConnection> engine_;
    ConnectionStatus status_ = ConnectionStatus::Handshaking;
    bool handshake_completed_ = false;
    std::optional<identity::PeerId> peer_id_;
    std::optional<CertificateFailure> rejection_;
    std::optional<TransportFailure> failure_;

    std::map<int64_t, StreamRecord> streams_;
    std::deque<int64_t> inbound_;
    int64_t last_served_stream_ = -1;
    std::vector<uint8_t> send_buffer_;

    bool report_established_ = false;
    bool terminated_reported_ = false;
    std::atomic<bool> flush_scheduled_{false};
};

}
