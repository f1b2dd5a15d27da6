#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/configuration/transport_config.hpp"
#include "peerquic/identity/identity_keypair.hpp"
#include "peerquic/interfaces/i_certificate_verifier.hpp"
#include "peerquic/interfaces/i_connection_owner.hpp"
#include "peerquic/net/socket_address.hpp"
#include "peerquic/net/udp_socket.hpp"
#include "peerquic/quic/connection.hpp"
#include "peerquic/quic/connection_state.hpp"
#include "peerquic/quic/event_loop.hpp"
#include "peerquic/tls/tls_context.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace peerquic::quic {

/**
 * @brief One UDP socket and every QUIC connection that runs over it
 *
 * The endpoint's loop thread owns the socket and all engine state: it
 * routes datagrams by destination connection ID, creates inbound
 * connections while listening, fires engine timers and transmits what the
 * connections produce. Application threads reach it through Dial, Accept
 * and Close only.
 */
class Endpoint final : public interfaces::IConnectionOwner {
public:
    /**
     * @brief Open the socket, build the handshake certificate and start the loop
     *
     * @param verifier trust decision for peer certificates; identity-binding
     *        verification when null
     */
    [[nodiscard]] static Result<std::shared_ptr<Endpoint>, TransportFailure> Bind(
        const net::SocketAddress& local,
        std::shared_ptr<const identity::IdentityKeyPair> identity,
        const configuration::TransportConfig& config,
        std::shared_ptr<const interfaces::ICertificateVerifier> verifier = nullptr);

    ~Endpoint() override;

    Endpoint(const Endpoint&) = delete;
    Endpoint& operator=(const Endpoint&) = delete;

    /**
     * @brief Connect to remote and wait for the authenticated handshake
     *
     * A stop request abandons the attempt: the half-open connection is
     * closed and Cancelled is returned.
     */
    [[nodiscard]] Result<std::shared_ptr<Connection>, TransportFailure> Dial(
        const net::SocketAddress& remote, std::stop_token stop = {});

    /// Start creating connections for incoming Initial packets; one call per Listener
    void Listen();

    /**
     * @brief Drop one Listen() registration
     *
     * The endpoint keeps accepting while any Listener remains. When the last
     * one goes, connections not yet claimed by Accept are closed.
     */
    void StopListening();

    /**
     * @brief Next Established inbound connection
     *
     * ListenerClosed once the endpoint stops listening or closes.
     */
    [[nodiscard]] Result<std::shared_ptr<Connection>, TransportFailure> Accept(std::stop_token stop = {});

    /// Close every connection, stop the loop and release the socket
    void Close();

    [[nodiscard]] bool IsListening() const;

    [[nodiscard]] bool IsClosed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const net::SocketAddress& GetLocalAddress() const noexcept {
        return local_;
    }

    /// Live connections, including ones still handshaking
    [[nodiscard]] size_t GetConnectionCount() const;

    // IConnectionOwner
    void SendDatagram(std::span<const uint8_t> datagram, const ConnectionState& from) override;
    void OnConnectionIdIssued(std::span<const uint8_t> cid, const std::shared_ptr<ConnectionState>& state) override;
    void OnConnectionIdRetired(std::span<const uint8_t> cid) override;
    void OnConnectionEstablished(const std::shared_ptr<ConnectionState>& state) override;
    void OnConnectionTerminated(const std::shared_ptr<ConnectionState>& state) override;

private:
    struct TlsContexts {
        std::shared_ptr<const tls::TlsContext> client;
        std::shared_ptr<const tls::TlsContext> server;
    };

    [[nodiscard]] static Result<TlsContexts, TransportFailure> BuildTlsContexts(
        const identity::IdentityKeyPair& identity,
        const std::shared_ptr<const interfaces::ICertificateVerifier>& verifier);

    Endpoint(net::UdpSocket socket,
             std::shared_ptr<EventLoop> loop,
             std::shared_ptr<const identity::IdentityKeyPair> identity,
             const configuration::TransportConfig& config,
             std::shared_ptr<const interfaces::ICertificateVerifier> verifier,
             TlsContexts contexts);

    // Loop thread only
    void OnReadable();
    void Dispatch(std::span<const uint8_t> datagram, const net::SocketAddress& remote);
    [[nodiscard]] Result<std::shared_ptr<ConnectionState>, TransportFailure> CreateConnection(
        tls::TlsRole role, const net::SocketAddress& remote, const std::optional<ngtcp2_pkt_hd>& initial_header);
    void Register(const std::shared_ptr<ConnectionState>& state);
    [[nodiscard]] std::optional<Timestamp> NextDeadline() const;
    void OnDeadline();
    void CloseAllOnLoop();
    void HandleSocketFailure(const TransportFailure& failure);

    net::SocketAddress local_;
    net::UdpSocket socket_;
    std::shared_ptr<EventLoop> loop_;
    std::shared_ptr<const identity::IdentityKeyPair> identity_;
    configuration::TransportConfig config_;
    std::shared_ptr<const interfaces::ICertificateVerifier> verifier_;
    TlsContexts contexts_;
    std::vector<uint8_t> reset_secret_;

    std::unordered_map<std::string, std::shared_ptr<ConnectionState>> by_cid_;
    std::unordered_set<std::shared_ptr<ConnectionState>> connections_;
    std::vector<uint8_t> receive_buffer_;
    bool socket_failed_ = false;

    mutable std::mutex accept_mutex_;
    std::condition_variable_any accept_changed_;
    std::deque<std::shared_ptr<ConnectionState>> accept_queue_;
    bool listening_ = false;
    size_t listener_count_ = 0;
    std::atomic<bool> closed_{false};
};

}
