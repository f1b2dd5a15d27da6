#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/configuration/transport_config.hpp"
#include "peerquic/identity/identity_keypair.hpp"
#include "peerquic/interfaces/i_certificate_verifier.hpp"
#include "peerquic/net/socket_address.hpp"
#include "peerquic/quic/connection.hpp"
#include "peerquic/quic/endpoint.hpp"
#include "peerquic/transport/listener.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string_view>

namespace peerquic::transport {

/**
 * @brief Dial and listen surface of the QUIC transport
 *
 * Holds the node's identity for its whole lifetime and one Endpoint per
 * bound local address. Addresses are socket addresses or multiaddrs of the
 * form /ip4|ip6/<addr>/udp/<port>/quic.
 *
 * Example:
 * ```cpp
 * auto identity = std::make_shared<const IdentityKeyPair>(IdentityKeyPair::Generate().Unwrap());
 * QuicTransport transport(identity);
 * auto listener = transport.Listen("/ip4/0.0.0.0/udp/4001/quic").Unwrap();
 * auto connection = listener->Next().Unwrap();
 * ```
 */
class QuicTransport {
public:
    explicit QuicTransport(std::shared_ptr<const identity::IdentityKeyPair> identity,
                           const configuration::TransportConfig& config = configuration::TransportConfig::Default(),
                           std::shared_ptr<const interfaces::ICertificateVerifier> verifier = nullptr);

    ~QuicTransport();

    QuicTransport(const QuicTransport&) = delete;
    QuicTransport& operator=(const QuicTransport&) = delete;

    /// Bind, or reuse the Endpoint already bound to address, and listen on it
    [[nodiscard]] Result<std::unique_ptr<Listener>, TransportFailure> Listen(const net::SocketAddress& address);

    [[nodiscard]] Result<std::unique_ptr<Listener>, TransportFailure> Listen(std::string_view multiaddr);

    /**
     * @brief Connect to a peer and authenticate it
     *
     * Reuses an Endpoint of the remote's family bound to the unspecified
     * address (listening ones first), otherwise binds a new one on an
     * ephemeral port.
     */
    [[nodiscard]] Result<std::shared_ptr<quic::Connection>, TransportFailure> Dial(
        const net::SocketAddress& address, std::stop_token stop = {});

    [[nodiscard]] Result<std::shared_ptr<quic::Connection>, TransportFailure> Dial(
        std::string_view multiaddr, std::stop_token stop = {});

    [[nodiscard]] const identity::PeerId& GetLocalPeerId() const noexcept {
        return identity_->GetPeerId();
    }

    /// Close every Endpoint and with them every connection
    void Close();

private:
    [[nodiscard]] Result<std::shared_ptr<quic::Endpoint>, TransportFailure> BindLocked(
        const net::SocketAddress& address);

    [[nodiscard]] Result<std::shared_ptr<quic::Endpoint>, TransportFailure> EndpointForDial(
        const net::SocketAddress& remote);

    std::shared_ptr<const identity::IdentityKeyPair> identity_;
    configuration::TransportConfig config_;
    std::shared_ptr<const interfaces::ICertificateVerifier> verifier_;

    std::mutex mutex_;
    std::map<net::SocketAddress, std::shared_ptr<quic::Endpoint>> endpoints_;
};

}
