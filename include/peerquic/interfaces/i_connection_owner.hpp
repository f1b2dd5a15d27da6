#pragma once
#include <cstdint>
#include <memory>
#include <span>
namespace peerquic::quic {
class ConnectionState;
}
namespace peerquic::interfaces {
/**
 * @brief What a ConnectionState needs from the Endpoint that owns it
 *
 * Called on the endpoint loop thread only.
 */
class IConnectionOwner {
public:
    virtual ~IConnectionOwner() = default;

    virtual void SendDatagram(std::span<const uint8_t> datagram, const quic::ConnectionState& from) = 0;

    virtual void OnConnectionIdIssued(std::span<const uint8_t> cid,
                                      const std::shared_ptr<quic::ConnectionState>& state) = 0;

    virtual void OnConnectionIdRetired(std::span<const uint8_t> cid) = 0;

    virtual void OnConnectionEstablished(const std::shared_ptr<quic::ConnectionState>& state) = 0;

    /// The connection reached Closed or Failed and must be forgotten
    virtual void OnConnectionTerminated(const std::shared_ptr<quic::ConnectionState>& state) = 0;
};
}
