#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/net/socket_address.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace peerquic::net {

struct ReceivedDatagram {
    size_t length;
    SocketAddress remote;
};

/**
 * @brief Non-blocking UDP socket bound to one local address
 *
 * IPv6 sockets are v6-only, so every socket serves exactly one address
 * family. Owned and driven by a single Endpoint loop thread.
 */
class UdpSocket {
public:
    [[nodiscard]] static Result<UdpSocket, TransportFailure> Bind(const SocketAddress& local);

    ~UdpSocket();

    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /**
     * @brief Read one datagram into buffer
     *
     * @return nullopt when nothing is pending; Socket failure only for
     *         errors that make the socket unusable
     */
    [[nodiscard]] Result<std::optional<ReceivedDatagram>, TransportFailure> ReceiveFrom(std::span<uint8_t> buffer);

    /**
     * @return false when the datagram was dropped (would block, or a
     *         transient per-destination error)
     */
    [[nodiscard]] Result<bool, TransportFailure> SendTo(std::span<const uint8_t> datagram, const SocketAddress& remote);

    void Close() noexcept;

    [[nodiscard]] bool IsOpen() const noexcept {
        return fd_ >= 0;
    }
    [[nodiscard]] int GetDescriptor() const noexcept {
        return fd_;
    }
    [[nodiscard]] const SocketAddress& GetLocalAddress() const noexcept {
        return local_;
    }

private:
    UdpSocket(int fd, SocketAddress local) noexcept
        : fd_(fd), local_(local) {}

    int fd_;
    SocketAddress local_;
};

}
