#include "peerquic/net/udp_socket.hpp"
#include "peerquic/debug/logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

#include <cerrno>
#include <cstring>

namespace peerquic::net {

namespace {

constexpr std::string_view kComponent = "udp";

// Errors that concern one datagram or one destination; the socket stays usable.
bool IsTransientError(const int error) noexcept {
    switch (error) {
        case EAGAIN:
#if EAGAIN != EWOULDBLOCK
        case EWOULDBLOCK:
#endif
        case EINTR:
        case ECONNREFUSED:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case EMSGSIZE:
        case ENOBUFS:
        case EPERM:
            return true;
        default:
            return false;
    }
}

TransportFailure SocketFailure(const std::string_view what, const int error) {
    return TransportFailure::Socket(fmt::format("{}: {}", what, std::strerror(error)));
}

}

Result<UdpSocket, TransportFailure> UdpSocket::Bind(const SocketAddress& local) {
    const int family = local.GetFamily() == AddressFamily::IPv6 ? AF_INET6 : AF_INET;
    const int fd = ::socket(family, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Result<UdpSocket, TransportFailure>::Err(SocketFailure("socket() failed", errno));
    }

    if (family == AF_INET6) {
        int on = 1;
        if (setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &on, sizeof(on)) != 0) {
            const int error = errno;
            ::close(fd);
            return Result<UdpSocket, TransportFailure>::Err(SocketFailure("IPV6_V6ONLY failed", error));
        }
    }

    const int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
        const int error = errno;
        ::close(fd);
        return Result<UdpSocket, TransportFailure>::Err(SocketFailure("O_NONBLOCK failed", error));
    }

    if (::bind(fd, local.GetSockaddr(), local.GetLength()) != 0) {
        const int error = errno;
        ::close(fd);
        return Result<UdpSocket, TransportFailure>::Err(
            SocketFailure(fmt::format("bind({}) failed", local.ToString()), error));
    }

    sockaddr_storage bound{};
    socklen_t bound_length = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_length) != 0) {
        const int error = errno;
        ::close(fd);
        return Result<UdpSocket, TransportFailure>::Err(SocketFailure("getsockname() failed", error));
    }
    auto bound_address = SocketAddress::FromSockaddr(reinterpret_cast<sockaddr*>(&bound), bound_length);
    if (bound_address.IsErr()) {
        ::close(fd);
        return Result<UdpSocket, TransportFailure>::Err(std::move(bound_address).UnwrapErr());
    }

    PEERQUIC_LOG_DEBUG(kComponent, "bound {}", bound_address.Unwrap().ToString());
    return Result<UdpSocket, TransportFailure>::Ok(UdpSocket(fd, bound_address.Unwrap()));
}

UdpSocket::~UdpSocket() {
    Close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : fd_(other.fd_)
    , local_(other.local_) {
    other.fd_ = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        local_ = other.local_;
        other.fd_ = -1;
    }
    return *this;
}

void UdpSocket::Close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<std::optional<ReceivedDatagram>, TransportFailure> UdpSocket::ReceiveFrom(const std::span<uint8_t> buffer) {
    using ReceiveResult = Result<std::optional<ReceivedDatagram>, TransportFailure>;
    for (;;) {
        sockaddr_storage remote{};
        socklen_t remote_length = sizeof(remote);
        const ssize_t received = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                            reinterpret_cast<sockaddr*>(&remote), &remote_length);
        if (received < 0) {
            const int error = errno;
            if (error == EINTR) {
                continue;
            }
            if (error == EAGAIN || error == EWOULDBLOCK) {
                return ReceiveResult::Ok(std::nullopt);
            }
            if (IsTransientError(error)) {
                // ICMP errors surface on the next read; the datagram they refer to is gone.
                PEERQUIC_LOG_DEBUG(kComponent, "recvfrom: {}", std::strerror(error));
                continue;
            }
            return ReceiveResult::Err(SocketFailure("recvfrom() failed", error));
        }
        auto address = SocketAddress::FromSockaddr(reinterpret_cast<sockaddr*>(&remote), remote_length);
        if (address.IsErr()) {
            continue;
        }
        return ReceiveResult::Ok(ReceivedDatagram{static_cast<size_t>(received), address.Unwrap()});
    }
}

Result<bool, TransportFailure> UdpSocket::SendTo(const std::span<const uint8_t> datagram, const SocketAddress& remote) {
    for (;;) {
        const ssize_t sent = ::sendto(fd_, datagram.data(), datagram.size(), 0,
                                      remote.GetSockaddr(), remote.GetLength());
        if (sent >= 0) {
            return Result<bool, TransportFailure>::Ok(true);
        }
        const int error = errno;
        if (error == EINTR) {
            continue;
        }
        if (IsTransientError(error)) {
            PEERQUIC_LOG_DEBUG(kComponent, "sendto {} dropped: {}", remote.ToString(), std::strerror(error));
            return Result<bool, TransportFailure>::Ok(false);
        }
        return Result<bool, TransportFailure>::Err(SocketFailure("sendto() failed", error));
    }
}

}
