#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace peerquic::net {

enum class AddressFamily : uint8_t {
    IPv4,
    IPv6
};

/**
 * @brief IPv4 or IPv6 address plus UDP port, stored as a sockaddr
 */
class SocketAddress {
public:
    /// ip is a numeric IPv4 or IPv6 literal, no brackets
    [[nodiscard]] static Result<SocketAddress, TransportFailure> FromIp(std::string_view ip, uint16_t port);

    /// "a.b.c.d:port" or "[v6]:port"
    [[nodiscard]] static Result<SocketAddress, TransportFailure> Parse(std::string_view host_port);

    [[nodiscard]] static Result<SocketAddress, TransportFailure> FromSockaddr(const sockaddr* addr, socklen_t length);

    /// 0.0.0.0 or ::
    [[nodiscard]] static SocketAddress Unspecified(AddressFamily family, uint16_t port = 0) noexcept;

    [[nodiscard]] AddressFamily GetFamily() const noexcept;
    [[nodiscard]] uint16_t GetPort() const noexcept;
    [[nodiscard]] bool IsUnspecified() const noexcept;
    [[nodiscard]] SocketAddress WithPort(uint16_t port) const noexcept;

    [[nodiscard]] const sockaddr* GetSockaddr() const noexcept {
        return reinterpret_cast<const sockaddr*>(&storage_);
    }
    [[nodiscard]] socklen_t GetLength() const noexcept;

    [[nodiscard]] std::string IpString() const;
    [[nodiscard]] std::string ToString() const;

    bool operator==(const SocketAddress& other) const noexcept;
    bool operator!=(const SocketAddress& other) const noexcept {
        return !(*this == other);
    }
    bool operator<(const SocketAddress& other) const noexcept;

private:
    SocketAddress() noexcept;

    sockaddr_storage storage_;
};

}

template<>
struct std::hash<peerquic::net::SocketAddress> {
    size_t operator()(const peerquic::net::SocketAddress& address) const noexcept {
        return std::hash<std::string>{}(address.ToString());
    }
};
