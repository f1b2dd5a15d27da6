#include "peerquic/net/socket_address.hpp"

#include <arpa/inet.h>

#include <fmt/core.h>

#include <cstring>

namespace peerquic::net {

SocketAddress::SocketAddress() noexcept
    : storage_{} {
}

Result<SocketAddress, TransportFailure> SocketAddress::FromIp(const std::string_view ip, const uint16_t port) {
    const std::string text(ip);
    SocketAddress address;
    auto* v4 = reinterpret_cast<sockaddr_in*>(&address.storage_);
    if (inet_pton(AF_INET, text.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(port);
        return Result<SocketAddress, TransportFailure>::Ok(address);
    }
    address.storage_ = {};
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&address.storage_);
    if (inet_pton(AF_INET6, text.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(port);
        return Result<SocketAddress, TransportFailure>::Ok(address);
    }
    return Result<SocketAddress, TransportFailure>::Err(
        TransportFailure::InvalidAddress(fmt::format("'{}' is not an IP address", ip)));
}

Result<SocketAddress, TransportFailure> SocketAddress::Parse(const std::string_view host_port) {
    std::string_view host;
    std::string_view port_text;
    if (!host_port.empty() && host_port.front() == '[') {
        const size_t close = host_port.find(']');
        if (close == std::string_view::npos || close + 1 >= host_port.size() || host_port[close + 1] != ':') {
            return Result<SocketAddress, TransportFailure>::Err(
                TransportFailure::InvalidAddress(fmt::format("'{}' is not [ip]:port", host_port)));
        }
        host = host_port.substr(1, close - 1);
        port_text = host_port.substr(close + 2);
    } else {
        const size_t colon = host_port.rfind(':');
        if (colon == std::string_view::npos || host_port.find(':') != colon) {
            return Result<SocketAddress, TransportFailure>::Err(
                TransportFailure::InvalidAddress(fmt::format("'{}' is not ip:port", host_port)));
        }
        host = host_port.substr(0, colon);
        port_text = host_port.substr(colon + 1);
    }

    if (port_text.empty() || port_text.size() > 5) {
        return Result<SocketAddress, TransportFailure>::Err(
            TransportFailure::InvalidAddress(fmt::format("'{}' has no valid port", host_port)));
    }
    uint32_t port = 0;
    for (const char c : port_text) {
        if (c < '0' || c > '9') {
            return Result<SocketAddress, TransportFailure>::Err(
                TransportFailure::InvalidAddress(fmt::format("'{}' has no valid port", host_port)));
        }
        port = port * 10 + static_cast<uint32_t>(c - '0');
    }
    if (port > 0xFFFF) {
        return Result<SocketAddress, TransportFailure>::Err(
            TransportFailure::InvalidAddress(fmt::format("Port {} is out of range", port)));
    }
    return FromIp(host, static_cast<uint16_t>(port));
}

Result<SocketAddress, TransportFailure> SocketAddress::FromSockaddr(const sockaddr* addr, const socklen_t length) {
    SocketAddress address;
    if (addr != nullptr && addr->sa_family == AF_INET && length >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
        std::memcpy(&address.storage_, addr, sizeof(sockaddr_in));
        return Result<SocketAddress, TransportFailure>::Ok(address);
    }
    if (addr != nullptr && addr->sa_family == AF_INET6 && length >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
        std::memcpy(&address.storage_, addr, sizeof(sockaddr_in6));
        return Result<SocketAddress, TransportFailure>::Ok(address);
    }
    return Result<SocketAddress, TransportFailure>::Err(
        TransportFailure::InvalidAddress("Socket address is neither IPv4 nor IPv6"));
}

SocketAddress SocketAddress::Unspecified(const AddressFamily family, const uint16_t port) noexcept {
    SocketAddress address;
    if (family == AddressFamily::IPv4) {
        auto* v4 = reinterpret_cast<sockaddr_in*>(&address.storage_);
        v4->sin_family = AF_INET;
        v4->sin_addr.s_addr = htonl(INADDR_ANY);
        v4->sin_port = htons(port);
    } else {
        auto* v6 = reinterpret_cast<sockaddr_in6*>(&address.storage_);
        v6->sin6_family = AF_INET6;
        v6->sin6_addr = in6addr_any;
        v6->sin6_port = htons(port);
    }
    return address;
}

AddressFamily SocketAddress::GetFamily() const noexcept {
    return storage_.ss_family == AF_INET6 ? AddressFamily::IPv6 : AddressFamily::IPv4;
}

uint16_t SocketAddress::GetPort() const noexcept {
    if (storage_.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&storage_)->sin_port);
}

bool SocketAddress::IsUnspecified() const noexcept {
    if (storage_.ss_family == AF_INET6) {
        return IN6_IS_ADDR_UNSPECIFIED(&reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_addr);
    }
    return reinterpret_cast<const sockaddr_in*>(&storage_)->sin_addr.s_addr == htonl(INADDR_ANY);
}

SocketAddress SocketAddress::WithPort(const uint16_t port) const noexcept {
    SocketAddress copy = *this;
    if (storage_.ss_family == AF_INET6) {
        reinterpret_cast<sockaddr_in6*>(&copy.storage_)->sin6_port = htons(port);
    } else {
        reinterpret_cast<sockaddr_in*>(&copy.storage_)->sin_port = htons(port);
    }
    return copy;
}

socklen_t SocketAddress::GetLength() const noexcept {
    return storage_.ss_family == AF_INET6 ? sizeof(sockaddr_in6) : sizeof(sockaddr_in);
}

std::string SocketAddress::IpString() const {
    char buffer[INET6_ADDRSTRLEN] = {};
    if (storage_.ss_family == AF_INET6) {
        inet_ntop(AF_INET6, &reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_addr, buffer, sizeof(buffer));
    } else {
        inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(&storage_)->sin_addr, buffer, sizeof(buffer));
    }
    return buffer;
}

std::string SocketAddress::ToString() const {
    if (storage_.ss_family == AF_INET6) {
        return fmt::format("[{}]:{}", IpString(), GetPort());
    }
    return fmt::format("{}:{}", IpString(), GetPort());
}

bool SocketAddress::operator==(const SocketAddress& other) const noexcept {
    if (storage_.ss_family != other.storage_.ss_family || GetPort() != other.GetPort()) {
        return false;
    }
    if (storage_.ss_family == AF_INET6) {
        return std::memcmp(&reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_addr,
                           &reinterpret_cast<const sockaddr_in6*>(&other.storage_)->sin6_addr,
                           sizeof(in6_addr)) == 0;
    }
    return reinterpret_cast<const sockaddr_in*>(&storage_)->sin_addr.s_addr ==
           reinterpret_cast<const sockaddr_in*>(&other.storage_)->sin_addr.s_addr;
}

bool SocketAddress::operator<(const SocketAddress& other) const noexcept {
    if (storage_.ss_family != other.storage_.ss_family) {
        return storage_.ss_family < other.storage_.ss_family;
    }
    int cmp = 0;
    if (storage_.ss_family == AF_INET6) {
        cmp = std::memcmp(&reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_addr,
                          &reinterpret_cast<const sockaddr_in6*>(&other.storage_)->sin6_addr,
                          sizeof(in6_addr));
    } else {
        cmp = std::memcmp(&reinterpret_cast<const sockaddr_in*>(&storage_)->sin_addr,
                          &reinterpret_cast<const sockaddr_in*>(&other.storage_)->sin_addr,
                          sizeof(in_addr));
    }
    if (cmp != 0) {
        return cmp < 0;
    }
    return GetPort() < other.GetPort();
}

}
