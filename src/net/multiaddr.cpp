#include "peerquic/net/multiaddr.hpp"

#include <fmt/core.h>

#include <vector>

namespace peerquic::net {

namespace {

std::vector<std::string_view> SplitComponents(std::string_view text) {
    std::vector<std::string_view> parts;
    while (!text.empty()) {
        const size_t slash = text.find('/');
        parts.push_back(text.substr(0, slash));
        if (slash == std::string_view::npos) {
            break;
        }
        text.remove_prefix(slash + 1);
    }
    return parts;
}

TransportFailure NotQuic(const std::string_view multiaddr) {
    return TransportFailure::InvalidAddress(fmt::format("'{}' is not a QUIC multiaddr", multiaddr));
}

}

Result<SocketAddress, TransportFailure> Multiaddr::ToSocketAddress(const std::string_view multiaddr) {
    if (multiaddr.empty() || multiaddr.front() != '/') {
        return Result<SocketAddress, TransportFailure>::Err(NotQuic(multiaddr));
    }
    const auto parts = SplitComponents(multiaddr.substr(1));
    if (parts.size() != 5 || parts[2] != "udp" || parts[4] != "quic") {
        return Result<SocketAddress, TransportFailure>::Err(NotQuic(multiaddr));
    }

    AddressFamily expected;
    if (parts[0] == "ip4") {
        expected = AddressFamily::IPv4;
    } else if (parts[0] == "ip6") {
        expected = AddressFamily::IPv6;
    } else {
        return Result<SocketAddress, TransportFailure>::Err(NotQuic(multiaddr));
    }

    const std::string host_port = expected == AddressFamily::IPv6
        ? fmt::format("[{}]:{}", parts[1], parts[3])
        : fmt::format("{}:{}", parts[1], parts[3]);
    auto address = SocketAddress::Parse(host_port);
    if (address.IsErr()) {
        return address;
    }
    if (address.Unwrap().GetFamily() != expected) {
        return Result<SocketAddress, TransportFailure>::Err(TransportFailure::InvalidAddress(
            fmt::format("'{}' does not match its {} protocol", parts[1], parts[0])));
    }
    return address;
}

std::string Multiaddr::FromSocketAddress(const SocketAddress& address) {
    return fmt::format("/{}/{}/udp/{}/quic",
                       address.GetFamily() == AddressFamily::IPv6 ? "ip6" : "ip4",
                       address.IpString(), address.GetPort());
}

}
