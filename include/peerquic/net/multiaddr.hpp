#pragma once
#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/net/socket_address.hpp"
#include <string>
#include <string_view>
namespace peerquic::net {
/**
 * @brief Textual multiaddr form of a QUIC socket address
 *
 * Only the exact shapes /ip4/<a>/udp/<port>/quic and /ip6/<a>/udp/<port>/quic
 * are understood; anything else is InvalidAddress.
 */
class Multiaddr {
public:
    [[nodiscard]] static Result<SocketAddress, TransportFailure> ToSocketAddress(std::string_view multiaddr);
    [[nodiscard]] static std::string FromSocketAddress(const SocketAddress& address);
private:
    Multiaddr() = delete;
};
}
