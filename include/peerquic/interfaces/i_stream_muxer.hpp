#pragma once
#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/identity/peer_id.hpp"
#include "peerquic/net/socket_address.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <stop_token>
namespace peerquic::interfaces {

/// One bidirectional byte stream of a multiplexed connection
class IStream {
public:
    virtual ~IStream() = default;

    [[nodiscard]] virtual int64_t GetId() const noexcept = 0;

    /**
     * @brief Blocks until data, end of stream or connection close
     * @return bytes read; 0 once the peer finished the stream.
     *         InvalidArgument for an empty buffer.
     */
    [[nodiscard]] virtual Result<size_t, TransportFailure> Read(
        std::span<uint8_t> buffer, std::stop_token stop = {}) = 0;

    [[nodiscard]] virtual Result<Unit, TransportFailure> Write(
        std::span<const uint8_t> data, std::stop_token stop = {}) = 0;

    /// Finish the write side; the read side stays open
    [[nodiscard]] virtual Result<Unit, TransportFailure> Close() = 0;

    /// Abort both directions
    [[nodiscard]] virtual Result<Unit, TransportFailure> Reset(uint64_t app_error_code) = 0;
};

/// An authenticated connection carrying any number of streams
class IStreamMuxer {
public:
    virtual ~IStreamMuxer() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<IStream>, TransportFailure> OpenStream() = 0;

    [[nodiscard]] virtual Result<std::unique_ptr<IStream>, TransportFailure> AcceptStream(
        std::stop_token stop = {}) = 0;

    virtual void Close() = 0;

    [[nodiscard]] virtual const identity::PeerId& RemoteIdentity() const noexcept = 0;

    [[nodiscard]] virtual const net::SocketAddress& LocalAddress() const noexcept = 0;

    [[nodiscard]] virtual const net::SocketAddress& RemoteAddress() const noexcept = 0;
};

}
