#pragma once

#include "peerquic/interfaces/i_stream_muxer.hpp"
#include "peerquic/quic/connection_state.hpp"
#include "peerquic/quic/event_loop.hpp"

#include <memory>

namespace peerquic::quic {

/**
 * @brief Application handle of an Established connection
 *
 * Closes the connection when destroyed. Streams opened from it keep the
 * connection state alive but fail with ConnectionClosed once it is closed.
 */
class Connection final : public interfaces::IStreamMuxer {
public:
    Connection(std::shared_ptr<ConnectionState> state, std::shared_ptr<EventLoop> loop,
               identity::PeerId remote_identity);

    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] Result<std::unique_ptr<interfaces::IStream>, TransportFailure> OpenStream() override;

    [[nodiscard]] Result<std::unique_ptr<interfaces::IStream>, TransportFailure> AcceptStream(
        std::stop_token stop = {}) override;

    void Close() override;

    [[nodiscard]] const identity::PeerId& RemoteIdentity() const noexcept override {
        return remote_identity_;
    }

    [[nodiscard]] const net::SocketAddress& LocalAddress() const noexcept override {
        return state_->GetLocalAddress();
    }

    [[nodiscard]] const net::SocketAddress& RemoteAddress() const noexcept override {
        return state_->GetRemoteAddress();
    }

    [[nodiscard]] ConnectionStatus GetStatus() const {
        return state_->GetStatus();
    }

private:
    std::shared_ptr<ConnectionState> state_;
    std::shared_ptr<EventLoop> loop_;
    identity::PeerId remote_identity_;
};

}
