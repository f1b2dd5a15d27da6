#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/quic/connection.hpp"
#include "peerquic/quic/endpoint.hpp"

#include <atomic>
#include <memory>
#include <stop_token>
#include <string>

namespace peerquic::transport {

/**
 * @brief Endless sequence of inbound connections on one Endpoint
 *
 * Next() can be called again and again; it only ever fails with
 * ListenerClosed (after Close or endpoint shutdown) or Cancelled.
 * Failed inbound handshakes never surface here. Several Listeners on one
 * address share the Endpoint and its accept queue; closing one leaves
 * the others accepting.
 */
class Listener {
public:
    explicit Listener(std::shared_ptr<quic::Endpoint> endpoint);

    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    [[nodiscard]] Result<std::shared_ptr<quic::Connection>, TransportFailure> Next(std::stop_token stop = {});

    /// Wakes blocked Next() calls; connections already returned stay open
    void Close();

    [[nodiscard]] const net::SocketAddress& GetLocalAddress() const noexcept {
        return endpoint_->GetLocalAddress();
    }

    [[nodiscard]] std::string GetMultiaddr() const;

private:
    std::shared_ptr<quic::Endpoint> endpoint_;
    std::stop_source closing_;
    std::atomic<bool> closed_{false};
};

}
