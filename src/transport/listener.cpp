#include "peerquic/transport/listener.hpp"
#include "peerquic/net/multiaddr.hpp"

namespace peerquic::transport {

Listener::Listener(std::shared_ptr<quic::Endpoint> endpoint)
    : endpoint_(std::move(endpoint)) {
    endpoint_->Listen();
}

Listener::~Listener() {
    Close();
}

Result<std::shared_ptr<quic::Connection>, TransportFailure> Listener::Next(std::stop_token stop) {
    if (closed_.load(std::memory_order_acquire)) {
        return Result<std::shared_ptr<quic::Connection>, TransportFailure>::Err(
            TransportFailure::ListenerClosed("listener is closed"));
    }
    // Close() must wake this call even while the Endpoint keeps listening for others.
    std::stop_source wake;
    const std::stop_callback on_caller_stop(stop, [&wake]() { wake.request_stop(); });
    const std::stop_callback on_close(closing_.get_token(), [&wake]() { wake.request_stop(); });

    auto accepted = endpoint_->Accept(wake.get_token());
    if (accepted.IsErr() && accepted.UnwrapErr().type == TransportFailureType::Cancelled &&
        closed_.load(std::memory_order_acquire)) {
        return Result<std::shared_ptr<quic::Connection>, TransportFailure>::Err(
            TransportFailure::ListenerClosed("listener is closed"));
    }
    return accepted;
}

void Listener::Close() {
    if (!closed_.exchange(true)) {
        closing_.request_stop();
        endpoint_->StopListening();
    }
}

std::string Listener::GetMultiaddr() const {
    return net::Multiaddr::FromSocketAddress(endpoint_->GetLocalAddress());
}

}
