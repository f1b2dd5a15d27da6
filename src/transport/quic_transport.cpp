#include "peerquic/transport/quic_transport.hpp"
#include "peerquic/debug/logger.hpp"
#include "peerquic/net/multiaddr.hpp"

#include <fmt/core.h>

#include <vector>

namespace peerquic::transport {

namespace {

constexpr std::string_view kComponent = "transport";

}

QuicTransport::QuicTransport(std::shared_ptr<const identity::IdentityKeyPair> identity,
                             const configuration::TransportConfig& config,
                             std::shared_ptr<const interfaces::ICertificateVerifier> verifier)
    : identity_(std::move(identity))
    , config_(config)
    , verifier_(std::move(verifier)) {
}

QuicTransport::~QuicTransport() {
    Close();
}

Result<std::unique_ptr<Listener>, TransportFailure> QuicTransport::Listen(const net::SocketAddress& address) {
    std::lock_guard lock(mutex_);

    std::shared_ptr<quic::Endpoint> endpoint;
    if (const auto it = endpoints_.find(address); address.GetPort() != 0 && it != endpoints_.end()) {
        if (!it->second->IsClosed()) {
            endpoint = it->second;
        } else {
            endpoints_.erase(it);
        }
    }
    if (!endpoint) {
        auto bound = BindLocked(address);
        if (bound.IsErr()) {
            return Result<std::unique_ptr<Listener>, TransportFailure>::Err(std::move(bound).UnwrapErr());
        }
        endpoint = std::move(bound).Unwrap();
    }

    PEERQUIC_LOG_INFO(kComponent, "listening on {}", net::Multiaddr::FromSocketAddress(endpoint->GetLocalAddress()));
    return Result<std::unique_ptr<Listener>, TransportFailure>::Ok(std::make_unique<Listener>(std::move(endpoint)));
}

Result<std::unique_ptr<Listener>, TransportFailure> QuicTransport::Listen(const std::string_view multiaddr) {
    auto address = net::Multiaddr::ToSocketAddress(multiaddr);
    if (address.IsErr()) {
        return Result<std::unique_ptr<Listener>, TransportFailure>::Err(std::move(address).UnwrapErr());
    }
    return Listen(address.Unwrap());
}

Result<std::shared_ptr<quic::Connection>, TransportFailure> QuicTransport::Dial(
    const net::SocketAddress& address, std::stop_token stop) {
    using ResultType = Result<std::shared_ptr<quic::Connection>, TransportFailure>;

    if (address.GetPort() == 0 || address.IsUnspecified()) {
        return ResultType::Err(TransportFailure::InvalidAddress(
            fmt::format("cannot dial {}: unspecified address or port", address.ToString())));
    }

    auto endpoint = EndpointForDial(address);
    if (endpoint.IsErr()) {
        return ResultType::Err(std::move(endpoint).UnwrapErr());
    }
    return endpoint.Unwrap()->Dial(address, std::move(stop));
}

Result<std::shared_ptr<quic::Connection>, TransportFailure> QuicTransport::Dial(
    const std::string_view multiaddr, std::stop_token stop) {
    auto address = net::Multiaddr::ToSocketAddress(multiaddr);
    if (address.IsErr()) {
        return Result<std::shared_ptr<quic::Connection>, TransportFailure>::Err(std::move(address).UnwrapErr());
    }
    return Dial(address.Unwrap(), std::move(stop));
}

void QuicTransport::Close() {
    std::map<net::SocketAddress, std::shared_ptr<quic::Endpoint>> endpoints;
    {
        std::lock_guard lock(mutex_);
        endpoints.swap(endpoints_);
    }
    for (const auto& [address, endpoint] : endpoints) {
        endpoint->Close();
    }
}

Result<std::shared_ptr<quic::Endpoint>, TransportFailure> QuicTransport::BindLocked(const net::SocketAddress& address) {
    auto bound = quic::Endpoint::Bind(address, identity_, config_, verifier_);
    if (bound.IsErr()) {
        return bound;
    }
    const std::shared_ptr<quic::Endpoint>& endpoint = bound.Unwrap();
    endpoints_.insert_or_assign(endpoint->GetLocalAddress(), endpoint);
    return bound;
}

Result<std::shared_ptr<quic::Endpoint>, TransportFailure> QuicTransport::EndpointForDial(const net::SocketAddress& remote) {
    std::lock_guard lock(mutex_);

    std::shared_ptr<quic::Endpoint> fallback;
    for (auto it = endpoints_.begin(); it != endpoints_.end();) {
        const std::shared_ptr<quic::Endpoint>& endpoint = it->second;
        if (endpoint->IsClosed()) {
            it = endpoints_.erase(it);
            continue;
        }
        const net::SocketAddress& local = endpoint->GetLocalAddress();
        if (local.GetFamily() == remote.GetFamily() && local.IsUnspecified()) {
            if (endpoint->IsListening()) {
                return Result<std::shared_ptr<quic::Endpoint>, TransportFailure>::Ok(endpoint);
            }
            if (!fallback) {
                fallback = endpoint;
            }
        }
        ++it;
    }
    if (fallback) {
        return Result<std::shared_ptr<quic::Endpoint>, TransportFailure>::Ok(std::move(fallback));
    }
    return BindLocked(net::SocketAddress::Unspecified(remote.GetFamily()));
}

}
