#include "peerquic/quic/endpoint.hpp"
#include "peerquic/core/constants.hpp"
#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/debug/logger.hpp"
#include "peerquic/tls/certificate_verifier.hpp"
#include "peerquic/tls/identity_certificate.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace peerquic::quic {

namespace {

constexpr std::string_view kComponent = "endpoint";
constexpr size_t kResetSecretBytes = 32;

std::string ConnectionIdKey(const uint8_t* data, const size_t length) {
    return std::string(reinterpret_cast<const char*>(data), length);
}

}

// ============================================================================
// Construction
// ============================================================================

Result<Endpoint::TlsContexts, TransportFailure> Endpoint::BuildTlsContexts(
    const identity::IdentityKeyPair& identity,
    const std::shared_ptr<const interfaces::ICertificateVerifier>& verifier) {
    auto material_result = tls::IdentityCertificate::Generate(identity)
        .MapErr(&TransportFailure::FromCertificateFailure);
    if (material_result.IsErr()) {
        return Result<TlsContexts, TransportFailure>::Err(std::move(material_result).UnwrapErr());
    }
    const tls::CertificateMaterial& material = material_result.Unwrap();

    auto client = tls::TlsContext::Create(tls::TlsRole::Client, material, verifier);
    if (client.IsErr()) {
        return Result<TlsContexts, TransportFailure>::Err(std::move(client).UnwrapErr());
    }
    auto server = tls::TlsContext::Create(tls::TlsRole::Server, material, verifier);
    if (server.IsErr()) {
        return Result<TlsContexts, TransportFailure>::Err(std::move(server).UnwrapErr());
    }
    return Result<TlsContexts, TransportFailure>::Ok(TlsContexts{
        std::make_shared<const tls::TlsContext>(std::move(client).Unwrap()),
        std::make_shared<const tls::TlsContext>(std::move(server).Unwrap())
    });
}

Result<std::shared_ptr<Endpoint>, TransportFailure> Endpoint::Bind(
    const net::SocketAddress& local,
    std::shared_ptr<const identity::IdentityKeyPair> identity,
    const configuration::TransportConfig& config,
    std::shared_ptr<const interfaces::ICertificateVerifier> verifier) {
    using ResultType = Result<std::shared_ptr<Endpoint>, TransportFailure>;

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return ResultType::Err(TransportFailure::FromCertificateFailure(
            CertificateFailure::FromSodiumFailure(init.UnwrapErr())));
    }
    if (!identity) {
        return ResultType::Err(TransportFailure::Engine("endpoint requires an identity keypair"));
    }
    if (!verifier) {
        verifier = std::make_shared<const tls::IdentityBindingVerifier>();
    }

    TlsContexts contexts;
    if (config.GetEphemeralKeyPolicy() == configuration::EphemeralKeyPolicy::PerEndpoint) {
        auto built = BuildTlsContexts(*identity, verifier);
        if (built.IsErr()) {
            return ResultType::Err(std::move(built).UnwrapErr());
        }
        contexts = std::move(built).Unwrap();
    }

    auto socket = net::UdpSocket::Bind(local);
    if (socket.IsErr()) {
        return ResultType::Err(std::move(socket).UnwrapErr());
    }
    auto loop = EventLoop::Create();
    if (loop.IsErr()) {
        return ResultType::Err(std::move(loop).UnwrapErr());
    }

    auto endpoint = std::shared_ptr<Endpoint>(new Endpoint(
        std::move(socket).Unwrap(), std::move(loop).Unwrap(), std::move(identity),
        config, std::move(verifier), std::move(contexts)));

    Endpoint* self = endpoint.get();
    endpoint->loop_->SetReadHandler(endpoint->socket_.GetDescriptor(), [self]() { self->OnReadable(); });
    endpoint->loop_->SetDeadlineHandler(
        [self]() { return self->NextDeadline(); },
        [self]() { self->OnDeadline(); });
    endpoint->loop_->SetFailureHandler([self](const TransportFailure& failure) {
        self->socket_failed_ = true;
        self->HandleSocketFailure(failure);
    });
    endpoint->loop_->Start();

    PEERQUIC_LOG_INFO(kComponent, "endpoint bound to {} as {}",
                      endpoint->local_.ToString(), endpoint->identity_->GetPeerId().ToBase58());
    return ResultType::Ok(std::move(endpoint));
}

Endpoint::Endpoint(net::UdpSocket socket,
                   std::shared_ptr<EventLoop> loop,
                   std::shared_ptr<const identity::IdentityKeyPair> identity,
                   const configuration::TransportConfig& config,
                   std::shared_ptr<const interfaces::ICertificateVerifier> verifier,
                   TlsContexts contexts)
    : local_(socket.GetLocalAddress())
    , socket_(std::move(socket))
    , loop_(std::move(loop))
    , identity_(std::move(identity))
    , config_(config)
    , verifier_(std::move(verifier))
    , contexts_(std::move(contexts))
    , reset_secret_(crypto::SodiumInterop::GetRandomBytes(kResetSecretBytes))
    , receive_buffer_(QuicConstants::RECV_BUFFER_SIZE) {
}

Endpoint::~Endpoint() {
    Close();
}

// ============================================================================
// Application threads
// ============================================================================

Result<std::shared_ptr<Connection>, TransportFailure> Endpoint::Dial(
    const net::SocketAddress& remote, std::stop_token stop) {
    using ResultType = Result<std::shared_ptr<Connection>, TransportFailure>;

    if (IsClosed()) {
        return ResultType::Err(TransportFailure::ConnectionClosed(std::string(ErrorMessages::ENDPOINT_CLOSED)));
    }
    if (remote.GetFamily() != local_.GetFamily()) {
        return ResultType::Err(TransportFailure::AddressFamilyMismatch(fmt::format(
            "cannot dial {} from endpoint bound to {}", remote.ToString(), local_.ToString())));
    }

    auto created = loop_->Invoke([this, &remote]() {
        auto state = CreateConnection(tls::TlsRole::Client, remote, std::nullopt);
        if (state.IsOk()) {
            Register(state.Unwrap());
            state.Unwrap()->Start(Now());
        }
        return state;
    });
    if (!created) {
        return ResultType::Err(TransportFailure::ConnectionClosed(std::string(ErrorMessages::ENDPOINT_CLOSED)));
    }
    if (created->IsErr()) {
        return ResultType::Err(std::move(*created).UnwrapErr());
    }
    std::shared_ptr<ConnectionState> state = std::move(*created).Unwrap();

    auto established = state->WaitEstablished(stop);
    if (established.IsErr()) {
        if (established.UnwrapErr().type == TransportFailureType::Cancelled) {
            const auto closed = loop_->Invoke([&state]() {
                state->CloseOnLoop(QuicConstants::STREAM_CANCELLED_ERROR, Now());
                return true;
            });
            if (!closed) {
                state->Abandon(established.UnwrapErr());
            }
            PEERQUIC_LOG_DEBUG(kComponent, "dial to {} cancelled", remote.ToString());
        }
        return ResultType::Err(std::move(established).UnwrapErr());
    }
    return ResultType::Ok(std::make_shared<Connection>(state, loop_, std::move(established).Unwrap()));
}

void Endpoint::Listen() {
    std::lock_guard lock(accept_mutex_);
    if (!IsClosed()) {
        ++listener_count_;
        listening_ = true;
    }
}

void Endpoint::StopListening() {
    std::deque<std::shared_ptr<ConnectionState>> unclaimed;
    {
        std::lock_guard lock(accept_mutex_);
        if (listener_count_ > 0 && --listener_count_ > 0) {
            return;
        }
        listening_ = false;
        unclaimed.swap(accept_queue_);
    }
    accept_changed_.notify_all();

    for (const auto& state : unclaimed) {
        const auto closed = loop_->Invoke([&state]() {
            state->CloseOnLoop(QuicConstants::APPLICATION_NO_ERROR, Now());
            return true;
        });
        if (!closed) {
            state->Abandon(TransportFailure::ConnectionClosed(std::string(ErrorMessages::ENDPOINT_CLOSED)));
        }
    }
}

Result<std::shared_ptr<Connection>, TransportFailure> Endpoint::Accept(std::stop_token stop) {
    using ResultType = Result<std::shared_ptr<Connection>, TransportFailure>;

    for (;;) {
        std::shared_ptr<ConnectionState> state;
        {
            std::unique_lock lock(accept_mutex_);
            accept_changed_.wait(lock, stop, [this]() {
                return !accept_queue_.empty() || !listening_ || IsClosed();
            });
            if (!listening_ || IsClosed()) {
                return ResultType::Err(TransportFailure::ListenerClosed("listener is closed"));
            }
            if (accept_queue_.empty()) {
                return ResultType::Err(TransportFailure::Cancelled("accept cancelled"));
            }
            state = std::move(accept_queue_.front());
            accept_queue_.pop_front();
        }

        // The peer may have gone away while the connection sat in the queue.
        const auto peer = state->GetRemotePeerId();
        if (peer && state->GetStatus() == ConnectionStatus::Established) {
            return ResultType::Ok(std::make_shared<Connection>(state, loop_, *peer));
        }
    }
}

void Endpoint::Close() {
    closed_.store(true, std::memory_order_release);
    {
        std::lock_guard lock(accept_mutex_);
        listening_ = false;
        listener_count_ = 0;
        accept_queue_.clear();
    }
    accept_changed_.notify_all();

    const auto closed = loop_->Invoke([this]() {
        CloseAllOnLoop();
        return true;
    });
    if (!closed) {
        PEERQUIC_LOG_TRACE(kComponent, "endpoint {} loop already stopped", local_.ToString());
    }
    loop_->Stop();
    socket_.Close();
}

bool Endpoint::IsListening() const {
    std::lock_guard lock(accept_mutex_);
    return listening_;
}

size_t Endpoint::GetConnectionCount() const {
    return loop_->Invoke([this]() { return connections_.size(); }).value_or(0);
}

// ============================================================================
// Loop thread
// ============================================================================

void Endpoint::OnReadable() {
    for (size_t i = 0; i < QuicConstants::MAX_DATAGRAMS_PER_READ; ++i) {
        auto received = socket_.ReceiveFrom(receive_buffer_);
        if (received.IsErr()) {
            HandleSocketFailure(received.UnwrapErr());
            return;
        }
        const auto& datagram = received.Unwrap();
        if (!datagram) {
            return;
        }
        Dispatch(std::span<const uint8_t>(receive_buffer_.data(), datagram->length), datagram->remote);
    }
}

void Endpoint::Dispatch(std::span<const uint8_t> datagram, const net::SocketAddress& remote) {
    ngtcp2_version_cid version_cid{};
    const int rv = ngtcp2_pkt_decode_version_cid(
        &version_cid, datagram.data(), datagram.size(), QuicConstants::SCID_LENGTH);
    if (rv != 0) {
        PEERQUIC_LOG_TRACE(kComponent, "undecodable datagram from {} dropped: {}",
                           remote.ToString(), ngtcp2_strerror(rv));
        return;
    }

    const auto it = by_cid_.find(ConnectionIdKey(version_cid.dcid, version_cid.dcidlen));
    if (it != by_cid_.end()) {
        const std::shared_ptr<ConnectionState> state = it->second;
        state->HandleDatagram(datagram, remote, Now());
        return;
    }

    if (!IsListening()) {
        return;
    }
    ngtcp2_pkt_hd header{};
    if (ngtcp2_accept(&header, datagram.data(), datagram.size()) != 0) {
        PEERQUIC_LOG_TRACE(kComponent, "non-Initial packet for unknown connection {} from {}",
                           debug::Logger::ToHex(std::span<const uint8_t>(version_cid.dcid, version_cid.dcidlen)),
                           remote.ToString());
        return;
    }
    if (remote.GetFamily() != local_.GetFamily()) {
        PEERQUIC_LOG_DEBUG(kComponent, "Initial from {} ignored: address family mismatch", remote.ToString());
        return;
    }

    auto created = CreateConnection(tls::TlsRole::Server, remote, header);
    if (created.IsErr()) {
        PEERQUIC_LOG_WARN(kComponent, "inbound connection from {} not created: {}",
                          remote.ToString(), created.UnwrapErr().message);
        return;
    }
    const std::shared_ptr<ConnectionState> state = std::move(created).Unwrap();
    Register(state);
    by_cid_[ConnectionIdKey(header.dcid.data, header.dcid.datalen)] = state;
    state->HandleDatagram(datagram, remote, Now());
}

Result<std::shared_ptr<ConnectionState>, TransportFailure> Endpoint::CreateConnection(
    const tls::TlsRole role, const net::SocketAddress& remote, const std::optional<ngtcp2_pkt_hd>& initial_header) {
    TlsContexts contexts = contexts_;
    if (config_.GetEphemeralKeyPolicy() == configuration::EphemeralKeyPolicy::PerConnection) {
        auto built = BuildTlsContexts(*identity_, verifier_);
        if (built.IsErr()) {
            return Result<std::shared_ptr<ConnectionState>, TransportFailure>::Err(std::move(built).UnwrapErr());
        }
        contexts = std::move(built).Unwrap();
    }

    const ConnectionSetup setup{
        role,
        role == tls::TlsRole::Client ? contexts.client : contexts.server,
        local_,
        remote,
        config_,
        reset_secret_,
        initial_header,
        this,
        loop_
    };
    return ConnectionState::Create(setup, Now());
}

void Endpoint::Register(const std::shared_ptr<ConnectionState>& state) {
    connections_.insert(state);
    for (const auto& cid : state->GetSourceConnectionIds()) {
        by_cid_[ConnectionIdKey(cid.data(), cid.size())] = state;
    }
}

std::optional<Timestamp> Endpoint::NextDeadline() const {
    std::optional<Timestamp> earliest;
    for (const auto& state : connections_) {
        const auto expiry = state->NextExpiry();
        if (expiry && (!earliest || *expiry < *earliest)) {
            earliest = expiry;
        }
    }
    return earliest;
}

void Endpoint::OnDeadline() {
    const Timestamp now = Now();
    const std::vector<std::shared_ptr<ConnectionState>> due(connections_.begin(), connections_.end());
    for (const auto& state : due) {
        const auto expiry = state->NextExpiry();
        if (expiry && *expiry <= now) {
            state->HandleExpiry(now);
        }
    }
}

void Endpoint::CloseAllOnLoop() {
    const std::vector<std::shared_ptr<ConnectionState>> open(connections_.begin(), connections_.end());
    for (const auto& state : open) {
        state->CloseOnLoop(QuicConstants::APPLICATION_NO_ERROR, Now());
    }
    connections_.clear();
    by_cid_.clear();
}

void Endpoint::HandleSocketFailure(const TransportFailure& failure) {
    PEERQUIC_LOG_ERROR(kComponent, "socket {} failed, closing endpoint: {}", local_.ToString(), failure.message);
    closed_.store(true, std::memory_order_release);
    {
        std::lock_guard lock(accept_mutex_);
        listening_ = false;
        listener_count_ = 0;
        accept_queue_.clear();
    }
    accept_changed_.notify_all();

    for (const auto& state : connections_) {
        state->Abandon(failure);
    }
    connections_.clear();
    by_cid_.clear();
    loop_->Stop();
}

// ============================================================================
// IConnectionOwner
// ============================================================================

void Endpoint::SendDatagram(std::span<const uint8_t> datagram, const ConnectionState& from) {
    if (socket_failed_ || !socket_.IsOpen()) {
        return;
    }
    auto sent = socket_.SendTo(datagram, from.GetRemoteAddress());
    if (sent.IsErr()) {
        // The sender holds its own lock here; tear down from a fresh task.
        socket_failed_ = true;
        TransportFailure failure = std::move(sent).UnwrapErr();
        if (!loop_->Post([this, failure]() { HandleSocketFailure(failure); })) {
            PEERQUIC_LOG_DEBUG(kComponent, "socket failure after loop stop: {}", failure.message);
        }
        return;
    }
    if (!sent.Unwrap()) {
        PEERQUIC_LOG_TRACE(kComponent, "datagram to {} dropped", from.GetRemoteAddress().ToString());
    }
}

void Endpoint::OnConnectionIdIssued(std::span<const uint8_t> cid, const std::shared_ptr<ConnectionState>& state) {
    by_cid_[ConnectionIdKey(cid.data(), cid.size())] = state;
}

void Endpoint::OnConnectionIdRetired(std::span<const uint8_t> cid) {
    by_cid_.erase(ConnectionIdKey(cid.data(), cid.size()));
}

void Endpoint::OnConnectionEstablished(const std::shared_ptr<ConnectionState>& state) {
    if (state->GetRole() != tls::TlsRole::Server) {
        return;
    }
    {
        std::lock_guard lock(accept_mutex_);
        if (listening_) {
            accept_queue_.push_back(state);
            accept_changed_.notify_all();
            return;
        }
    }
    state->CloseOnLoop(QuicConstants::APPLICATION_NO_ERROR, Now());
}

void Endpoint::OnConnectionTerminated(const std::shared_ptr<ConnectionState>& state) {
    connections_.erase(state);
    std::erase_if(by_cid_, [&state](const auto& entry) { return entry.second == state; });
    {
        std::lock_guard lock(accept_mutex_);
        std::erase(accept_queue_, state);
    }
    if (state->GetRole() == tls::TlsRole::Server && state->GetStatus() == ConnectionStatus::Failed) {
        PEERQUIC_LOG_DEBUG(kComponent, "inbound connection from {} failed and was dropped",
                           state->GetRemoteAddress().ToString());
    }
}

}
