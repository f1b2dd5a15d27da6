#include "peerquic/quic/connection_state.hpp"
#include "peerquic/core/constants.hpp"
#include "peerquic/debug/logger.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace peerquic::quic {

namespace {

constexpr std::string_view kComponent = "connection";

}

std::string_view ToString(const ConnectionStatus status) noexcept {
    switch (status) {
        case ConnectionStatus::Handshaking: return "Handshaking";
        case ConnectionStatus::Established: return "Established";
        case ConnectionStatus::Closing: return "Closing";
        case ConnectionStatus::Closed: return "Closed";
        case ConnectionStatus::Failed: return "Failed";
    }
    return "Unknown";
}

// ============================================================================
// Stream bookkeeping
// ============================================================================

std::span<const uint8_t> ConnectionState::StreamRecord::UnsentData() const noexcept {
    uint64_t position = send_base;
    for (const auto& chunk : send_chunks) {
        if (sent < position + chunk.size()) {
            const size_t skip = static_cast<size_t>(sent - position);
            return std::span<const uint8_t>(chunk.data() + skip, chunk.size() - skip);
        }
        position += chunk.size();
    }
    return {};
}

void ConnectionState::StreamRecord::ReleaseAcknowledged() noexcept {
    while (!send_chunks.empty() && send_base + send_chunks.front().size() <= acked) {
        send_base += send_chunks.front().size();
        send_chunks.pop_front();
    }
}

void ConnectionState::StreamRecord::DropOutput() noexcept {
    write_shut = true;
    send_chunks.clear();
    send_base = queued;
    sent = queued;
    acked = queued;
}

// ============================================================================
// Lifecycle
// ============================================================================

ConnectionState::ConnectionState(const ConnectionSetup& setup)
    : role_(setup.role)
    , local_(setup.local)
    , remote_(setup.remote)
    , send_buffer_limit_(setup.config.GetStreamSendBufferLimit())
    , tls_(setup.tls)
    , owner_(setup.owner)
    , loop_(setup.loop)
    , send_buffer_(QuicConstants::MAX_UDP_PAYLOAD) {
}

ConnectionState::~ConnectionState() = default;

Result<std::shared_ptr<ConnectionState>, TransportFailure> ConnectionState::Create(
    const ConnectionSetup& setup, const Timestamp now) {
    auto state = std::shared_ptr<ConnectionState>(new ConnectionState(setup));

    EngineSetup engine_setup{
        setup.role,
        setup.tls.get(),
        setup.local,
        setup.remote,
        setup.config,
        setup.reset_secret,
        setup.initial_header,
        state.get(),
        state.get()
    };
    auto engine_result = EngineConnection::Create(engine_setup, now);
    if (engine_result.IsErr()) {
        return Result<std::shared_ptr<ConnectionState>, TransportFailure>::Err(
            std::move(engine_result).UnwrapErr());
    }
    state->engine_ = std::move(engine_result).Unwrap();

    PEERQUIC_LOG_DEBUG(kComponent, "{} connection created, remote {}",
                       setup.role == tls::TlsRole::Client ? "outbound" : "inbound",
                       setup.remote.ToString());
    return Result<std::shared_ptr<ConnectionState>, TransportFailure>::Ok(std::move(state));
}

// ============================================================================
// Loop thread
// ============================================================================

void ConnectionState::Start(const Timestamp now) {
    {
        std::lock_guard lock(mutex_);
        DrainLocked(now);
    }
    ReportTransitions();
}

void ConnectionState::HandleDatagram(
    std::span<const uint8_t> datagram, const net::SocketAddress& remote, const Timestamp now) {
    {
        std::lock_guard lock(mutex_);
        if (IsTerminalLocked()) {
            return;
        }
        auto fed = engine_->Feed(datagram, remote, now);
        if (fed.IsErr()) {
            auto failure = std::move(fed).UnwrapErr();
            const bool send_close = failure.type != TransportFailureType::ConnectionClosed;
            FailLocked(std::move(failure), send_close, now);
        } else {
            AdvanceHandshakeLocked(now);
            DrainLocked(now);
        }
    }
    ReportTransitions();
}

void ConnectionState::HandleExpiry(const Timestamp now) {
    {
        std::lock_guard lock(mutex_);
        if (IsTerminalLocked()) {
            return;
        }
        auto expired = engine_->Expire(now);
        if (expired.IsErr()) {
            auto failure = std::move(expired).UnwrapErr();
            const bool send_close = failure.type == TransportFailureType::Engine;
            FailLocked(std::move(failure), send_close, now);
        } else {
            DrainLocked(now);
        }
    }
    ReportTransitions();
}

void ConnectionState::Flush(const Timestamp now) {
    {
        std::lock_guard lock(mutex_);
        DrainLocked(now);
    }
    ReportTransitions();
}

std::optional<Timestamp> ConnectionState::NextExpiry() const {
    std::lock_guard lock(mutex_);
    if (IsTerminalLocked()) {
        return std::nullopt;
    }
    return engine_->GetExpiry();
}

Result<int64_t, TransportFailure> ConnectionState::OpenStreamOnLoop() {
    int64_t stream_id;
    {
        std::lock_guard lock(mutex_);
        if (status_ == ConnectionStatus::Handshaking) {
            return Result<int64_t, TransportFailure>::Err(
                TransportFailure::ConnectionNotReady("handshake has not completed"));
        }
        if (status_ != ConnectionStatus::Established) {
            return Result<int64_t, TransportFailure>::Err(ClosedFailureLocked());
        }
        auto opened = engine_->OpenBidiStream();
        if (opened.IsErr()) {
            return opened;
        }
        stream_id = opened.Unwrap();
        streams_.try_emplace(stream_id);
    }
    PEERQUIC_LOG_TRACE(kComponent, "opened stream {}", stream_id);
    return Result<int64_t, TransportFailure>::Ok(stream_id);
}

void ConnectionState::CloseOnLoop(const uint64_t app_error_code, const Timestamp now) {
    {
        std::lock_guard lock(mutex_);
        if (IsTerminalLocked()) {
            return;
        }
        status_ = ConnectionStatus::Closing;
        const size_t length = engine_->WriteClose(send_buffer_, app_error_code, now);
        if (length > 0) {
            owner_->SendDatagram(std::span<const uint8_t>(send_buffer_.data(), length), *this);
        }
        TerminateLocked(ConnectionStatus::Closed,
                        TransportFailure::ConnectionClosed(std::string(ErrorMessages::CONNECTION_CLOSED)));
        PEERQUIC_LOG_DEBUG(kComponent, "closed connection to {}", remote_.ToString());
    }
    ReportTransitions();
}

std::vector<std::vector<uint8_t>> ConnectionState::GetSourceConnectionIds() const {
    std::lock_guard lock(mutex_);
    return engine_->GetSourceConnectionIds();
}

// ============================================================================
// Any thread
// ============================================================================

void ConnectionState::Abandon(const TransportFailure& failure) {
    std::lock_guard lock(mutex_);
    if (IsTerminalLocked()) {
        return;
    }
    TerminateLocked(ConnectionStatus::Failed, failure);
    terminated_reported_ = true;
}

Result<identity::PeerId, TransportFailure> ConnectionState::WaitEstablished(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    changed_.wait(lock, stop, [this]() { return status_ != ConnectionStatus::Handshaking; });
    if (status_ == ConnectionStatus::Handshaking) {
        return Result<identity::PeerId, TransportFailure>::Err(
            TransportFailure::Cancelled("dial cancelled before the handshake completed"));
    }
    if (status_ == ConnectionStatus::Established && peer_id_) {
        return Result<identity::PeerId, TransportFailure>::Ok(*peer_id_);
    }
    return Result<identity::PeerId, TransportFailure>::Err(
        failure_ ? *failure_ : TransportFailure::ConnectionClosed(std::string(ErrorMessages::CONNECTION_CLOSED)));
}

Result<int64_t, TransportFailure> ConnectionState::AcceptStream(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    changed_.wait(lock, stop, [this]() { return !inbound_.empty() || IsTerminalLocked(); });
    if (IsTerminalLocked()) {
        return Result<int64_t, TransportFailure>::Err(ClosedFailureLocked());
    }
    if (inbound_.empty()) {
        return Result<int64_t, TransportFailure>::Err(TransportFailure::Cancelled("accept cancelled"));
    }
    const int64_t stream_id = inbound_.front();
    inbound_.pop_front();
    return Result<int64_t, TransportFailure>::Ok(stream_id);
}

Result<size_t, TransportFailure> ConnectionState::Read(
    const int64_t stream_id, std::span<uint8_t> buffer, std::stop_token stop) {
    // Ok(0) means end of stream; an empty buffer could never make progress.
    if (buffer.empty()) {
        return Result<size_t, TransportFailure>::Err(
            TransportFailure::InvalidArgument("read buffer must not be empty"));
    }
    size_t copied = 0;
    {
        std::unique_lock lock(mutex_);
        changed_.wait(lock, stop, [this, stream_id]() {
            if (IsTerminalLocked()) {
                return true;
            }
            const auto it = streams_.find(stream_id);
            return it == streams_.end() || !it->second.receive.empty() ||
                   it->second.fin_received || it->second.reset_code.has_value();
        });

        auto found = FindStreamLocked(stream_id);
        if (found.IsErr()) {
            return Result<size_t, TransportFailure>::Err(std::move(found).UnwrapErr());
        }
        StreamRecord& record = *found.Unwrap();
        if (record.reset_code) {
            return Result<size_t, TransportFailure>::Err(TransportFailure::StreamReset(
                fmt::format("stream {} was reset (code {})", stream_id, *record.reset_code)));
        }
        if (record.receive.empty()) {
            if (record.fin_received) {
                return Result<size_t, TransportFailure>::Ok(0);
            }
            return Result<size_t, TransportFailure>::Err(TransportFailure::Cancelled("read cancelled"));
        }

        copied = std::min(buffer.size(), record.receive.size());
        std::copy_n(record.receive.begin(), copied, buffer.begin());
        record.receive.erase(record.receive.begin(), record.receive.begin() + static_cast<std::ptrdiff_t>(copied));
    }

    if (copied > 0) {
        PostToLoop([self = shared_from_this(), stream_id, copied]() {
            {
                std::lock_guard lock(self->mutex_);
                if (self->IsTerminalLocked()) {
                    return;
                }
                self->engine_->ExtendStreamCredit(stream_id, copied);
            }
            self->Flush(Now());
        });
    }
    return Result<size_t, TransportFailure>::Ok(copied);
}

Result<Unit, TransportFailure> ConnectionState::Write(
    const int64_t stream_id, std::span<const uint8_t> data, std::stop_token stop) {
    size_t offset = 0;
    while (offset < data.size()) {
        {
            std::unique_lock lock(mutex_);
            changed_.wait(lock, stop, [this, stream_id]() {
                if (IsTerminalLocked()) {
                    return true;
                }
                const auto it = streams_.find(stream_id);
                return it == streams_.end() || it->second.write_shut ||
                       it->second.queued - it->second.acked < send_buffer_limit_;
            });

            auto found = FindStreamLocked(stream_id);
            if (found.IsErr()) {
                return Result<Unit, TransportFailure>::Err(std::move(found).UnwrapErr());
            }
            StreamRecord& record = *found.Unwrap();
            if (record.write_shut) {
                return Result<Unit, TransportFailure>::Err(TransportFailure::StreamReset(
                    fmt::format("stream {} no longer accepts data", stream_id)));
            }
            if (record.fin_queued) {
                return Result<Unit, TransportFailure>::Err(TransportFailure::StreamReset(
                    fmt::format("stream {} write side already closed", stream_id)));
            }
            const uint64_t unacked = record.queued - record.acked;
            if (unacked >= send_buffer_limit_) {
                return Result<Unit, TransportFailure>::Err(TransportFailure::Cancelled("write cancelled"));
            }

            const size_t take = std::min(data.size() - offset, static_cast<size_t>(send_buffer_limit_ - unacked));
            record.send_chunks.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                                            data.begin() + static_cast<std::ptrdiff_t>(offset + take));
            record.queued += take;
            offset += take;
        }
        ScheduleFlush();
    }
    return Result<Unit, TransportFailure>::Ok(unit);
}

Result<Unit, TransportFailure> ConnectionState::CloseStreamWrite(const int64_t stream_id) {
    {
        std::lock_guard lock(mutex_);
        auto found = FindStreamLocked(stream_id);
        if (found.IsErr()) {
            return Result<Unit, TransportFailure>::Err(std::move(found).UnwrapErr());
        }
        StreamRecord& record = *found.Unwrap();
        if (record.fin_queued || record.write_shut) {
            return Result<Unit, TransportFailure>::Ok(unit);
        }
        record.fin_queued = true;
    }
    ScheduleFlush();
    return Result<Unit, TransportFailure>::Ok(unit);
}

Result<Unit, TransportFailure> ConnectionState::ResetStream(const int64_t stream_id, const uint64_t app_error_code) {
    size_t discarded = 0;
    {
        std::lock_guard lock(mutex_);
        auto found = FindStreamLocked(stream_id);
        if (found.IsErr()) {
            return Result<Unit, TransportFailure>::Err(std::move(found).UnwrapErr());
        }
        StreamRecord& record = *found.Unwrap();
        record.DropOutput();
        discarded = record.receive.size();
        record.receive.clear();
        record.reset_code = app_error_code;
    }
    changed_.notify_all();
    PostToLoop([self = shared_from_this(), stream_id, app_error_code, discarded]() {
        {
            std::lock_guard lock(self->mutex_);
            if (self->IsTerminalLocked()) {
                return;
            }
            self->engine_->ExtendConnectionCredit(discarded);
            self->engine_->ShutdownStream(stream_id, app_error_code);
        }
        self->Flush(Now());
    });
    return Result<Unit, TransportFailure>::Ok(unit);
}

void ConnectionState::ReleaseStream(const int64_t stream_id) {
    bool reset = false;
    bool stop_reading = false;
    size_t discarded = 0;
    {
        std::lock_guard lock(mutex_);
        const auto it = streams_.find(stream_id);
        if (it == streams_.end()) {
            return;
        }
        StreamRecord& record = it->second;
        if (IsTerminalLocked()) {
            record.released = true;
            return;
        }
        discarded = record.receive.size();
        if (record.closed) {
            streams_.erase(it);
        } else {
            record.released = true;
            // Queued output survives the handle once FIN is queued; unread input does not.
            reset = !record.fin_queued && !record.write_shut;
            stop_reading = !reset && !record.fin_received && !record.reset_code;
            if (reset) {
                record.DropOutput();
            }
            record.receive.clear();
        }
    }
    if (!reset && !stop_reading && discarded == 0) {
        return;
    }
    PostToLoop([self = shared_from_this(), stream_id, reset, stop_reading, discarded]() {
        {
            std::lock_guard lock(self->mutex_);
            if (self->IsTerminalLocked()) {
                return;
            }
            self->engine_->ExtendConnectionCredit(discarded);
            if (reset) {
                self->engine_->ShutdownStream(stream_id, QuicConstants::STREAM_CANCELLED_ERROR);
            } else if (stop_reading) {
                self->engine_->ShutdownStreamRead(stream_id, QuicConstants::STREAM_CANCELLED_ERROR);
            }
        }
        self->Flush(Now());
    });
}

ConnectionStatus ConnectionState::GetStatus() const {
    std::lock_guard lock(mutex_);
    return status_;
}

std::optional<identity::PeerId> ConnectionState::GetRemotePeerId() const {
    std::lock_guard lock(mutex_);
    return peer_id_;
}

// ============================================================================
// Handshake and engine events
// ============================================================================

void ConnectionState::OnPeerVerified(const identity::PeerId& peer_id) {
    peer_id_ = peer_id;
    PEERQUIC_LOG_DEBUG(kComponent, "peer {} verified", peer_id.ToBase58());
}

void ConnectionState::OnPeerRejected(const CertificateFailure& failure) {
    rejection_ = failure;
    PEERQUIC_LOG_INFO(kComponent, "peer certificate from {} rejected: {}: {}",
                      remote_.ToString(), ToString(failure.type), failure.message);
}

void ConnectionState::OnHandshakeCompleted() {
    handshake_completed_ = true;
}

void ConnectionState::OnRemoteStreamOpened(const int64_t stream_id) {
    streams_.try_emplace(stream_id);
    inbound_.push_back(stream_id);
    changed_.notify_all();
}

void ConnectionState::OnStreamData(const int64_t stream_id, std::span<const uint8_t> data, const bool fin) {
    const auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        engine_->ExtendConnectionCredit(data.size());
        return;
    }
    StreamRecord& record = it->second;
    // Nobody will read it, so the credit goes straight back.
    if (record.reset_code || record.released) {
        engine_->ExtendConnectionCredit(data.size());
    } else {
        record.receive.insert(record.receive.end(), data.begin(), data.end());
    }
    record.fin_received = record.fin_received || fin;
    changed_.notify_all();
}

void ConnectionState::OnStreamDataAcked(const int64_t stream_id, const uint64_t offset, const uint64_t length) {
    const auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return;
    }
    StreamRecord& record = it->second;
    record.acked = std::max(record.acked, offset + length);
    record.ReleaseAcknowledged();
    changed_.notify_all();
}

void ConnectionState::OnStreamReset(const int64_t stream_id, const uint64_t app_error_code) {
    const auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return;
    }
    it->second.reset_code = app_error_code;
    engine_->ExtendConnectionCredit(it->second.receive.size());
    it->second.receive.clear();
    changed_.notify_all();
}

void ConnectionState::OnStreamStopSending(const int64_t stream_id, const uint64_t app_error_code) {
    const auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return;
    }
    PEERQUIC_LOG_TRACE(kComponent, "peer stopped reading stream {} (code {})", stream_id, app_error_code);
    it->second.DropOutput();
    changed_.notify_all();
}

void ConnectionState::OnStreamClosed(const int64_t stream_id, uint64_t) {
    const auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return;
    }
    if (it->second.released) {
        streams_.erase(it);
        return;
    }
    it->second.closed = true;
    it->second.write_shut = true;
    it->second.fin_received = true;
    changed_.notify_all();
}

void ConnectionState::OnConnectionIdIssued(std::span<const uint8_t> cid) {
    owner_->OnConnectionIdIssued(cid, shared_from_this());
}

void ConnectionState::OnConnectionIdRetired(std::span<const uint8_t> cid) {
    owner_->OnConnectionIdRetired(cid);
}

// ============================================================================
// Internals (lock held)
// ============================================================================

TransportFailure ConnectionState::ClosedFailureLocked() const {
    if (failure_ && failure_->type != TransportFailureType::ConnectionClosed) {
        return TransportFailure::ConnectionClosed(
            fmt::format("connection failed: {}", failure_->message));
    }
    return TransportFailure::ConnectionClosed(std::string(ErrorMessages::CONNECTION_CLOSED));
}

Result<ConnectionState::StreamRecord*, TransportFailure> ConnectionState::FindStreamLocked(const int64_t stream_id) {
    if (IsTerminalLocked()) {
        return Result<StreamRecord*, TransportFailure>::Err(ClosedFailureLocked());
    }
    const auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return Result<StreamRecord*, TransportFailure>::Err(
            TransportFailure::StreamReset(fmt::format("stream {} is no longer open", stream_id)));
    }
    return Result<StreamRecord*, TransportFailure>::Ok(&it->second);
}

void ConnectionState::AdvanceHandshakeLocked(const Timestamp now) {
    if (status_ != ConnectionStatus::Handshaking || !handshake_completed_) {
        return;
    }
    if (!peer_id_) {
        FailLocked(TransportFailure::HandshakeFailed("handshake completed without a verified peer identity"),
                   true, now);
        return;
    }
    status_ = ConnectionStatus::Established;
    report_established_ = true;
    changed_.notify_all();
    PEERQUIC_LOG_INFO(kComponent, "connection to {} established with peer {}",
                      remote_.ToString(), peer_id_->ToBase58());
}

void ConnectionState::FailLocked(TransportFailure failure, const bool send_close, const Timestamp now) {
    if (IsTerminalLocked()) {
        return;
    }
    if (rejection_ && status_ == ConnectionStatus::Handshaking) {
        failure = TransportFailure::FromCertificateFailure(*rejection_);
    } else if (status_ == ConnectionStatus::Handshaking &&
               failure.type == TransportFailureType::ConnectionClosed) {
        failure = TransportFailure::HandshakeFailed(fmt::format("handshake aborted: {}", failure.message));
    }

    if (send_close) {
        const size_t length = engine_->WriteClose(send_buffer_, QuicConstants::APPLICATION_NO_ERROR, now);
        if (length > 0) {
            owner_->SendDatagram(std::span<const uint8_t>(send_buffer_.data(), length), *this);
        }
    }

    const bool orderly = status_ == ConnectionStatus::Established &&
                         failure.type == TransportFailureType::ConnectionClosed;
    PEERQUIC_LOG_DEBUG(kComponent, "connection to {} ended: {}: {}",
                       remote_.ToString(), ToString(failure.type), failure.message);
    TerminateLocked(orderly ? ConnectionStatus::Closed : ConnectionStatus::Failed, std::move(failure));
}

void ConnectionState::TerminateLocked(const ConnectionStatus status, TransportFailure failure) {
    status_ = status;
    failure_ = std::move(failure);
    streams_.clear();
    inbound_.clear();
    changed_.notify_all();
}

std::optional<int64_t> ConnectionState::NextPendingStreamLocked(const std::set<int64_t>& skipped) const {
    const auto pending = [&skipped](const auto& entry) {
        return entry.second.HasPendingOutput() && !skipped.contains(entry.first);
    };
    const auto start = streams_.upper_bound(last_served_stream_);
    if (const auto it = std::find_if(start, streams_.end(), pending); it != streams_.end()) {
        return it->first;
    }
    if (const auto it = std::find_if(streams_.begin(), start, pending); it != start) {
        return it->first;
    }
    return std::nullopt;
}

void ConnectionState::DrainLocked(const Timestamp now) {
    if (IsTerminalLocked() || !engine_) {
        return;
    }

    std::set<int64_t> skipped;
    size_t datagrams = 0;
    for (;;) {
        const std::optional<int64_t> stream_id = NextPendingStreamLocked(skipped);
        StreamRecord* record = stream_id ? &streams_.at(*stream_id) : nullptr;

        StreamChunk chunk;
        if (record != nullptr) {
            chunk.stream_id = *stream_id;
            chunk.data = record->UnsentData();
            chunk.fin = record->fin_queued && record->sent + chunk.data.size() == record->queued;
            chunk.more = true;
        }

        auto written = engine_->Write(send_buffer_, chunk, now);
        if (written.IsErr()) {
            FailLocked(std::move(written).UnwrapErr(), true, now);
            return;
        }
        const WriteOutcome outcome = written.Unwrap();

        if (record != nullptr) {
            const auto it = streams_.find(*stream_id);
            record = it != streams_.end() ? &it->second : nullptr;
        }
        if (record != nullptr && outcome.consumed) {
            record->sent += *outcome.consumed;
            if (chunk.fin && record->sent == record->queued) {
                record->fin_sent = true;
            }
        }

        switch (outcome.status) {
            case StreamWriteStatus::Coalescing:
                continue;
            case StreamWriteStatus::Blocked:
                skipped.insert(chunk.stream_id);
                continue;
            case StreamWriteStatus::WriteShut:
                if (record != nullptr) {
                    record->DropOutput();
                }
                skipped.insert(chunk.stream_id);
                continue;
            case StreamWriteStatus::Written:
                break;
        }

        if (outcome.packet_length == 0) {
            break;
        }
        if (stream_id) {
            last_served_stream_ = *stream_id;
        }
        owner_->SendDatagram(std::span<const uint8_t>(send_buffer_.data(), outcome.packet_length), *this);
        if (++datagrams >= QuicConstants::MAX_DATAGRAMS_PER_FLUSH) {
            ScheduleFlush();
            break;
        }
    }
    engine_->UpdatePacketTxTime(now);
}

// ============================================================================
// Loop hand-off
// ============================================================================

void ConnectionState::ScheduleFlush() {
    if (flush_scheduled_.exchange(true)) {
        return;
    }
    PostToLoop([self = shared_from_this()]() {
        self->flush_scheduled_.store(false);
        self->Flush(Now());
    });
}

void ConnectionState::PostToLoop(EventLoop::Task task) {
    if (!loop_->Post(std::move(task))) {
        flush_scheduled_.store(false);
        PEERQUIC_LOG_DEBUG(kComponent, "endpoint loop stopped, task for {} dropped", remote_.ToString());
    }
}

void ConnectionState::ReportTransitions() {
    bool established;
    bool terminated;
    {
        std::lock_guard lock(mutex_);
        established = std::exchange(report_established_, false);
        terminated = IsTerminalLocked() && !terminated_reported_;
        if (terminated) {
            terminated_reported_ = true;
        }
    }
    const auto self = shared_from_this();
    if (established) {
        owner_->OnConnectionEstablished(self);
    }
    if (terminated) {
        owner_->OnConnectionTerminated(self);
    }
}

}
