#include "peerquic/quic/connection.hpp"
#include "peerquic/quic/stream.hpp"
#include "peerquic/core/constants.hpp"

namespace peerquic::quic {

Connection::Connection(std::shared_ptr<ConnectionState> state, std::shared_ptr<EventLoop> loop,
                       identity::PeerId remote_identity)
    : state_(std::move(state))
    , loop_(std::move(loop))
    , remote_identity_(std::move(remote_identity)) {
}

Connection::~Connection() {
    Close();
}

Result<std::unique_ptr<interfaces::IStream>, TransportFailure> Connection::OpenStream() {
    using ResultType = Result<std::unique_ptr<interfaces::IStream>, TransportFailure>;

    auto opened = loop_->Invoke([state = state_]() { return state->OpenStreamOnLoop(); });
    if (!opened) {
        return ResultType::Err(TransportFailure::ConnectionClosed(std::string(ErrorMessages::ENDPOINT_CLOSED)));
    }
    if (opened->IsErr()) {
        return ResultType::Err(std::move(*opened).UnwrapErr());
    }
    return ResultType::Ok(std::make_unique<Stream>(state_, opened->Unwrap()));
}

Result<std::unique_ptr<interfaces::IStream>, TransportFailure> Connection::AcceptStream(std::stop_token stop) {
    using ResultType = Result<std::unique_ptr<interfaces::IStream>, TransportFailure>;

    auto accepted = state_->AcceptStream(std::move(stop));
    if (accepted.IsErr()) {
        return ResultType::Err(std::move(accepted).UnwrapErr());
    }
    return ResultType::Ok(std::make_unique<Stream>(state_, accepted.Unwrap()));
}

void Connection::Close() {
    const auto closed = loop_->Invoke([state = state_]() {
        state->CloseOnLoop(QuicConstants::APPLICATION_NO_ERROR, Now());
        return true;
    });
    if (!closed) {
        state_->Abandon(TransportFailure::ConnectionClosed(std::string(ErrorMessages::ENDPOINT_CLOSED)));
    }
}

}
