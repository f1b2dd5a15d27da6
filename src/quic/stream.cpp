#include "peerquic/quic/stream.hpp"

namespace peerquic::quic {

Stream::Stream(std::shared_ptr<ConnectionState> state, const int64_t stream_id) noexcept
    : state_(std::move(state))
    , stream_id_(stream_id) {
}

Stream::~Stream() {
    state_->ReleaseStream(stream_id_);
}

Result<size_t, TransportFailure> Stream::Read(std::span<uint8_t> buffer, std::stop_token stop) {
    return state_->Read(stream_id_, buffer, std::move(stop));
}

Result<Unit, TransportFailure> Stream::Write(std::span<const uint8_t> data, std::stop_token stop) {
    return state_->Write(stream_id_, data, std::move(stop));
}

Result<Unit, TransportFailure> Stream::Close() {
    return state_->CloseStreamWrite(stream_id_);
}

Result<Unit, TransportFailure> Stream::Reset(const uint64_t app_error_code) {
    return state_->ResetStream(stream_id_, app_error_code);
}

}
