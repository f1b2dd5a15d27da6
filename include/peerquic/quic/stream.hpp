#pragma once

#include "peerquic/interfaces/i_stream_muxer.hpp"
#include "peerquic/quic/connection_state.hpp"

#include <memory>

namespace peerquic::quic {

class Stream final : public interfaces::IStream {
public:
    Stream(std::shared_ptr<ConnectionState> state, int64_t stream_id) noexcept;

    ~Stream() override;

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    [[nodiscard]] int64_t GetId() const noexcept override {
        return stream_id_;
    }

    [[nodiscard]] Result<size_t, TransportFailure> Read(
        std::span<uint8_t> buffer, std::stop_token stop = {}) override;

    [[nodiscard]] Result<Unit, TransportFailure> Write(
        std::span<const uint8_t> data, std::stop_token stop = {}) override;

    [[nodiscard]] Result<Unit, TransportFailure> Close() override;

    [[nodiscard]] Result<Unit, TransportFailure> Reset(uint64_t app_error_code) override;

private:
    std::shared_ptr<ConnectionState> state_;
    int64_t stream_id_;
};

}
