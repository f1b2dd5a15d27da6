#pragma once
#include <cstdint>
#include <span>
namespace peerquic::interfaces {
/**
 * @brief Events raised by the QUIC engine while it processes packets
 *
 * Invoked synchronously from inside engine calls on the endpoint loop
 * thread. Implementations must not call back into the engine.
 */
class IEngineEventHandler {
public:
    virtual ~IEngineEventHandler() = default;

    virtual void OnHandshakeCompleted() = 0;

    virtual void OnRemoteStreamOpened(int64_t stream_id) = 0;

    virtual void OnStreamData(int64_t stream_id, std::span<const uint8_t> data, bool fin) = 0;

    /// Bytes [offset, offset + length) of the stream were acknowledged
    virtual void OnStreamDataAcked(int64_t stream_id, uint64_t offset, uint64_t length) = 0;

    virtual void OnStreamReset(int64_t stream_id, uint64_t app_error_code) = 0;

    virtual void OnStreamStopSending(int64_t stream_id, uint64_t app_error_code) = 0;

    virtual void OnStreamClosed(int64_t stream_id, uint64_t app_error_code) = 0;

    virtual void OnConnectionIdIssued(std::span<const uint8_t> cid) = 0;

    virtual void OnConnectionIdRetired(std::span<const uint8_t> cid) = 0;
};
}
