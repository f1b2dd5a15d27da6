#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace peerquic::configuration {

/// Lifetime of the ephemeral keypair behind the handshake certificate
///
/// - PerEndpoint: one keypair and certificate per Endpoint, reused by every
///   connection on it. Cheap, but connections of one Endpoint are linkable
///   through the certificate.
/// - PerConnection: a fresh keypair and certificate for every connection.
enum class EphemeralKeyPolicy : uint8_t {
    PerEndpoint = 0,
    PerConnection = 1
};

/// Tunables of the QUIC transport
///
/// Value type; every modifier returns an adjusted copy so configurations can
/// be built fluently:
/// ```cpp
/// auto config = TransportConfig::Default()
///     .WithIdleTimeout(std::chrono::seconds(10))
///     .WithMaxConcurrentStreams(64);
/// ```
class TransportConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static constexpr TransportConfig Default() noexcept {
        return TransportConfig();
    }

    /// Shorter timeouts for local or test networks
    [[nodiscard]] static constexpr TransportConfig LowLatency() noexcept {
        return TransportConfig()
            .WithHandshakeTimeout(std::chrono::milliseconds(3000))
            .WithIdleTimeout(std::chrono::milliseconds(5000))
            .WithKeepAlive(std::chrono::milliseconds(1000));
    }

    // =========================================================================
    // Modifiers
    // =========================================================================

    [[nodiscard]] constexpr TransportConfig WithHandshakeTimeout(std::chrono::milliseconds value) const noexcept {
        TransportConfig copy = *this;
        copy.handshake_timeout_ = value;
        return copy;
    }

    [[nodiscard]] constexpr TransportConfig WithIdleTimeout(std::chrono::milliseconds value) const noexcept {
        TransportConfig copy = *this;
        copy.idle_timeout_ = value;
        return copy;
    }

    /// Zero disables keep-alive PINGs
    [[nodiscard]] constexpr TransportConfig WithKeepAlive(std::chrono::milliseconds value) const noexcept {
        TransportConfig copy = *this;
        copy.keep_alive_ = value;
        return copy;
    }

    [[nodiscard]] constexpr TransportConfig WithMaxConcurrentStreams(uint64_t value) const noexcept {
        TransportConfig copy = *this;
        copy.max_concurrent_streams_ = value;
        return copy;
    }

    [[nodiscard]] constexpr TransportConfig WithStreamWindow(uint64_t value) const noexcept {
        TransportConfig copy = *this;
        copy.stream_window_ = value;
        return copy;
    }

    [[nodiscard]] constexpr TransportConfig WithConnectionWindow(uint64_t value) const noexcept {
        TransportConfig copy = *this;
        copy.connection_window_ = value;
        return copy;
    }

    [[nodiscard]] constexpr TransportConfig WithStreamSendBufferLimit(size_t value) const noexcept {
        TransportConfig copy = *this;
        copy.stream_send_buffer_limit_ = value;
        return copy;
    }

    [[nodiscard]] constexpr TransportConfig WithEphemeralKeyPolicy(EphemeralKeyPolicy value) const noexcept {
        TransportConfig copy = *this;
        copy.ephemeral_key_policy_ = value;
        return copy;
    }

    /// Routes ngtcp2's own packet-level log lines into the TRACE level
    [[nodiscard]] constexpr TransportConfig WithEngineTrace(bool value) const noexcept {
        TransportConfig copy = *this;
        copy.engine_trace_ = value;
        return copy;
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] constexpr std::chrono::milliseconds GetHandshakeTimeout() const noexcept {
        return handshake_timeout_;
    }

    [[nodiscard]] constexpr std::chrono::milliseconds GetIdleTimeout() const noexcept {
        return idle_timeout_;
    }

    [[nodiscard]] constexpr std::chrono::milliseconds GetKeepAlive() const noexcept {
        return keep_alive_;
    }

    [[nodiscard]] constexpr uint64_t GetMaxConcurrentStreams() const noexcept {
        return max_concurrent_streams_;
    }

    [[nodiscard]] constexpr uint64_t GetStreamWindow() const noexcept {
        return stream_window_;
    }

    [[nodiscard]] constexpr uint64_t GetConnectionWindow() const noexcept {
        return connection_window_;
    }

    [[nodiscard]] constexpr size_t GetStreamSendBufferLimit() const noexcept {
        return stream_send_buffer_limit_;
    }

    [[nodiscard]] constexpr EphemeralKeyPolicy GetEphemeralKeyPolicy() const noexcept {
        return ephemeral_key_policy_;
    }

    [[nodiscard]] constexpr bool IsEngineTraceEnabled() const noexcept {
        return engine_trace_;
    }

    constexpr bool operator==(const TransportConfig&) const noexcept = default;

private:
    constexpr TransportConfig() noexcept = default;

    std::chrono::milliseconds handshake_timeout_{10000};
    std::chrono::milliseconds idle_timeout_{30000};
    std::chrono::milliseconds keep_alive_{0};
    uint64_t max_concurrent_streams_ = 256;
    uint64_t stream_window_ = 1024 * 1024;
    uint64_t connection_window_ = 16 * 1024 * 1024;
    size_t stream_send_buffer_limit_ = 4 * 1024 * 1024;
    EphemeralKeyPolicy ephemeral_key_policy_ = EphemeralKeyPolicy::PerEndpoint;
    bool engine_trace_ = false;
};

}
