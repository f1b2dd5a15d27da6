#pragma once
#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/identity/identity_keypair.hpp"
#include "peerquic/interfaces/i_certificate_verifier.hpp"
#include "peerquic/tls/certificate_verifier.hpp"
#include "peerquic/transport/quic_transport.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace peerquic::test_helpers {

using identity::IdentityKeyPair;
using identity::PeerId;

inline std::shared_ptr<const IdentityKeyPair> MakeIdentity() {
    if (crypto::SodiumInterop::Initialize().IsErr()) {
        throw std::runtime_error("libsodium initialization failed");
    }
    return std::make_shared<const IdentityKeyPair>(IdentityKeyPair::Generate().Unwrap());
}

/// Stop token that fires on its own after a timeout
class StopAfter {
public:
    explicit StopAfter(const std::chrono::milliseconds timeout)
        : timer_([this, timeout](const std::stop_token own) {
              std::mutex mutex;
              std::condition_variable_any cv;
              std::unique_lock lock(mutex);
              cv.wait_for(lock, own, timeout, []() { return false; });
              if (!own.stop_requested()) {
                  source_.request_stop();
              }
          }) {}

    [[nodiscard]] std::stop_token Token() const noexcept {
        return source_.get_token();
    }

private:
    std::stop_source source_;
    std::jthread timer_;
};

/// Accepts only what the real verifier accepts, minus a deny list of peers
class DenyListVerifier final : public interfaces::ICertificateVerifier {
public:
    explicit DenyListVerifier(std::vector<PeerId> denied)
        : denied_(std::move(denied)) {}

    [[nodiscard]] Result<PeerId, CertificateFailure> Verify(
        const std::span<const uint8_t> certificate_der) const override {
        auto verified = inner_.Verify(certificate_der);
        if (verified.IsErr()) {
            return verified;
        }
        for (const auto& peer : denied_) {
            if (peer == verified.Unwrap()) {
                return Result<PeerId, CertificateFailure>::Err(
                    CertificateFailure::IdentityBindingInvalid("peer is denied"));
            }
        }
        return verified;
    }

private:
    tls::IdentityBindingVerifier inner_;
    std::vector<PeerId> denied_;
};

inline configuration::TransportConfig TestConfig() {
    return configuration::TransportConfig::LowLatency();
}

inline std::string LoopbackMultiaddr() {
    return "/ip4/127.0.0.1/udp/0/quic";
}

}
