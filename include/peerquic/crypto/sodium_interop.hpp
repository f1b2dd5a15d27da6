#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include "peerquic/core/constants.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace peerquic::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer over the libsodium primitives the transport needs
 *
 * Ed25519 identity signatures, SHA-256 for peer identities, randomness for
 * connection ids and serials.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Every other method assumes it succeeded.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Ed25519
    // ========================================================================

    /**
     * @brief Generate an Ed25519 key pair
     *
     * The 64-byte libsodium secret key (seed || public key) lands in guarded
     * memory; the public key is returned in the clear.
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
    GenerateEd25519KeyPair();

    /**
     * @brief Rebuild an Ed25519 key pair from its 32-byte seed
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
    Ed25519KeyPairFromSeed(std::span<const uint8_t> seed);

    static Result<std::vector<uint8_t>, SodiumFailure> SignDetached(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> message);

    /**
     * @brief Verify a detached Ed25519 signature
     *
     * @return false for a bad signature, a wrong-length key or signature
     */
    [[nodiscard]] static bool VerifyDetached(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) noexcept;

    // ========================================================================
    // Hashing and randomness
    // ========================================================================

    static std::vector<uint8_t> Sha256(std::span<const uint8_t> data);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    // ========================================================================
    // Memory
    // ========================================================================

    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
