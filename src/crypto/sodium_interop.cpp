#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/crypto/sodium_secure_memory_handle.hpp"

#include <sodium.h>

#include <string>

namespace peerquic::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Ed25519
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    std::vector<uint8_t> seed(kEd25519SeedBytes);
    randombytes_buf(seed.data(), seed.size());
    auto result = Ed25519KeyPairFromSeed(seed);
    SecureWipe(seed);
    return result;
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
SodiumInterop::Ed25519KeyPairFromSeed(const std::span<const uint8_t> seed) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>;

    if (seed.size() != crypto_sign_SEEDBYTES) {
        return KeyPairResult::Err(SodiumFailure::BufferTooSmall(
            "Ed25519 seed must be " + std::to_string(crypto_sign_SEEDBYTES) + " bytes"));
    }

    auto handle_result = SecureMemoryHandle::Allocate(crypto_sign_SECRETKEYBYTES);
    if (handle_result.IsErr()) {
        return KeyPairResult::Err(std::move(handle_result).UnwrapErr());
    }
    auto secret_handle = std::move(handle_result).Unwrap();

    // The secret key is derived straight into guarded memory.
    std::vector<uint8_t> public_key(crypto_sign_PUBLICKEYBYTES);
    auto derived = secret_handle.WithWriteAccess([&](const std::span<uint8_t> sk) {
        return crypto_sign_seed_keypair(public_key.data(), sk.data(), seed.data());
    });
    if (derived.IsErr()) {
        return KeyPairResult::Err(std::move(derived).UnwrapErr());
    }
    if (derived.Unwrap() != SodiumConstants::SUCCESS) {
        return KeyPairResult::Err(SodiumFailure::WriteOperationFailed("crypto_sign_seed_keypair failed"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(secret_handle), std::move(public_key)));
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::SignDetached(
    const SecureMemoryHandle& secret_key,
    const std::span<const uint8_t> message) {

    if (secret_key.Size() != crypto_sign_SECRETKEYBYTES) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Handle does not hold an Ed25519 secret key"));
    }

    auto signed_result = secret_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        std::vector<uint8_t> signature(crypto_sign_BYTES);
        unsigned long long signature_length = 0;
        const int rc = crypto_sign_detached(signature.data(), &signature_length,
                                            message.data(), message.size(), sk.data());
        if (rc != SodiumConstants::SUCCESS || signature_length != crypto_sign_BYTES) {
            signature.clear();
        }
        return signature;
    });
    if (signed_result.IsErr()) {
        return signed_result;
    }
    auto signature = std::move(signed_result).Unwrap();
    if (signature.empty()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::WriteOperationFailed("crypto_sign_detached failed"));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    const std::span<const uint8_t> public_key,
    const std::span<const uint8_t> message,
    const std::span<const uint8_t> signature) noexcept {

    if (public_key.size() != crypto_sign_PUBLICKEYBYTES || signature.size() != crypto_sign_BYTES) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       public_key.data()) == SodiumConstants::SUCCESS;
}

// ============================================================================
// Hashing and randomness
// ============================================================================

std::vector<uint8_t> SodiumInterop::Sha256(const std::span<const uint8_t> data) {
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

void SodiumInterop::FillRandom(const std::span<uint8_t> buffer) noexcept {
    randombytes_buf(buffer.data(), buffer.size());
}

// ============================================================================
// Memory
// ============================================================================

void SodiumInterop::SecureWipe(const std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

}
