#pragma once
#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace peerquic::identity {
enum class KeyType : uint8_t {
    Rsa = 0,
    Ed25519 = 1,
    Secp256k1 = 2,
    Ecdsa = 3
};
class PublicKey {
public:
    [[nodiscard]] static Result<PublicKey, CertificateFailure> FromEd25519(std::span<const uint8_t> key_bytes);
    [[nodiscard]] static Result<PublicKey, CertificateFailure> FromProtobuf(std::span<const uint8_t> encoded);
    [[nodiscard]] Result<std::vector<uint8_t>, CertificateFailure> ToProtobuf() const;
    [[nodiscard]] bool Verify(std::span<const uint8_t> message, std::span<const uint8_t> signature) const;
    [[nodiscard]] KeyType GetType() const noexcept {
        return type_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetData() const noexcept {
        return data_;
    }
    bool operator==(const PublicKey& other) const noexcept {
        return type_ == other.type_ && data_ == other.data_;
    }
    bool operator!=(const PublicKey& other) const noexcept {
        return !(*this == other);
    }
private:
    PublicKey(KeyType type, std::vector<uint8_t> data);
    KeyType type_;
    std::vector<uint8_t> data_;
};
}
