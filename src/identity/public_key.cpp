#include "peerquic/identity/public_key.hpp"
#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/core/constants.hpp"
#include "keys/keys.pb.h"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <string>

namespace peerquic::identity {

namespace {

// Field order of the encoding is part of the PeerId; never let the runtime reorder.
Result<std::vector<uint8_t>, CertificateFailure> SerializeDeterministic(
    const proto::keys::PublicKey& message) {
    std::string output;
    {
        google::protobuf::io::StringOutputStream stream(&output);
        google::protobuf::io::CodedOutputStream coded_out(&stream);
        coded_out.SetSerializationDeterministic(true);
        if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
            return Result<std::vector<uint8_t>, CertificateFailure>::Err(
                CertificateFailure::Encoding("Failed to serialize public key protobuf"));
        }
    }
    return Result<std::vector<uint8_t>, CertificateFailure>::Ok(
        std::vector<uint8_t>(output.begin(), output.end()));
}

}

PublicKey::PublicKey(const KeyType type, std::vector<uint8_t> data)
    : type_(type)
    , data_(std::move(data)) {
}

Result<PublicKey, CertificateFailure> PublicKey::FromEd25519(const std::span<const uint8_t> key_bytes) {
    if (key_bytes.size() != kEd25519PublicKeyBytes) {
        return Result<PublicKey, CertificateFailure>::Err(
            CertificateFailure::Malformed(
                "Ed25519 public key must be " + std::to_string(kEd25519PublicKeyBytes) +
                " bytes, got " + std::to_string(key_bytes.size())));
    }
    return Result<PublicKey, CertificateFailure>::Ok(
        PublicKey(KeyType::Ed25519, std::vector<uint8_t>(key_bytes.begin(), key_bytes.end())));
}

Result<PublicKey, CertificateFailure> PublicKey::FromProtobuf(const std::span<const uint8_t> encoded) {
    proto::keys::PublicKey message;
    if (!message.ParseFromArray(encoded.data(), static_cast<int>(encoded.size()))) {
        return Result<PublicKey, CertificateFailure>::Err(
            CertificateFailure::Malformed("Identity public key is not a valid key protobuf"));
    }
    if (message.type() != proto::keys::Ed25519) {
        return Result<PublicKey, CertificateFailure>::Err(
            CertificateFailure::Malformed(
                "Unsupported identity key type " + std::to_string(static_cast<int>(message.type()))));
    }
    const auto& data = message.data();
    return FromEd25519(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

Result<std::vector<uint8_t>, CertificateFailure> PublicKey::ToProtobuf() const {
    proto::keys::PublicKey message;
    message.set_type(static_cast<proto::keys::KeyType>(type_));
    message.set_data(data_.data(), data_.size());
    return SerializeDeterministic(message);
}

bool PublicKey::Verify(const std::span<const uint8_t> message, const std::span<const uint8_t> signature) const {
    if (type_ != KeyType::Ed25519) {
        return false;
    }
    return crypto::SodiumInterop::VerifyDetached(data_, message, signature);
}

}
