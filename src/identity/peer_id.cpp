#include "peerquic/identity/peer_id.hpp"
#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/core/constants.hpp"

#include <algorithm>
#include <array>

namespace peerquic::identity {

namespace {

constexpr std::string_view kBase58Alphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::string EncodeBase58(const std::span<const uint8_t> input) {
    const size_t leading_zeros = static_cast<size_t>(
        std::find_if(input.begin(), input.end(), [](uint8_t b) { return b != 0; }) - input.begin());

    // log(256) / log(58) < 1.38
    std::vector<uint8_t> digits((input.size() - leading_zeros) * 138 / 100 + 1, 0);
    size_t digits_used = 0;
    for (size_t i = leading_zeros; i < input.size(); ++i) {
        uint32_t carry = input[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < digits_used) && it != digits.rend(); ++it, ++j) {
            carry += 256u * *it;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        digits_used = j;
    }

    auto first = std::find_if(digits.begin(), digits.end(), [](uint8_t d) { return d != 0; });
    std::string output(leading_zeros, '1');
    output.reserve(leading_zeros + static_cast<size_t>(digits.end() - first));
    for (; first != digits.end(); ++first) {
        output.push_back(kBase58Alphabet[*first]);
    }
    return output;
}

Result<std::vector<uint8_t>, CertificateFailure> DecodeBase58(const std::string_view input) {
    std::array<int8_t, 128> index{};
    index.fill(-1);
    for (size_t i = 0; i < kBase58Alphabet.size(); ++i) {
        index[static_cast<uint8_t>(kBase58Alphabet[i])] = static_cast<int8_t>(i);
    }

    const size_t leading_ones = static_cast<size_t>(
        std::find_if(input.begin(), input.end(), [](char c) { return c != '1'; }) - input.begin());

    // log(58) / log(256) < 0.733
    std::vector<uint8_t> bytes((input.size() - leading_ones) * 733 / 1000 + 1, 0);
    size_t bytes_used = 0;
    for (size_t i = leading_ones; i < input.size(); ++i) {
        const auto c = static_cast<unsigned char>(input[i]);
        if (c >= index.size() || index[c] < 0) {
            return Result<std::vector<uint8_t>, CertificateFailure>::Err(
                CertificateFailure::Malformed("Invalid base58 character in peer id"));
        }
        uint32_t carry = static_cast<uint32_t>(index[c]);
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < bytes_used) && it != bytes.rend(); ++it, ++j) {
            carry += 58u * *it;
            *it = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        bytes_used = j;
    }

    auto first = std::find_if(bytes.begin(), bytes.end(), [](uint8_t b) { return b != 0; });
    std::vector<uint8_t> output(leading_ones, 0);
    output.insert(output.end(), first, bytes.end());
    return Result<std::vector<uint8_t>, CertificateFailure>::Ok(std::move(output));
}

std::vector<uint8_t> Multihash(const std::span<const uint8_t> encoded_key) {
    std::vector<uint8_t> multihash;
    if (encoded_key.size() <= kMaxInlineKeyLength) {
        multihash.reserve(encoded_key.size() + 2);
        multihash.push_back(kMultihashIdentityCode);
        multihash.push_back(static_cast<uint8_t>(encoded_key.size()));
        multihash.insert(multihash.end(), encoded_key.begin(), encoded_key.end());
        return multihash;
    }
    const auto digest = crypto::SodiumInterop::Sha256(encoded_key);
    multihash.reserve(digest.size() + 2);
    multihash.push_back(kMultihashSha256Code);
    multihash.push_back(static_cast<uint8_t>(digest.size()));
    multihash.insert(multihash.end(), digest.begin(), digest.end());
    return multihash;
}

}

Result<PeerId, CertificateFailure> PeerId::FromPublicKey(const PublicKey& public_key) {
    auto encoded_result = public_key.ToProtobuf();
    if (encoded_result.IsErr()) {
        return Result<PeerId, CertificateFailure>::Err(std::move(encoded_result).UnwrapErr());
    }
    return Result<PeerId, CertificateFailure>::Ok(PeerId(Multihash(encoded_result.Unwrap())));
}

Result<PeerId, CertificateFailure> PeerId::FromBytes(const std::span<const uint8_t> multihash) {
    if (multihash.size() < 2) {
        return Result<PeerId, CertificateFailure>::Err(
            CertificateFailure::Malformed("Peer id multihash is truncated"));
    }
    const uint8_t code = multihash[0];
    const size_t length = multihash[1];
    if (length != multihash.size() - 2) {
        return Result<PeerId, CertificateFailure>::Err(
            CertificateFailure::Malformed("Peer id multihash length does not match its digest"));
    }
    if (code == kMultihashIdentityCode) {
        if (length > kMaxInlineKeyLength) {
            return Result<PeerId, CertificateFailure>::Err(
                CertificateFailure::Malformed("Inlined peer id key is too long"));
        }
    } else if (code == kMultihashSha256Code) {
        if (length != kSha256DigestBytes) {
            return Result<PeerId, CertificateFailure>::Err(
                CertificateFailure::Malformed("SHA-256 peer id must carry a 32-byte digest"));
        }
    } else {
        return Result<PeerId, CertificateFailure>::Err(
            CertificateFailure::Malformed("Unsupported peer id multihash code"));
    }
    return Result<PeerId, CertificateFailure>::Ok(
        PeerId(std::vector<uint8_t>(multihash.begin(), multihash.end())));
}

Result<PeerId, CertificateFailure> PeerId::FromBase58(const std::string_view encoded) {
    if (encoded.empty()) {
        return Result<PeerId, CertificateFailure>::Err(
            CertificateFailure::Malformed("Peer id string is empty"));
    }
    auto bytes_result = DecodeBase58(encoded);
    if (bytes_result.IsErr()) {
        return Result<PeerId, CertificateFailure>::Err(std::move(bytes_result).UnwrapErr());
    }
    return FromBytes(bytes_result.Unwrap());
}

std::string PeerId::ToBase58() const {
    return EncodeBase58(multihash_);
}

bool PeerId::IsDerivedFrom(const PublicKey& public_key) const {
    auto derived = FromPublicKey(public_key);
    return derived.IsOk() && derived.Unwrap() == *this;
}

}
