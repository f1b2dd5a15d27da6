#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace peerquic {

inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SeedBytes = 32;
inline constexpr size_t kEd25519SignatureBytes = 64;
inline constexpr size_t kSha256DigestBytes = 32;

inline constexpr std::string_view kIdentitySigningPrefix = "libp2p-tls-handshake:";
inline constexpr std::string_view kIdentityExtensionOid = "1.3.6.1.4.1.53594.1.1";
inline constexpr std::string_view kAlpnProtocol = "libp2p";

inline constexpr uint8_t kMultihashIdentityCode = 0x00;
inline constexpr uint8_t kMultihashSha256Code = 0x12;
inline constexpr size_t kMaxInlineKeyLength = 42;

struct CertificateConstants {
    static constexpr std::string_view NOT_BEFORE = "19750101000000Z";
    static constexpr std::string_view NOT_AFTER = "40960101000000Z";
    static constexpr std::string_view EPHEMERAL_CURVE = "P-256";
    static constexpr std::string_view SUBJECT_ORGANIZATION = "peerquic";
    static constexpr size_t SERIAL_BYTES = 8;
    static constexpr long X509_VERSION_V3 = 2;
};

struct QuicConstants {
    static constexpr size_t SCID_LENGTH = 18;
    static constexpr size_t MAX_UDP_PAYLOAD = 1452;
    static constexpr size_t RECV_BUFFER_SIZE = 65536;
    static constexpr size_t MAX_DATAGRAMS_PER_READ = 64;
    static constexpr size_t MAX_DATAGRAMS_PER_FLUSH = 64;
    static constexpr size_t STATELESS_RESET_TOKEN_LENGTH = 16;
    static constexpr uint64_t APPLICATION_NO_ERROR = 0;
    static constexpr uint64_t STREAM_CANCELLED_ERROR = 1;
};

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr size_t ERROR_BUFFER_SIZE = 256;
};

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "libsodium is not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Secure memory handle has been disposed";
    static constexpr std::string_view CONNECTION_CLOSED = "Connection is closed";
    static constexpr std::string_view ENDPOINT_CLOSED = "Endpoint is closed";
};

}
