#pragma once
#include <string>
#include <string_view>
namespace peerquic {
enum class SodiumFailureType {
    InitializationFailed,
    AllocationFailed,
    BufferTooSmall,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class CertificateFailureType {
    Encoding,
    MalformedCertificate,
    MissingIdentityExtension,
    SelfSignatureInvalid,
    IdentityBindingInvalid,
    ValidityPeriodInvalid
};
enum class TransportFailureType {
    Encoding,
    MalformedCertificate,
    MissingIdentityExtension,
    SelfSignatureInvalid,
    IdentityBindingInvalid,
    ValidityPeriodInvalid,
    ConnectionNotReady,
    StreamLimitExceeded,
    ConnectionClosed,
    StreamReset,
    AddressFamilyMismatch,
    InvalidAddress,
    Socket,
    Engine,
    HandshakeFailed,
    Cancelled,
    ListenerClosed,
    InvalidArgument
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class CertificateFailure {
public:
    CertificateFailureType type;
    std::string message;
    CertificateFailure(const CertificateFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CertificateFailure Encoding(std::string msg) {
        return {CertificateFailureType::Encoding, std::move(msg)};
    }
    static CertificateFailure Malformed(std::string msg) {
        return {CertificateFailureType::MalformedCertificate, std::move(msg)};
    }
    static CertificateFailure MissingIdentityExtension(std::string msg) {
        return {CertificateFailureType::MissingIdentityExtension, std::move(msg)};
    }
    static CertificateFailure SelfSignatureInvalid(std::string msg) {
        return {CertificateFailureType::SelfSignatureInvalid, std::move(msg)};
    }
    static CertificateFailure IdentityBindingInvalid(std::string msg) {
        return {CertificateFailureType::IdentityBindingInvalid, std::move(msg)};
    }
    static CertificateFailure ValidityPeriodInvalid(std::string msg) {
        return {CertificateFailureType::ValidityPeriodInvalid, std::move(msg)};
    }
    static CertificateFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Encoding(sf.message);
    }
};
class TransportFailure {
public:
    TransportFailureType type;
    std::string message;
    TransportFailure(const TransportFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static TransportFailure ConnectionNotReady(std::string msg) {
        return {TransportFailureType::ConnectionNotReady, std::move(msg)};
    }
    static TransportFailure StreamLimitExceeded(std::string msg) {
        return {TransportFailureType::StreamLimitExceeded, std::move(msg)};
    }
    static TransportFailure ConnectionClosed(std::string msg) {
        return {TransportFailureType::ConnectionClosed, std::move(msg)};
    }
    static TransportFailure StreamReset(std::string msg) {
        return {TransportFailureType::StreamReset, std::move(msg)};
    }
    static TransportFailure AddressFamilyMismatch(std::string msg) {
        return {TransportFailureType::AddressFamilyMismatch, std::move(msg)};
    }
    static TransportFailure InvalidAddress(std::string msg) {
        return {TransportFailureType::InvalidAddress, std::move(msg)};
    }
    static TransportFailure Socket(std::string msg) {
        return {TransportFailureType::Socket, std::move(msg)};
    }
    static TransportFailure Engine(std::string msg) {
        return {TransportFailureType::Engine, std::move(msg)};
    }
    static TransportFailure HandshakeFailed(std::string msg) {
        return {TransportFailureType::HandshakeFailed, std::move(msg)};
    }
    static TransportFailure Cancelled(std::string msg) {
        return {TransportFailureType::Cancelled, std::move(msg)};
    }
    static TransportFailure ListenerClosed(std::string msg) {
        return {TransportFailureType::ListenerClosed, std::move(msg)};
    }
    static TransportFailure InvalidArgument(std::string msg) {
        return {TransportFailureType::InvalidArgument, std::move(msg)};
    }
    static TransportFailure FromCertificateFailure(const CertificateFailure& cf) {
        switch (cf.type) {
            case CertificateFailureType::Encoding:
                return {TransportFailureType::Encoding, cf.message};
            case CertificateFailureType::MalformedCertificate:
                return {TransportFailureType::MalformedCertificate, cf.message};
            case CertificateFailureType::MissingIdentityExtension:
                return {TransportFailureType::MissingIdentityExtension, cf.message};
            case CertificateFailureType::SelfSignatureInvalid:
                return {TransportFailureType::SelfSignatureInvalid, cf.message};
            case CertificateFailureType::IdentityBindingInvalid:
                return {TransportFailureType::IdentityBindingInvalid, cf.message};
            case CertificateFailureType::ValidityPeriodInvalid:
                return {TransportFailureType::ValidityPeriodInvalid, cf.message};
        }
        return {TransportFailureType::HandshakeFailed, cf.message};
    }
    [[nodiscard]] bool IsAuthenticationFailure() const noexcept {
        switch (type) {
            case TransportFailureType::MalformedCertificate:
            case TransportFailureType::MissingIdentityExtension:
            case TransportFailureType::SelfSignatureInvalid:
            case TransportFailureType::IdentityBindingInvalid:
            case TransportFailureType::ValidityPeriodInvalid:
                return true;
            default:
                return false;
        }
    }
};
std::string_view ToString(CertificateFailureType type) noexcept;
std::string_view ToString(TransportFailureType type) noexcept;
}
