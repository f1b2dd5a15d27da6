#include "peerquic/core/failures.hpp"

namespace peerquic {

std::string_view ToString(const CertificateFailureType type) noexcept {
    switch (type) {
        case CertificateFailureType::Encoding: return "EncodingError";
        case CertificateFailureType::MalformedCertificate: return "MalformedCertificate";
        case CertificateFailureType::MissingIdentityExtension: return "MissingIdentityExtension";
        case CertificateFailureType::SelfSignatureInvalid: return "SelfSignatureInvalid";
        case CertificateFailureType::IdentityBindingInvalid: return "IdentityBindingInvalid";
        case CertificateFailureType::ValidityPeriodInvalid: return "ValidityPeriodInvalid";
    }
    return "Unknown";
}

std::string_view ToString(const TransportFailureType type) noexcept {
    switch (type) {
        case TransportFailureType::Encoding: return "EncodingError";
        case TransportFailureType::MalformedCertificate: return "MalformedCertificate";
        case TransportFailureType::MissingIdentityExtension: return "MissingIdentityExtension";
        case TransportFailureType::SelfSignatureInvalid: return "SelfSignatureInvalid";
        case TransportFailureType::IdentityBindingInvalid: return "IdentityBindingInvalid";
        case TransportFailureType::ValidityPeriodInvalid: return "ValidityPeriodInvalid";
        case TransportFailureType::ConnectionNotReady: return "ConnectionNotReady";
        case TransportFailureType::StreamLimitExceeded: return "StreamLimitExceeded";
        case TransportFailureType::ConnectionClosed: return "ConnectionClosed";
        case TransportFailureType::StreamReset: return "StreamReset";
        case TransportFailureType::AddressFamilyMismatch: return "AddressFamilyMismatch";
        case TransportFailureType::InvalidAddress: return "InvalidAddress";
        case TransportFailureType::Socket: return "SocketError";
        case TransportFailureType::Engine: return "EngineError";
        case TransportFailureType::HandshakeFailed: return "HandshakeFailed";
        case TransportFailureType::Cancelled: return "Cancelled";
        case TransportFailureType::ListenerClosed: return "ListenerClosed";
        case TransportFailureType::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

}
