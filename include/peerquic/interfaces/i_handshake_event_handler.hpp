#pragma once
#include "peerquic/core/failures.hpp"
#include "peerquic/identity/peer_id.hpp"
namespace peerquic::interfaces {
class IHandshakeEventHandler {
public:
    virtual ~IHandshakeEventHandler() = default;
    virtual void OnPeerVerified(const identity::PeerId& peer_id) = 0;
    virtual void OnPeerRejected(const CertificateFailure& failure) = 0;
};
}
