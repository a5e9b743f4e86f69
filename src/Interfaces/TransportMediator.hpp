//----------------------------------------------------------------------------------------------------------------------
// File: TransportMediator.hpp
// Description: Defines the callbacks a peer transport reports its activity through. Callbacks may be invoked from the
// transport's own execution context.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "PeerTransport.hpp"
#include "Components/Peer/ConnectionState.hpp"
#include "Components/Peer/Identity.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class ITransportMediator
{
public:
    virtual ~ITransportMediator() = default;

    virtual void OnPeerFound(Peer::Identity const& identity, Peer::DiscoveryInfo const& info) = 0;
    virtual void OnPeerLost(std::string const& peerId) = 0;

    // Returns whether the invitation should be accepted.
    [[nodiscard]] virtual bool OnInvitation(Peer::Identity const& identity) = 0;

    virtual void OnPeerStateChanged(std::string const& peerId, Peer::ConnectionState state) = 0;
    virtual void OnDataReceived(std::span<std::uint8_t const> buffer, std::string const& peerId) = 0;
    virtual void OnTransportError(std::string_view description) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
