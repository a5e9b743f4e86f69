//----------------------------------------------------------------------------------------------------------------------
// File: PeerTransport.hpp
// Description: Defines the point to point transport capability consumed by the peer session. The transport is
// responsible for discovery, connection establishment, and delivery of opaque byte buffers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Peer/ConnectionState.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class ITransportMediator;

//----------------------------------------------------------------------------------------------------------------------
namespace Peer {
//----------------------------------------------------------------------------------------------------------------------

// The key-value pairs published while advertising and reported when a peer is found.
using DiscoveryInfo = std::map<std::string, std::string>;
using PeerIds = std::vector<std::string>;

//----------------------------------------------------------------------------------------------------------------------
} // Peer namespace
//----------------------------------------------------------------------------------------------------------------------

class IPeerTransport
{
public:
    virtual ~IPeerTransport() = default;

    // Note: The mediator must outlive the transport's use of it. Providing nullptr detaches the current mediator.
    virtual void SetMediator(ITransportMediator* const mediator) = 0;

    virtual void StartAdvertising(Peer::DiscoveryInfo const& info) = 0;
    virtual void StopAdvertising() = 0;
    virtual void StartBrowsing() = 0;
    virtual void StopBrowsing() = 0;

    virtual void Invite(std::string const& peerId, std::chrono::milliseconds const& timeout) = 0;

    [[nodiscard]] virtual bool Send(
        std::span<std::uint8_t const> buffer, Peer::PeerIds const& peerIds, Peer::TransportMode mode) = 0;

    virtual void Disconnect() = 0;
};

//----------------------------------------------------------------------------------------------------------------------
