//----------------------------------------------------------------------------------------------------------------------
// File: SessionObserver.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Result.hpp"
#include "Components/Peer/ConnectionState.hpp"
#include "Components/Peer/Identity.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <span>
//----------------------------------------------------------------------------------------------------------------------

class ISessionObserver
{
public:
    virtual ~ISessionObserver() = default;

    virtual void OnDataReceived(std::span<std::uint8_t const> buffer, Peer::Identity const& peer) = 0;
    virtual void OnPeerStateChanged(Peer::Identity const& peer, Peer::ConnectionState state) = 0;
    virtual void OnError(Parley::Result const& result) = 0;
    virtual void OnPeerDiscovered(Peer::Identity const& peer) = 0;
    virtual void OnPeerLost(Peer::Identity const& peer) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
