//----------------------------------------------------------------------------------------------------------------------
// File: ConnectionState.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Peer {
//----------------------------------------------------------------------------------------------------------------------

enum class ConnectionState : std::uint32_t { NotConnected, Connecting, Connected, Disconnected };

// The reliability class the transport should use for a send. Small payloads use the ordered, reliable channel.
enum class TransportMode : std::uint32_t { Reliable, Unreliable };

[[nodiscard]] constexpr std::string_view ToString(ConnectionState state)
{
    switch (state) {
        case ConnectionState::NotConnected: return "not connected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view ToString(TransportMode mode)
{
    switch (mode) {
        case TransportMode::Reliable: return "reliable";
        case TransportMode::Unreliable: return "unreliable";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------
} // Peer namespace
//----------------------------------------------------------------------------------------------------------------------
