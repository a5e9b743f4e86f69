//----------------------------------------------------------------------------------------------------------------------
// File: SessionOptions.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Peer {
//----------------------------------------------------------------------------------------------------------------------

struct SessionOptions;

namespace Defaults {

constexpr std::string_view ServiceType = "parley-chat";
constexpr std::size_t ReliableThreshold = 200'000; // bytes
constexpr std::chrono::milliseconds InviteTimeout = std::chrono::seconds{ 30 };
constexpr bool AutoAccept = true;

} // Defaults namespace

//----------------------------------------------------------------------------------------------------------------------
} // Peer namespace
//----------------------------------------------------------------------------------------------------------------------

struct Peer::SessionOptions
{
    std::string serviceType = std::string{ Defaults::ServiceType };
    std::size_t reliableThreshold = Defaults::ReliableThreshold; // Serialized envelopes above this size are unreliable.
    std::chrono::milliseconds inviteTimeout = Defaults::InviteTimeout;
    bool autoAccept = Defaults::AutoAccept; // Used when no invitation policy has been provided.

    [[nodiscard]] bool operator==(SessionOptions const& other) const = default;
};

//----------------------------------------------------------------------------------------------------------------------
