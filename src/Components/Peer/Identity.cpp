//----------------------------------------------------------------------------------------------------------------------
// File: Identity.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Identity.hpp"
#include "Components/Identifier/Identifier.hpp"
//----------------------------------------------------------------------------------------------------------------------

Peer::Identity::Identity(std::string_view peerId, std::string_view displayName)
    : m_peerId(peerId)
    , m_displayName(displayName)
    , m_optDeviceInfo()
    , m_optAvatar()
{
}

//----------------------------------------------------------------------------------------------------------------------

Peer::Identity::Identity(
    std::string_view peerId,
    std::string_view displayName,
    std::optional<std::string> const& optDeviceInfo,
    std::optional<Message::Buffer> const& optAvatar)
    : m_peerId(peerId)
    , m_displayName(displayName)
    , m_optDeviceInfo(optDeviceInfo)
    , m_optAvatar(optAvatar)
{
}

//----------------------------------------------------------------------------------------------------------------------

Peer::Identity Peer::Identity::Generate(std::string_view displayName, std::optional<std::string> const& optDeviceInfo)
{
    return Identity{ Identifier::Generate(), displayName, optDeviceInfo };
}

//----------------------------------------------------------------------------------------------------------------------

bool Peer::Identity::operator==(Identity const& other) const noexcept { return m_peerId == other.m_peerId; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Peer::Identity::GetPeerId() const noexcept { return m_peerId; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Peer::Identity::GetDisplayName() const noexcept { return m_displayName; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> const& Peer::Identity::GetDeviceInfo() const noexcept { return m_optDeviceInfo; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::Buffer> const& Peer::Identity::GetAvatar() const noexcept { return m_optAvatar; }

//----------------------------------------------------------------------------------------------------------------------

bool Peer::Identity::IsValid() const noexcept { return !m_peerId.empty(); }

//----------------------------------------------------------------------------------------------------------------------

bool Peer::Identity::IsEquivalent(Identity const& other) const noexcept
{
    return m_peerId == other.m_peerId &&
           m_displayName == other.m_displayName &&
           m_optDeviceInfo == other.m_optDeviceInfo &&
           m_optAvatar == other.m_optAvatar;
}

//----------------------------------------------------------------------------------------------------------------------
