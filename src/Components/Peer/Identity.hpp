//----------------------------------------------------------------------------------------------------------------------
// File: Identity.hpp
// Description: The identity a peer presents on the network. Two identities refer to the same peer when their peer
// identifiers match, the descriptive fields do not participate in comparisons.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Message/MessageTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Peer {
//----------------------------------------------------------------------------------------------------------------------

class Identity;

//----------------------------------------------------------------------------------------------------------------------
} // Peer namespace
//----------------------------------------------------------------------------------------------------------------------

class Peer::Identity
{
public:
    Identity(std::string_view peerId, std::string_view displayName);
    Identity(
        std::string_view peerId,
        std::string_view displayName,
        std::optional<std::string> const& optDeviceInfo,
        std::optional<Message::Buffer> const& optAvatar = {});

    // Creates an identity with a freshly generated peer identifier.
    [[nodiscard]] static Identity Generate(
        std::string_view displayName, std::optional<std::string> const& optDeviceInfo = {});

    [[nodiscard]] bool operator==(Identity const& other) const noexcept;

    [[nodiscard]] std::string const& GetPeerId() const noexcept;
    [[nodiscard]] std::string const& GetDisplayName() const noexcept;
    [[nodiscard]] std::optional<std::string> const& GetDeviceInfo() const noexcept;
    [[nodiscard]] std::optional<Message::Buffer> const& GetAvatar() const noexcept;

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] bool IsEquivalent(Identity const& other) const noexcept; // Compares every field.

private:
    std::string m_peerId;
    std::string m_displayName;
    std::optional<std::string> m_optDeviceInfo;
    std::optional<Message::Buffer> m_optAvatar;
};

//----------------------------------------------------------------------------------------------------------------------

template<>
struct std::hash<Peer::Identity>
{
    [[nodiscard]] std::size_t operator()(Peer::Identity const& identity) const noexcept
    {
        return std::hash<std::string>{}(identity.GetPeerId());
    }
};

//----------------------------------------------------------------------------------------------------------------------
