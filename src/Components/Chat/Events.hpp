//----------------------------------------------------------------------------------------------------------------------
// File: Events.hpp
// Description: The closed set of application events produced by the message processor. Every processed envelope
// yields exactly one event.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Message.hpp"
#include "Components/Peer/Identity.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Chat {
//----------------------------------------------------------------------------------------------------------------------

enum class ReactionAction : std::uint8_t { Add, Remove };
enum class SystemEventKind : std::uint8_t { PeerJoined, PeerLeft, Notice };

struct MessagePatch
{
    [[nodiscard]] bool operator==(MessagePatch const& other) const = default;

    std::optional<Status> status;
    std::optional<std::string> text;
};

struct NewMessage
{
    Message message;
};

struct UpdateMessage
{
    std::string id;
    MessagePatch patch;
};

struct TypingStatus
{
    Peer::Identity peer;
    bool isTyping;
    std::optional<std::string> preview;
};

struct Reaction
{
    std::string messageId;
    std::string emoji;
    ReactionAction action;
    Peer::Identity reactor;
};

struct SystemEvent
{
    SystemEventKind kind;
    std::optional<Peer::Identity> peer;
    std::string text;
};

struct EditMessage
{
    std::string id;
    std::string text;
    Peer::Identity editor;
};

struct DeleteMessage
{
    std::string id;
    Peer::Identity requester;
};

struct Receipt
{
    std::string id;
    Status status;
    Peer::Identity reporter;
};

using Event = std::variant<
    NewMessage, UpdateMessage, TypingStatus, Reaction, SystemEvent, EditMessage, DeleteMessage, Receipt>;

[[nodiscard]] constexpr std::string_view ToString(ReactionAction action)
{
    switch (action) {
        case ReactionAction::Add: return "add";
        case ReactionAction::Remove: return "remove";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view ToString(SystemEventKind kind)
{
    switch (kind) {
        case SystemEventKind::PeerJoined: return "peer joined";
        case SystemEventKind::PeerLeft: return "peer left";
        case SystemEventKind::Notice: return "notice";
    }
    return "unknown";
}

// Used when logging. The names match the alternative struct names.
[[nodiscard]] constexpr std::string_view GetEventName(Event const& event)
{
    constexpr std::string_view Names[] = {
        "NewMessage", "UpdateMessage", "TypingStatus", "Reaction",
        "SystemEvent", "EditMessage", "DeleteMessage", "Receipt"
    };
    static_assert(std::size(Names) == std::variant_size_v<Event>);
    return Names[event.index()];
}

//----------------------------------------------------------------------------------------------------------------------
} // Chat namespace
//----------------------------------------------------------------------------------------------------------------------
