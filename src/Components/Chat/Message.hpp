//----------------------------------------------------------------------------------------------------------------------
// File: Message.hpp
// Description: The application level representation of a chat message. Outbound messages are composed by the
// dispatcher and encoded by the handlers, inbound messages are produced by the handlers from received envelopes.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Message/MessageTypes.hpp"
#include "Components/Peer/Identity.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Chat {
//----------------------------------------------------------------------------------------------------------------------

class Message;

enum class Origin : std::uint32_t { Local, Remote };
enum class Status : std::uint32_t { Sending, Sent, Delivered, Read, Failed };

struct Attachment;
struct RawContent;

using Attachments = std::vector<Attachment>;

[[nodiscard]] constexpr std::string_view ToString(Status status)
{
    switch (status) {
        case Status::Sending: return "sending";
        case Status::Sent: return "sent";
        case Status::Delivered: return "delivered";
        case Status::Read: return "read";
        case Status::Failed: return "failed";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Status> ParseStatus(std::string_view value);

//----------------------------------------------------------------------------------------------------------------------
} // Chat namespace
//----------------------------------------------------------------------------------------------------------------------

struct Chat::Attachment
{
    [[nodiscard]] bool operator==(Attachment const& other) const = default;

    ::Message::Buffer data;
    std::optional<::Message::Buffer> thumbnail;
    std::string filename;
    std::string contentType;
    std::optional<std::string> caption;
};

//----------------------------------------------------------------------------------------------------------------------

// Content no handler could interpret. The bytes are kept such that the application may still present them.
struct Chat::RawContent
{
    [[nodiscard]] bool operator==(RawContent const& other) const = default;

    std::string contentType;
    ::Message::Buffer data;
};

//----------------------------------------------------------------------------------------------------------------------

class Chat::Message
{
public:
    Message(
        std::string_view id,
        TimeUtils::Timepoint const& timestamp,
        Peer::Identity const& author,
        Origin origin,
        Status status);

    // Composes a message authored by the local peer. The message receives a generated identifier, the current time,
    // and starts in the sending state.
    [[nodiscard]] static Message CreateOutbound(
        Peer::Identity const& author, std::string_view text, Attachments const& attachments = {});

    [[nodiscard]] std::string const& GetId() const;
    [[nodiscard]] TimeUtils::Timepoint const& GetTimestamp() const;
    [[nodiscard]] Peer::Identity const& GetAuthor() const;
    [[nodiscard]] Origin GetOrigin() const;
    [[nodiscard]] Status GetStatus() const;
    [[nodiscard]] std::string const& GetText() const;
    [[nodiscard]] Attachments const& GetAttachments() const;
    [[nodiscard]] std::optional<RawContent> const& GetRawContent() const;

    [[nodiscard]] bool HasText() const;
    [[nodiscard]] bool HasAttachments() const;
    [[nodiscard]] bool HasRawContent() const;
    [[nodiscard]] std::size_t GetFacetCount() const; // The number of separately encodable parts.

    void SetStatus(Status status);
    void SetText(std::string_view text);
    void AddAttachment(Attachment const& attachment);
    void SetRawContent(RawContent const& content);

private:
    std::string m_id;
    TimeUtils::Timepoint m_timestamp;
    Peer::Identity m_author;
    Origin m_origin;
    Status m_status;
    std::string m_text;
    Attachments m_attachments;
    std::optional<RawContent> m_optRawContent;
};

//----------------------------------------------------------------------------------------------------------------------
