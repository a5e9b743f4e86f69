//----------------------------------------------------------------------------------------------------------------------
// File: Message.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Message.hpp"
#include "Components/Identifier/Identifier.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

std::optional<Chat::Status> Chat::ParseStatus(std::string_view value)
{
    constexpr std::array<Status, 5> Statuses = {
        Status::Sending, Status::Sent, Status::Delivered, Status::Read, Status::Failed
    };

    for (auto const status : Statuses) {
        if (ToString(status) == value) { return status; }
    }

    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Chat::Message::Message(
    std::string_view id,
    TimeUtils::Timepoint const& timestamp,
    Peer::Identity const& author,
    Origin origin,
    Status status)
    : m_id(id)
    , m_timestamp(timestamp)
    , m_author(author)
    , m_origin(origin)
    , m_status(status)
    , m_text()
    , m_attachments()
    , m_optRawContent()
{
}

//----------------------------------------------------------------------------------------------------------------------

Chat::Message Chat::Message::CreateOutbound(
    Peer::Identity const& author, std::string_view text, Attachments const& attachments)
{
    Message message{ Identifier::Generate(), TimeUtils::GetSystemTimepoint(), author, Origin::Local, Status::Sending };
    message.m_text = text;
    message.m_attachments = attachments;
    return message;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Chat::Message::GetId() const { return m_id; }

//----------------------------------------------------------------------------------------------------------------------

TimeUtils::Timepoint const& Chat::Message::GetTimestamp() const { return m_timestamp; }

//----------------------------------------------------------------------------------------------------------------------

Peer::Identity const& Chat::Message::GetAuthor() const { return m_author; }

//----------------------------------------------------------------------------------------------------------------------

Chat::Origin Chat::Message::GetOrigin() const { return m_origin; }

//----------------------------------------------------------------------------------------------------------------------

Chat::Status Chat::Message::GetStatus() const { return m_status; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Chat::Message::GetText() const { return m_text; }

//----------------------------------------------------------------------------------------------------------------------

Chat::Attachments const& Chat::Message::GetAttachments() const { return m_attachments; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chat::RawContent> const& Chat::Message::GetRawContent() const { return m_optRawContent; }

//----------------------------------------------------------------------------------------------------------------------

bool Chat::Message::HasText() const { return !m_text.empty(); }

//----------------------------------------------------------------------------------------------------------------------

bool Chat::Message::HasAttachments() const { return !m_attachments.empty(); }

//----------------------------------------------------------------------------------------------------------------------

bool Chat::Message::HasRawContent() const { return m_optRawContent.has_value(); }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Chat::Message::GetFacetCount() const
{
    return (HasText() ? 1 : 0) + m_attachments.size();
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::Message::SetStatus(Status status) { m_status = status; }

//----------------------------------------------------------------------------------------------------------------------

void Chat::Message::SetText(std::string_view text) { m_text = text; }

//----------------------------------------------------------------------------------------------------------------------

void Chat::Message::AddAttachment(Attachment const& attachment) { m_attachments.emplace_back(attachment); }

//----------------------------------------------------------------------------------------------------------------------

void Chat::Message::SetRawContent(RawContent const& content) { m_optRawContent = content; }

//----------------------------------------------------------------------------------------------------------------------
