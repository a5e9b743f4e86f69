//----------------------------------------------------------------------------------------------------------------------
// File: Generic.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Generic.hpp"
#include "Components/Message/ContentType.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const SupportedTypes = {};

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Handler::Generic::Generic(Peer::Identity const& identity)
    : IHandler(Priority::Fallback, identity)
{
}

//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const& Handler::Generic::GetContentTypes() const { return local::SupportedTypes; }

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Generic::Handle(Message::Envelope const& envelope, Parley::Result& result) const
{
    m_logger->debug("Presenting {} content from {} as a placeholder.",
        envelope.GetContentType(), envelope.GetSender().GetPeerId());

    result = Parley::ResultCode::Success;
    return Chat::NewMessage{ CreateFallbackMessage(envelope, CreateInboundMessage(envelope)) };
}

//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Used only when no other handler applies. Raw content is sent with its own content type, otherwise the
// text is sent as opaque bytes. Messages with only attachments send the first attachment.
//----------------------------------------------------------------------------------------------------------------------
Handler::OptionalEnvelope Handler::Generic::Encode(Chat::Message const& message) const
{
    auto builder = CreateOutboundBuilder(message);
    if (auto const& optRaw = message.GetRawContent(); optRaw) {
        builder.SetContentType(optRaw->contentType).SetPayload(std::span<std::uint8_t const>{ optRaw->data });
    } else if (message.HasText()) {
        builder.SetContentType(Message::ContentType::ApplicationOctetStream)
            .SetPayload(std::string_view{ message.GetText() });
    } else if (message.HasAttachments()) {
        builder.SetContentType(Message::ContentType::ApplicationOctetStream)
            .SetPayload(std::span<std::uint8_t const>{ message.GetAttachments().front().data });
    } else {
        return {};
    }

    return builder.ValidatedBuild();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Handler::Generic::DescribeContent(std::string_view contentType)
{
    auto const subtype = Message::ContentType::GetSubType(contentType);
    std::string description = "[";
    description.append(subtype.empty() ? std::string_view{ "Unknown" } : subtype);
    description.append(" content]");
    return description;
}

//----------------------------------------------------------------------------------------------------------------------

Chat::Message Handler::Generic::CreateFallbackMessage(Message::Envelope const& envelope, Chat::Message message)
{
    message.SetText(DescribeContent(envelope.GetContentType()));
    message.SetRawContent(Chat::RawContent{ .contentType = envelope.GetContentType(), .data = envelope.GetPayload() });
    return message;
}

//----------------------------------------------------------------------------------------------------------------------
