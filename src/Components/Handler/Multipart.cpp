//----------------------------------------------------------------------------------------------------------------------
// File: Multipart.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Multipart.hpp"
#include "Generic.hpp"
#include "Records.hpp"
#include "Components/Identifier/Identifier.hpp"
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

Handler::ContentTypes const SupportedTypes = {
    std::string{ Message::ContentType::MultipartMixed },
    std::string{ Message::ContentType::MultipartAlternative },
    std::string{ Message::ContentType::MultipartRelated }
};

[[nodiscard]] std::optional<Message::Envelope> CreatePartEnvelope(
    Message::Envelope const& container, Handler::Records::Part const& part);

[[nodiscard]] std::optional<Message::Buffer> PackParts(std::vector<Handler::Records::Part>&& parts);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Caption = "caption";
constexpr std::string_view Filename = "filename";
constexpr std::string_view PartsCount = "parts-count";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Handler::Multipart::Multipart(Peer::Identity const& identity)
    : IHandler(Priority::Composite, identity)
    , m_text(identity)
    , m_image(identity)
    , m_reaction(identity)
{
}

//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const& Handler::Multipart::GetContentTypes() const { return local::SupportedTypes; }

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Multipart::Handle(Message::Envelope const& envelope, Parley::Result& result) const
{
    auto optRecord = Records::Multipart::FromPack(envelope.GetPayload());
    if (!optRecord) {
        m_logger->warn("Failed to unpack a multipart record from {}.", envelope.GetSender().GetPeerId());
        result = Parley::ResultCode::DeserializationFailed;
        return {};
    }

    std::string text;
    Chat::Attachments attachments;

    for (auto const& part : optRecord->parts) {
        auto const optPart = local::CreatePartEnvelope(envelope, part);
        if (!optPart) {
            m_logger->warn("Skipping a malformed part within multipart envelope {}.", envelope.GetId());
            continue;
        }

        Parley::Result partResult;
        auto optEvent = DispatchPart(*optPart, partResult);
        if (!optEvent) {
            m_logger->debug("Skipping part {} of multipart envelope {}. Reason: {}",
                optPart->GetId(), envelope.GetId(), partResult.what());
            continue;
        }

        // A reaction within a container takes precedence over everything else in the container.
        if (std::holds_alternative<Chat::Reaction>(*optEvent)) {
            result = Parley::ResultCode::Success;
            return optEvent;
        }

        if (auto const pNewMessage = std::get_if<Chat::NewMessage>(&*optEvent); pNewMessage) {
            auto const& message = pNewMessage->message;
            if (message.HasAttachments()) {
                for (auto const& attachment : message.GetAttachments()) { attachments.emplace_back(attachment); }
            } else if (message.HasText()) {
                if (!text.empty()) { text.push_back('\n'); }
                text.append(message.GetText());
            }
        }
    }

    result = Parley::ResultCode::Success;

    if (attachments.empty() && text.empty()) {
        return Chat::NewMessage{ Generic::CreateFallbackMessage(envelope, CreateInboundMessage(envelope)) };
    }

    auto message = CreateInboundMessage(envelope);
    message.SetText(text);
    for (auto const& attachment : attachments) { message.AddAttachment(attachment); }
    return Chat::NewMessage{ std::move(message) };
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Multipart::Encode(Chat::Message const& message) const
{
    if (message.GetFacetCount() < 2) { return {}; }

    std::vector<Records::Part> parts;
    parts.reserve(message.GetFacetCount());

    if (message.HasText()) {
        auto const& text = message.GetText();
        parts.emplace_back(Records::Part{
            .contentType = std::string{ Message::ContentType::TextPlain },
            .contentId = std::string{ TextContentId },
            .headers = {},
            .data = Message::Buffer{ text.begin(), text.end() }
        });
    }

    std::size_t index = 0;
    for (auto const& attachment : message.GetAttachments()) {
        auto const contentType = attachment.contentType.empty() ?
            std::string{ Message::ContentType::ImageJpeg } : Message::ContentType::Normalize(attachment.contentType);

        Message::Metadata headers;
        headers.emplace(symbols::Filename, attachment.filename.empty() ?
            Image::GetDefaultFilename(contentType) : attachment.filename);
        if (attachment.caption) { headers.emplace(symbols::Caption, *attachment.caption); }

        parts.emplace_back(Records::Part{
            .contentType = contentType,
            .contentId = "image_" + std::to_string(index++),
            .headers = std::move(headers),
            .data = attachment.data
        });
    }

    auto const count = parts.size();
    auto optPack = local::PackParts(std::move(parts));
    if (!optPack) {
        m_logger->warn("Failed to pack the multipart record for message {}.", message.GetId());
        return {};
    }

    return CreateOutboundBuilder(message)
        .SetContentType(Message::ContentType::MultipartMixed)
        .SetPayload(std::move(*optPack))
        .AddMetadata(symbols::PartsCount, std::to_string(count))
        .ValidatedBuild();
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Multipart::CreateMultipartEnvelope(
    std::optional<std::string> const& optText,
    std::vector<Message::Buffer> const& images,
    Peer::Identity const& sender,
    std::optional<Message::Metadata> const& optMetadata)
{
    std::vector<Records::Part> parts;
    if (optText) {
        parts.emplace_back(Records::Part{
            .contentType = std::string{ Message::ContentType::TextPlain },
            .contentId = std::string{ TextContentId },
            .headers = {},
            .data = Message::Buffer{ optText->begin(), optText->end() }
        });
    }

    for (std::size_t idx = 0; idx < images.size(); ++idx) {
        auto const identifier = "image_" + std::to_string(idx);
        parts.emplace_back(Records::Part{
            .contentType = std::string{ Message::ContentType::ImageJpeg },
            .contentId = identifier,
            .headers = Message::Metadata{ { std::string{ symbols::Filename }, identifier + ".jpg" } },
            .data = images[idx]
        });
    }

    if (parts.empty()) { return {}; }

    auto const count = parts.size();
    auto optPack = local::PackParts(std::move(parts));
    if (!optPack) { return {}; }

    auto builder = Message::Envelope::GetBuilder();
    builder
        .SetSender(sender)
        .SetContentType(Message::ContentType::MultipartMixed)
        .SetPayload(std::move(*optPack));
    if (optMetadata) {
        for (auto const& [key, value] : *optMetadata) { builder.AddMetadata(key, value); }
    }
    builder.AddMetadata(symbols::PartsCount, std::to_string(count));
    return builder.ValidatedBuild();
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Multipart::DispatchPart(Message::Envelope const& part, Parley::Result& result) const
{
    auto const& contentType = part.GetContentType();
    if (Message::ContentType::IsText(contentType)) { return m_text.Handle(part, result); }
    if (Message::ContentType::IsImage(contentType)) { return m_image.Handle(part, result); }
    if (Message::ContentType::Normalize(contentType) == Message::ContentType::Reaction) {
        return m_reaction.Handle(part, result);
    }

    result = Parley::ResultCode::UnsupportedContentType;
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::Envelope> local::CreatePartEnvelope(
    Message::Envelope const& container, Handler::Records::Part const& part)
{
    std::string identifier = container.GetId();
    identifier.push_back('_');
    identifier.append(part.contentId ? *part.contentId : Identifier::Generate());

    return Message::Envelope::GetBuilder()
        .SetId(identifier)
        .SetTimestamp(container.GetTimestamp())
        .SetSender(container.GetSender())
        .SetContentType(part.contentType)
        .SetPayload(std::span<std::uint8_t const>{ part.data })
        .SetMetadata(part.headers)
        .ValidatedBuild();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::Buffer> local::PackParts(std::vector<Handler::Records::Part>&& parts)
{
    Handler::Records::Multipart const record{ .boundary = Identifier::Generate(), .parts = std::move(parts) };
    return record.GetPack();
}

//----------------------------------------------------------------------------------------------------------------------
