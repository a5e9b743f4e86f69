//----------------------------------------------------------------------------------------------------------------------
// File: Image.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Image.hpp"
#include "Records.hpp"
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
    std::string{ Message::ContentType::ImageJpeg },
    std::string{ Message::ContentType::ImagePng },
    std::string{ Message::ContentType::ImageGif },
    std::string{ Message::ContentType::ImageHeic },
    std::string{ Message::ContentType::ImageSvg }
};

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Caption = "caption";
constexpr std::string_view Filename = "filename";
constexpr std::string_view Structured = "structured";
constexpr std::string_view True = "true";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Handler::Image::Image(Peer::Identity const& identity)
    : IHandler(Priority::Specific, identity)
{
}

//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const& Handler::Image::GetContentTypes() const { return local::SupportedTypes; }

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Image::Handle(Message::Envelope const& envelope, Parley::Result& result) const
{
    bool const structured = envelope.GetMetadataValue(symbols::Structured) == symbols::True;
    auto optAttachment = structured ? HandleStructured(envelope, result) : HandleRaw(envelope, result);
    if (!optAttachment) { return {}; }

    auto message = CreateInboundMessage(envelope);
    if (optAttachment->caption) { message.SetText(*optAttachment->caption); }
    message.AddAttachment(*optAttachment);

    result = Parley::ResultCode::Success;
    return Chat::NewMessage{ std::move(message) };
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Image::Encode(Chat::Message const& message) const
{
    if (message.GetAttachments().size() != 1) { return {}; }

    auto const& attachment = message.GetAttachments().front();
    auto contentType = attachment.contentType.empty() ?
        std::string{ Message::ContentType::ImageJpeg } : Message::ContentType::Normalize(attachment.contentType);
    if (!Message::ContentType::IsImage(contentType)) { return {}; }

    Records::Image record;
    record.data = attachment.data;
    record.thumbnail = attachment.thumbnail;
    record.caption = message.HasText() ? std::optional<std::string>{ message.GetText() } : attachment.caption;
    record.contentType = contentType;
    record.filename = attachment.filename.empty() ? GetDefaultFilename(contentType) : attachment.filename;

    auto optPack = record.GetPack();
    if (!optPack) {
        m_logger->warn("Failed to pack the image record for message {}.", message.GetId());
        return {};
    }

    return CreateOutboundBuilder(message)
        .SetContentType(contentType)
        .SetPayload(std::move(*optPack))
        .AddMetadata(symbols::Structured, symbols::True)
        .AddMetadata(symbols::Filename, record.filename)
        .ValidatedBuild();
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Image::CreateImageEnvelope(
    std::span<std::uint8_t const> data,
    std::string_view contentType,
    std::string_view filename,
    std::optional<std::string> const& optCaption,
    Peer::Identity const& sender)
{
    auto builder = Message::Envelope::GetBuilder();
    builder
        .SetSender(sender)
        .SetContentType(contentType)
        .SetPayload(data)
        .AddMetadata(symbols::Filename, filename);
    if (optCaption) { builder.AddMetadata(symbols::Caption, *optCaption); }
    return builder.ValidatedBuild();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Handler::Image::GetDefaultFilename(std::string_view contentType)
{
    auto const subtype = Message::ContentType::GetSubType(contentType);
    std::string filename = "image.";
    filename.append(subtype.empty() ? DefaultExtension : subtype);
    return filename;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chat::Attachment> Handler::Image::HandleStructured(
    Message::Envelope const& envelope, Parley::Result& result) const
{
    auto optRecord = Records::Image::FromPack(envelope.GetPayload());
    if (!optRecord) {
        m_logger->warn("Failed to unpack a structured image record from {}.", envelope.GetSender().GetPeerId());
        result = Parley::ResultCode::DeserializationFailed;
        return {};
    }

    if (optRecord->data.empty()) {
        result = Parley::ResultCode::InvalidPayload;
        return {};
    }

    return Chat::Attachment{
        .data = std::move(optRecord->data),
        .thumbnail = std::move(optRecord->thumbnail),
        .filename = optRecord->filename.empty() ?
            GetDefaultFilename(envelope.GetContentType()) : std::move(optRecord->filename),
        .contentType = optRecord->contentType.empty() ? envelope.GetContentType() : std::move(optRecord->contentType),
        .caption = std::move(optRecord->caption)
    };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chat::Attachment> Handler::Image::HandleRaw(
    Message::Envelope const& envelope, Parley::Result& result) const
{
    if (envelope.GetPayload().empty()) {
        m_logger->warn("Received an empty image payload from {}.", envelope.GetSender().GetPeerId());
        result = Parley::ResultCode::InvalidPayload;
        return {};
    }

    auto const optFilename = envelope.GetMetadataValue(symbols::Filename);
    return Chat::Attachment{
        .data = envelope.GetPayload(),
        .thumbnail = {},
        .filename = optFilename ? *optFilename : GetDefaultFilename(envelope.GetContentType()),
        .contentType = envelope.GetContentType(),
        .caption = envelope.GetMetadataValue(symbols::Caption)
    };
}

//----------------------------------------------------------------------------------------------------------------------
