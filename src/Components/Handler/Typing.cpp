//----------------------------------------------------------------------------------------------------------------------
// File: Typing.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Typing.hpp"
#include "Records.hpp"
#include "Components/Message/ContentType.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const SupportedTypes = { std::string{ Message::ContentType::Typing } };

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view HasPreview = "has-preview";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Handler::Typing::Typing(Peer::Identity const& identity)
    : IHandler(Priority::Specific, identity)
{
}

//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const& Handler::Typing::GetContentTypes() const { return local::SupportedTypes; }

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Typing::Handle(Message::Envelope const& envelope, Parley::Result& result) const
{
    auto optRecord = Records::Typing::FromPack(envelope.GetPayload());
    if (!optRecord) {
        m_logger->warn("Failed to unpack a typing record from {}.", envelope.GetSender().GetPeerId());
        result = Parley::ResultCode::DeserializationFailed;
        return {};
    }

    result = Parley::ResultCode::Success;
    return Chat::TypingStatus{
        .peer = envelope.GetSender(),
        .isTyping = optRecord->isTyping,
        .preview = std::move(optRecord->preview)
    };
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Typing::Encode(Chat::Message const&) const { return {}; }

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Typing::CreateTypingEnvelope(
    bool isTyping, Peer::Identity const& sender, std::optional<std::string> const& optPreview)
{
    Records::Typing const record{ .isTyping = isTyping, .preview = optPreview };
    auto optPack = record.GetPack();
    if (!optPack) { return {}; }

    auto builder = Message::Envelope::GetBuilder();
    builder
        .SetSender(sender)
        .SetContentType(Message::ContentType::Typing)
        .SetPayload(std::move(*optPack));
    if (optPreview) { builder.AddMetadata(symbols::HasPreview, "true"); }
    return builder.ValidatedBuild();
}

//----------------------------------------------------------------------------------------------------------------------
