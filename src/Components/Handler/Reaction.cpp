//----------------------------------------------------------------------------------------------------------------------
// File: Reaction.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Reaction.hpp"
#include "Records.hpp"
#include "Components/Message/ContentType.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const SupportedTypes = { std::string{ Message::ContentType::Reaction } };

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Handler::Reaction::Reaction(Peer::Identity const& identity)
    : IHandler(Priority::Specific, identity)
{
}

//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const& Handler::Reaction::GetContentTypes() const { return local::SupportedTypes; }

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Reaction::Handle(Message::Envelope const& envelope, Parley::Result& result) const
{
    auto optRecord = Records::Reaction::FromPack(envelope.GetPayload());
    if (!optRecord) {
        m_logger->warn("Failed to unpack a reaction record from {}.", envelope.GetSender().GetPeerId());
        result = Parley::ResultCode::DeserializationFailed;
        return {};
    }

    result = Parley::ResultCode::Success;
    return Chat::Reaction{
        .messageId = std::move(optRecord->messageId),
        .emoji = std::move(optRecord->emoji),
        .action = optRecord->action,
        .reactor = envelope.GetSender()
    };
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Reaction::Encode(Chat::Message const&) const { return {}; }

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Reaction::CreateReactionEnvelope(
    std::string_view messageId, std::string_view emoji, Chat::ReactionAction action, Peer::Identity const& sender)
{
    Records::Reaction const record{ .messageId = std::string{ messageId }, .emoji = std::string{ emoji }, .action = action };
    auto optPack = record.GetPack();
    if (!optPack) { return {}; }

    return Message::Envelope::GetBuilder()
        .SetSender(sender)
        .SetContentType(Message::ContentType::Reaction)
        .SetPayload(std::move(*optPack))
        .ValidatedBuild();
}

//----------------------------------------------------------------------------------------------------------------------
