//----------------------------------------------------------------------------------------------------------------------
// File: Reaction.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Handler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Handles reactions to previously delivered messages. Reactions are never produced from chat messages,
// they are created directly through CreateReactionEnvelope.
//----------------------------------------------------------------------------------------------------------------------
class Handler::Reaction : public Handler::IHandler
{
public:
    explicit Reaction(Peer::Identity const& identity);

    // IHandler {
    [[nodiscard]] virtual ContentTypes const& GetContentTypes() const override;
    [[nodiscard]] virtual OptionalEvent Handle(Message::Envelope const& envelope, Parley::Result& result) const override;
    [[nodiscard]] virtual OptionalEnvelope Encode(Chat::Message const& message) const override;
    // } IHandler

    [[nodiscard]] static OptionalEnvelope CreateReactionEnvelope(
        std::string_view messageId, std::string_view emoji, Chat::ReactionAction action, Peer::Identity const& sender);
};

//----------------------------------------------------------------------------------------------------------------------
