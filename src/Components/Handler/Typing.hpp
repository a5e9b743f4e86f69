//----------------------------------------------------------------------------------------------------------------------
// File: Typing.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Handler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Handles typing indicators. Indicators are ephemeral and never produced from chat messages.
//----------------------------------------------------------------------------------------------------------------------
class Handler::Typing : public Handler::IHandler
{
public:
    explicit Typing(Peer::Identity const& identity);

    // IHandler {
    [[nodiscard]] virtual ContentTypes const& GetContentTypes() const override;
    [[nodiscard]] virtual OptionalEvent Handle(Message::Envelope const& envelope, Parley::Result& result) const override;
    [[nodiscard]] virtual OptionalEnvelope Encode(Chat::Message const& message) const override;
    // } IHandler

    [[nodiscard]] static OptionalEnvelope CreateTypingEnvelope(
        bool isTyping, Peer::Identity const& sender, std::optional<std::string> const& optPreview = {});
};

//----------------------------------------------------------------------------------------------------------------------
