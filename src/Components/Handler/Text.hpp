//----------------------------------------------------------------------------------------------------------------------
// File: Text.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Handler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Handles UTF-8 text payloads. Encodes messages that carry text without any attachments.
//----------------------------------------------------------------------------------------------------------------------
class Handler::Text : public Handler::IHandler
{
public:
    explicit Text(Peer::Identity const& identity);

    // IHandler {
    [[nodiscard]] virtual ContentTypes const& GetContentTypes() const override;
    [[nodiscard]] virtual OptionalEvent Handle(Message::Envelope const& envelope, Parley::Result& result) const override;
    [[nodiscard]] virtual OptionalEnvelope Encode(Chat::Message const& message) const override;
    // } IHandler

    [[nodiscard]] static bool IsValidUtf8(std::string_view text);
};

//----------------------------------------------------------------------------------------------------------------------
