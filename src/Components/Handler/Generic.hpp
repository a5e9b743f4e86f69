//----------------------------------------------------------------------------------------------------------------------
// File: Generic.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Handler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: The fallback handler. Any content type is accepted and presented as a placeholder message that keeps
// the original bytes. It claims no content types of its own.
//----------------------------------------------------------------------------------------------------------------------
class Handler::Generic : public Handler::IHandler
{
public:
    explicit Generic(Peer::Identity const& identity);

    // IHandler {
    [[nodiscard]] virtual ContentTypes const& GetContentTypes() const override;
    [[nodiscard]] virtual OptionalEvent Handle(Message::Envelope const& envelope, Parley::Result& result) const override;
    [[nodiscard]] virtual OptionalEnvelope Encode(Chat::Message const& message) const override;
    // } IHandler

    // Returns the placeholder text for the content type, e.g. "[pdf content]".
    [[nodiscard]] static std::string DescribeContent(std::string_view contentType);

    // Attaches the placeholder text and the raw envelope content to the provided message.
    [[nodiscard]] static Chat::Message CreateFallbackMessage(Message::Envelope const& envelope, Chat::Message message);
};

//----------------------------------------------------------------------------------------------------------------------
