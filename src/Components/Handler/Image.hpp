//----------------------------------------------------------------------------------------------------------------------
// File: Image.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Handler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <span>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Handles image payloads in either of two framings. The raw framing carries the image bytes as the
// payload with the caption and filename in the metadata. The structured framing (metadata "structured" = "true")
// carries an image record that may include a thumbnail.
//----------------------------------------------------------------------------------------------------------------------
class Handler::Image : public Handler::IHandler
{
public:
    static constexpr std::string_view DefaultExtension = "jpg";

    explicit Image(Peer::Identity const& identity);

    // IHandler {
    [[nodiscard]] virtual ContentTypes const& GetContentTypes() const override;
    [[nodiscard]] virtual OptionalEvent Handle(Message::Envelope const& envelope, Parley::Result& result) const override;
    [[nodiscard]] virtual OptionalEnvelope Encode(Chat::Message const& message) const override;
    // } IHandler

    // Creates an envelope using the raw framing.
    [[nodiscard]] static OptionalEnvelope CreateImageEnvelope(
        std::span<std::uint8_t const> data,
        std::string_view contentType,
        std::string_view filename,
        std::optional<std::string> const& optCaption,
        Peer::Identity const& sender);

    [[nodiscard]] static std::string GetDefaultFilename(std::string_view contentType);

private:
    [[nodiscard]] std::optional<Chat::Attachment> HandleStructured(
        Message::Envelope const& envelope, Parley::Result& result) const;
    [[nodiscard]] std::optional<Chat::Attachment> HandleRaw(
        Message::Envelope const& envelope, Parley::Result& result) const;
};

//----------------------------------------------------------------------------------------------------------------------
