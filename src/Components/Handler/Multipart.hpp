//----------------------------------------------------------------------------------------------------------------------
// File: Multipart.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Handler.hpp"
#include "Image.hpp"
#include "Reaction.hpp"
#include "Text.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Handles container payloads holding several parts. Each part is dispatched as its own envelope through
// the text, image, and reaction handlers owned by this handler. The parts are then merged into a single event.
//----------------------------------------------------------------------------------------------------------------------
class Handler::Multipart : public Handler::IHandler
{
public:
    static constexpr std::string_view TextContentId = "text";

    explicit Multipart(Peer::Identity const& identity);

    // IHandler {
    [[nodiscard]] virtual ContentTypes const& GetContentTypes() const override;
    [[nodiscard]] virtual OptionalEvent Handle(Message::Envelope const& envelope, Parley::Result& result) const override;
    [[nodiscard]] virtual OptionalEnvelope Encode(Chat::Message const& message) const override;
    // } IHandler

    // Creates a mixed envelope with an optional text part followed by one image/jpeg part per image. Image parts are
    // identified as image_<index> and named image_<index>.jpg.
    [[nodiscard]] static OptionalEnvelope CreateMultipartEnvelope(
        std::optional<std::string> const& optText,
        std::vector<Message::Buffer> const& images,
        Peer::Identity const& sender,
        std::optional<Message::Metadata> const& optMetadata = {});

private:
    [[nodiscard]] OptionalEvent DispatchPart(Message::Envelope const& part, Parley::Result& result) const;

    Text const m_text;
    Image const m_image;
    Reaction const m_reaction;
};

//----------------------------------------------------------------------------------------------------------------------
