//----------------------------------------------------------------------------------------------------------------------
// File: Text.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Text.hpp"
#include "Components/Message/ContentType.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const SupportedTypes = {
    std::string{ Message::ContentType::TextPlain },
    std::string{ Message::ContentType::TextMarkdown },
    std::string{ Message::ContentType::TextHtml },
    std::string{ Message::ContentType::TextRtf }
};

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Encoding = "encoding";
constexpr std::string_view Utf8 = "utf-8";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Handler::Text::Text(Peer::Identity const& identity)
    : IHandler(Priority::Specific, identity)
{
}

//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const& Handler::Text::GetContentTypes() const { return local::SupportedTypes; }

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Text::Handle(Message::Envelope const& envelope, Parley::Result& result) const
{
    auto const& payload = envelope.GetPayload();
    std::string_view const text{ reinterpret_cast<char const*>(payload.data()), payload.size() };
    if (!IsValidUtf8(text)) {
        m_logger->warn("Received a text envelope with an invalid UTF-8 payload from {}.", envelope.GetSender().GetPeerId());
        result = Parley::ResultCode::InvalidPayload;
        return {};
    }

    auto message = CreateInboundMessage(envelope);
    message.SetText(text);

    result = Parley::ResultCode::Success;
    return Chat::NewMessage{ std::move(message) };
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Text::Encode(Chat::Message const& message) const
{
    if (!message.HasText() || message.HasAttachments()) { return {}; }

    return CreateOutboundBuilder(message)
        .SetContentType(Message::ContentType::TextPlain)
        .SetPayload(std::string_view{ message.GetText() })
        .AddMetadata(symbols::Encoding, symbols::Utf8)
        .ValidatedBuild();
}

//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Validates the text is well formed UTF-8. Overlong encodings, surrogate code points, and code points
// beyond U+10FFFF are rejected.
//----------------------------------------------------------------------------------------------------------------------
bool Handler::Text::IsValidUtf8(std::string_view text)
{
    auto const size = text.size();
    std::size_t idx = 0;
    while (idx < size) {
        auto const lead = static_cast<std::uint8_t>(text[idx]);
        if (lead < 0x80) { ++idx; continue; }

        std::size_t continuations = 0;
        std::uint32_t codepoint = 0;
        std::uint32_t minimum = 0;
        if ((lead & 0xE0) == 0xC0) { continuations = 1; codepoint = lead & 0x1F; minimum = 0x80; }
        else if ((lead & 0xF0) == 0xE0) { continuations = 2; codepoint = lead & 0x0F; minimum = 0x800; }
        else if ((lead & 0xF8) == 0xF0) { continuations = 3; codepoint = lead & 0x07; minimum = 0x10000; }
        else { return false; }

        if (size - idx <= continuations) { return false; }

        for (std::size_t offset = 1; offset <= continuations; ++offset) {
            auto const next = static_cast<std::uint8_t>(text[idx + offset]);
            if ((next & 0xC0) != 0x80) { return false; }
            codepoint = (codepoint << 6) | (next & 0x3F);
        }

        if (codepoint < minimum || codepoint > 0x10FFFF) { return false; }
        if (codepoint >= 0xD800 && codepoint <= 0xDFFF) { return false; }

        idx += continuations + 1;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------
