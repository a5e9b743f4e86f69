//----------------------------------------------------------------------------------------------------------------------
// File: Records.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Records.hpp"
#include "Components/Message/PackUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <limits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using ShortField = std::uint16_t;
using LongField = std::uint32_t;

[[nodiscard]] bool UnpackFlag(PackUtils::ReadableIterator& begin, PackUtils::ReadableIterator const& end, bool& flag);

template<typename EnumType>
[[nodiscard]] bool UnpackEnum(
    PackUtils::ReadableIterator& begin, PackUtils::ReadableIterator const& end, EnumType& value, EnumType last);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Image Record Schema:
//  - (4 + N bytes): Image Data
//  - (1 byte): Thumbnail Flag, (4 + N bytes): Optional Thumbnail
//  - (1 byte): Caption Flag, (2 + N bytes): Optional Caption
//  - (2 + N bytes): Content Type
//  - (2 + N bytes): Filename
//----------------------------------------------------------------------------------------------------------------------
Handler::Records::OptionalPack Handler::Records::Image::GetPack() const
{
    using namespace local;
    if (!PackUtils::FitsSizeField<LongField>(data.size())) { return {}; }
    if (thumbnail && !PackUtils::FitsSizeField<LongField>(thumbnail->size())) { return {}; }
    if (caption && !PackUtils::FitsSizeField<ShortField>(caption->size())) { return {}; }
    if (!PackUtils::FitsSizeField<ShortField>(contentType.size())) { return {}; }
    if (!PackUtils::FitsSizeField<ShortField>(filename.size())) { return {}; }

    Message::Buffer buffer;
    PackUtils::PackChunk<LongField>(std::span<std::uint8_t const>{ data }, buffer);
    PackUtils::PackOptionalChunk<LongField>(thumbnail, buffer);
    PackUtils::PackOptionalChunk<ShortField>(caption, buffer);
    PackUtils::PackChunk<ShortField>(std::string_view{ contentType }, buffer);
    PackUtils::PackChunk<ShortField>(std::string_view{ filename }, buffer);
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Handler::Records::Image> Handler::Records::Image::FromPack(std::span<std::uint8_t const> buffer)
{
    using namespace local;
    auto begin = buffer.begin();
    auto const end = buffer.end();

    Image record;
    if (!PackUtils::UnpackSizedChunk<LongField>(begin, end, record.data)) { return {}; }
    if (!PackUtils::UnpackOptionalChunk<LongField>(begin, end, record.thumbnail)) { return {}; }
    if (!PackUtils::UnpackOptionalChunk<ShortField>(begin, end, record.caption)) { return {}; }
    if (!PackUtils::UnpackSizedChunk<ShortField>(begin, end, record.contentType)) { return {}; }
    if (!PackUtils::UnpackSizedChunk<ShortField>(begin, end, record.filename)) { return {}; }
    if (begin != end) { return {}; }

    return record;
}

//----------------------------------------------------------------------------------------------------------------------
// Reaction Record Schema:
//  - (2 + N bytes): Target Message Identifier
//  - (2 + N bytes): Emoji
//  - (1 byte): Action
//----------------------------------------------------------------------------------------------------------------------
Handler::Records::OptionalPack Handler::Records::Reaction::GetPack() const
{
    using namespace local;
    if (messageId.empty() || emoji.empty()) { return {}; }
    if (!PackUtils::FitsSizeField<ShortField>(messageId.size())) { return {}; }
    if (!PackUtils::FitsSizeField<ShortField>(emoji.size())) { return {}; }

    Message::Buffer buffer;
    PackUtils::PackChunk<ShortField>(std::string_view{ messageId }, buffer);
    PackUtils::PackChunk<ShortField>(std::string_view{ emoji }, buffer);
    PackUtils::PackChunk(static_cast<std::uint8_t>(action), buffer);
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Handler::Records::Reaction> Handler::Records::Reaction::FromPack(std::span<std::uint8_t const> buffer)
{
    using namespace local;
    auto begin = buffer.begin();
    auto const end = buffer.end();

    Reaction record{ .messageId = {}, .emoji = {}, .action = Chat::ReactionAction::Add };
    if (!PackUtils::UnpackSizedChunk<ShortField>(begin, end, record.messageId)) { return {}; }
    if (!PackUtils::UnpackSizedChunk<ShortField>(begin, end, record.emoji)) { return {}; }
    if (!UnpackEnum(begin, end, record.action, Chat::ReactionAction::Remove)) { return {}; }
    if (begin != end || record.messageId.empty() || record.emoji.empty()) { return {}; }

    return record;
}

//----------------------------------------------------------------------------------------------------------------------
// Typing Record Schema:
//  - (1 byte): Typing Flag
//  - (1 byte): Preview Flag, (2 + N bytes): Optional Preview
//----------------------------------------------------------------------------------------------------------------------
Handler::Records::OptionalPack Handler::Records::Typing::GetPack() const
{
    using namespace local;
    if (preview && !PackUtils::FitsSizeField<ShortField>(preview->size())) { return {}; }

    Message::Buffer buffer;
    PackUtils::PackChunk(static_cast<std::uint8_t>(isTyping), buffer);
    PackUtils::PackOptionalChunk<ShortField>(preview, buffer);
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Handler::Records::Typing> Handler::Records::Typing::FromPack(std::span<std::uint8_t const> buffer)
{
    using namespace local;
    auto begin = buffer.begin();
    auto const end = buffer.end();

    Typing record{ .isTyping = false, .preview = {} };
    if (!UnpackFlag(begin, end, record.isTyping)) { return {}; }
    if (!PackUtils::UnpackOptionalChunk<ShortField>(begin, end, record.preview)) { return {}; }
    if (begin != end) { return {}; }

    return record;
}

//----------------------------------------------------------------------------------------------------------------------
// Multipart Record Schema:
//  - (2 + N bytes): Boundary
//  - (2 bytes): Part Count
//  - (N bytes): Parts
//      - (2 + N bytes): Content Type                           |   Part Start
//      - (1 byte): Content Identifier Flag, (2 + N bytes)      |
//      - (1 byte): Headers Flag, (2 bytes): Header Count       |
//      - (2 + N bytes, 2 + N bytes): Header Key and Value      |   (Repeated)
//      - (4 + N bytes): Part Data                              |   Part End
//----------------------------------------------------------------------------------------------------------------------
Handler::Records::OptionalPack Handler::Records::Multipart::GetPack() const
{
    using namespace local;
    if (!PackUtils::FitsSizeField<ShortField>(boundary.size())) { return {}; }
    if (!PackUtils::FitsSizeField<ShortField>(parts.size())) { return {}; }

    bool const packable = std::ranges::all_of(parts, [] (Part const& part) {
        if (part.contentType.empty()) { return false; }
        if (!PackUtils::FitsSizeField<ShortField>(part.contentType.size())) { return false; }
        if (part.contentId && !PackUtils::FitsSizeField<ShortField>(part.contentId->size())) { return false; }
        if (part.headers && !PackUtils::IsPackable(*part.headers)) { return false; }
        return PackUtils::FitsSizeField<LongField>(part.data.size());
    });
    if (!packable) { return {}; }

    Message::Buffer buffer;
    PackUtils::PackChunk<ShortField>(std::string_view{ boundary }, buffer);
    PackUtils::PackChunk(static_cast<ShortField>(parts.size()), buffer);
    for (auto const& part : parts) {
        PackUtils::PackChunk<ShortField>(std::string_view{ part.contentType }, buffer);
        PackUtils::PackOptionalChunk<ShortField>(part.contentId, buffer);
        PackUtils::PackOptionalMetadata(part.headers, buffer);
        PackUtils::PackChunk<LongField>(std::span<std::uint8_t const>{ part.data }, buffer);
    }
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Handler::Records::Multipart> Handler::Records::Multipart::FromPack(std::span<std::uint8_t const> buffer)
{
    using namespace local;
    auto begin = buffer.begin();
    auto const end = buffer.end();

    Multipart record;
    if (!PackUtils::UnpackSizedChunk<ShortField>(begin, end, record.boundary)) { return {}; }

    ShortField count = 0;
    if (!PackUtils::UnpackChunk(begin, end, count)) { return {}; }

    record.parts.reserve(count);
    for (ShortField idx = 0; idx < count; ++idx) {
        Part part;
        if (!PackUtils::UnpackSizedChunk<ShortField>(begin, end, part.contentType)) { return {}; }
        if (!PackUtils::UnpackOptionalChunk<ShortField>(begin, end, part.contentId)) { return {}; }
        if (!PackUtils::UnpackOptionalMetadata(begin, end, part.headers)) { return {}; }
        if (!PackUtils::UnpackSizedChunk<LongField>(begin, end, part.data)) { return {}; }
        if (part.contentType.empty()) { return {}; }
        record.parts.emplace_back(std::move(part));
    }

    if (begin != end) { return {}; }
    return record;
}

//----------------------------------------------------------------------------------------------------------------------
// Receipt Record Schema:
//  - (2 + N bytes): Message Identifier
//  - (1 byte): Status
//----------------------------------------------------------------------------------------------------------------------
Handler::Records::OptionalPack Handler::Records::Receipt::GetPack() const
{
    using namespace local;
    if (messageId.empty() || !PackUtils::FitsSizeField<ShortField>(messageId.size())) { return {}; }

    Message::Buffer buffer;
    PackUtils::PackChunk<ShortField>(std::string_view{ messageId }, buffer);
    PackUtils::PackChunk(static_cast<std::uint8_t>(status), buffer);
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Handler::Records::Receipt> Handler::Records::Receipt::FromPack(std::span<std::uint8_t const> buffer)
{
    using namespace local;
    auto begin = buffer.begin();
    auto const end = buffer.end();

    Receipt record{ .messageId = {}, .status = Chat::Status::Delivered };
    if (!PackUtils::UnpackSizedChunk<ShortField>(begin, end, record.messageId)) { return {}; }
    if (!UnpackEnum(begin, end, record.status, Chat::Status::Failed)) { return {}; }
    if (begin != end || record.messageId.empty()) { return {}; }

    return record;
}

//----------------------------------------------------------------------------------------------------------------------
// Edit Record Schema:
//  - (2 + N bytes): Message Identifier
//  - (4 + N bytes): Replacement Text
//----------------------------------------------------------------------------------------------------------------------
Handler::Records::OptionalPack Handler::Records::Edit::GetPack() const
{
    using namespace local;
    if (messageId.empty() || !PackUtils::FitsSizeField<ShortField>(messageId.size())) { return {}; }
    if (!PackUtils::FitsSizeField<LongField>(text.size())) { return {}; }

    Message::Buffer buffer;
    PackUtils::PackChunk<ShortField>(std::string_view{ messageId }, buffer);
    PackUtils::PackChunk<LongField>(std::string_view{ text }, buffer);
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Handler::Records::Edit> Handler::Records::Edit::FromPack(std::span<std::uint8_t const> buffer)
{
    using namespace local;
    auto begin = buffer.begin();
    auto const end = buffer.end();

    Edit record;
    if (!PackUtils::UnpackSizedChunk<ShortField>(begin, end, record.messageId)) { return {}; }
    if (!PackUtils::UnpackSizedChunk<LongField>(begin, end, record.text)) { return {}; }
    if (begin != end || record.messageId.empty()) { return {}; }

    return record;
}

//----------------------------------------------------------------------------------------------------------------------
// Delete Record Schema:
//  - (2 + N bytes): Message Identifier
//----------------------------------------------------------------------------------------------------------------------
Handler::Records::OptionalPack Handler::Records::Delete::GetPack() const
{
    using namespace local;
    if (messageId.empty() || !PackUtils::FitsSizeField<ShortField>(messageId.size())) { return {}; }

    Message::Buffer buffer;
    PackUtils::PackChunk<ShortField>(std::string_view{ messageId }, buffer);
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Handler::Records::Delete> Handler::Records::Delete::FromPack(std::span<std::uint8_t const> buffer)
{
    using namespace local;
    auto begin = buffer.begin();
    auto const end = buffer.end();

    Delete record;
    if (!PackUtils::UnpackSizedChunk<ShortField>(begin, end, record.messageId)) { return {}; }
    if (begin != end || record.messageId.empty()) { return {}; }

    return record;
}

//----------------------------------------------------------------------------------------------------------------------
// System Record Schema:
//  - (1 byte): Kind
//  - (4 + N bytes): Text
//----------------------------------------------------------------------------------------------------------------------
Handler::Records::OptionalPack Handler::Records::System::GetPack() const
{
    using namespace local;
    if (!PackUtils::FitsSizeField<LongField>(text.size())) { return {}; }

    Message::Buffer buffer;
    PackUtils::PackChunk(static_cast<std::uint8_t>(kind), buffer);
    PackUtils::PackChunk<LongField>(std::string_view{ text }, buffer);
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Handler::Records::System> Handler::Records::System::FromPack(std::span<std::uint8_t const> buffer)
{
    using namespace local;
    auto begin = buffer.begin();
    auto const end = buffer.end();

    System record{ .kind = Chat::SystemEventKind::Notice, .text = {} };
    if (!UnpackEnum(begin, end, record.kind, Chat::SystemEventKind::Notice)) { return {}; }
    if (!PackUtils::UnpackSizedChunk<LongField>(begin, end, record.text)) { return {}; }
    if (begin != end) { return {}; }

    return record;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::UnpackFlag(PackUtils::ReadableIterator& begin, PackUtils::ReadableIterator const& end, bool& flag)
{
    std::uint8_t value = 0;
    if (!PackUtils::UnpackChunk(begin, end, value) || value > 1) { return false; }
    flag = (value == 1);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename EnumType>
bool local::UnpackEnum(
    PackUtils::ReadableIterator& begin, PackUtils::ReadableIterator const& end, EnumType& value, EnumType last)
{
    std::uint8_t raw = 0;
    if (!PackUtils::UnpackChunk(begin, end, raw)) { return false; }
    if (raw > static_cast<std::uint8_t>(last)) { return false; }
    value = static_cast<EnumType>(raw);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
