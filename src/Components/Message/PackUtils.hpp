//----------------------------------------------------------------------------------------------------------------------
// File: PackUtils.hpp
// Description: Big-endian packing helpers shared by the envelope codec and the structured payload records.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "MessageTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/endian/conversion.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <bit>
#include <concepts>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace PackUtils {
//----------------------------------------------------------------------------------------------------------------------

using ReadableIterator = std::span<std::uint8_t const>::iterator;

template<typename Source>
concept PackableScalar = std::is_standard_layout_v<Source> && std::is_trivial_v<Source> &&
    (sizeof(Source) > 0 && sizeof(Source) < 9);

template<std::unsigned_integral SizeField>
[[nodiscard]] constexpr bool FitsSizeField(std::size_t size)
{
    return size <= static_cast<std::size_t>(std::numeric_limits<SizeField>::max());
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Classes and structs with more than one member should not use this method.
//----------------------------------------------------------------------------------------------------------------------
template<PackableScalar Source>
void PackChunk(Source const& source, Message::Buffer& destination)
{
    constexpr std::size_t SourceBytes = sizeof(Source);
    if constexpr (std::endian::native == std::endian::little) {
        auto const size = destination.size();
        destination.resize(size + SourceBytes, 0x00);
        boost::endian::endian_store<Source, SourceBytes, boost::endian::order::big>(destination.data() + size, source);
    } else {
        auto const begin = reinterpret_cast<std::uint8_t const*>(&source);
        destination.insert(destination.end(), begin, begin + SourceBytes);
    }
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Variable length chunks are preceded by their size encoded using the provided SizeField type. The caller is
// expected to have verified the chunk fits the field (see FitsSizeField).
//----------------------------------------------------------------------------------------------------------------------
template<std::unsigned_integral SizeField>
void PackChunk(std::span<std::uint8_t const> source, Message::Buffer& destination)
{
    PackChunk(static_cast<SizeField>(source.size()), destination);
    destination.insert(destination.end(), source.begin(), source.end());
}

//----------------------------------------------------------------------------------------------------------------------

template<std::unsigned_integral SizeField>
void PackChunk(std::string_view source, Message::Buffer& destination)
{
    PackChunk(static_cast<SizeField>(source.size()), destination);
    destination.insert(destination.end(), source.begin(), source.end());
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Optional chunks are preceded by a single presence byte.
//----------------------------------------------------------------------------------------------------------------------
template<std::unsigned_integral SizeField>
void PackOptionalChunk(std::optional<std::string> const& optSource, Message::Buffer& destination)
{
    PackChunk(static_cast<std::uint8_t>(optSource.has_value()), destination);
    if (optSource) { PackChunk<SizeField>(std::string_view{ *optSource }, destination); }
}

//----------------------------------------------------------------------------------------------------------------------

template<std::unsigned_integral SizeField>
void PackOptionalChunk(std::optional<Message::Buffer> const& optSource, Message::Buffer& destination)
{
    PackChunk(static_cast<std::uint8_t>(optSource.has_value()), destination);
    if (optSource) { PackChunk<SizeField>(std::span<std::uint8_t const>{ *optSource }, destination); }
}

//----------------------------------------------------------------------------------------------------------------------

template<PackableScalar Destination>
[[nodiscard]] bool UnpackChunk(ReadableIterator& begin, ReadableIterator const& end, Destination& destination)
{
    constexpr std::size_t DestinationBytes = sizeof(Destination);

    // If the buffer does not contain enough data to unpack the chunk unpacking cannot occur.
    if (std::cmp_less(std::distance(begin, end), DestinationBytes)) { return false; }

    std::copy_n(begin, DestinationBytes, reinterpret_cast<std::uint8_t*>(&destination));
    if constexpr (std::endian::native == std::endian::little) {
        boost::endian::big_to_native_inplace(destination);
    }

    std::advance(begin, DestinationBytes);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename Buffer> requires std::is_same_v<Buffer, Message::Buffer> || std::is_same_v<Buffer, std::string>
[[nodiscard]] bool UnpackChunk(
    ReadableIterator& begin, ReadableIterator const& end, Buffer& destination, std::size_t count)
{
    if (std::cmp_less(std::distance(begin, end), count)) { return false; }

    auto boundary = begin;
    std::advance(boundary, count);
    destination.assign(begin, boundary);

    begin = boundary;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Reads a size field of the given type followed by a chunk of that many bytes.
//----------------------------------------------------------------------------------------------------------------------
template<std::unsigned_integral SizeField, typename Buffer>
[[nodiscard]] bool UnpackSizedChunk(ReadableIterator& begin, ReadableIterator const& end, Buffer& destination)
{
    SizeField size = 0;
    if (!UnpackChunk(begin, end, size)) { return false; }
    return UnpackChunk(begin, end, destination, size);
}

//----------------------------------------------------------------------------------------------------------------------

template<std::unsigned_integral SizeField, typename Buffer>
[[nodiscard]] bool UnpackOptionalChunk(
    ReadableIterator& begin, ReadableIterator const& end, std::optional<Buffer>& optDestination)
{
    std::uint8_t present = 0;
    if (!UnpackChunk(begin, end, present)) { return false; }

    switch (present) {
        case 0: optDestination.reset(); return true;
        case 1: {
            Buffer value;
            if (!UnpackSizedChunk<SizeField>(begin, end, value)) { return false; }
            optDestination = std::move(value);
        } return true;
        default: return false; // Any other value indicates a malformed presence flag.
    }
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Metadata is packed as a two byte entry count followed by the entries. Each key and value is preceded by a two
// byte size field.
//----------------------------------------------------------------------------------------------------------------------
[[nodiscard]] inline bool IsPackable(Message::Metadata const& metadata)
{
    if (!FitsSizeField<std::uint16_t>(metadata.size())) { return false; }
    return std::ranges::all_of(metadata, [] (auto const& entry) {
        return FitsSizeField<std::uint16_t>(entry.first.size()) && FitsSizeField<std::uint16_t>(entry.second.size());
    });
}

//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] inline std::size_t GetPackSize(Message::Metadata const& metadata)
{
    std::size_t size = sizeof(std::uint16_t);
    for (auto const& [key, value] : metadata) { size += 2 * sizeof(std::uint16_t) + key.size() + value.size(); }
    return size;
}

//----------------------------------------------------------------------------------------------------------------------

inline void PackOptionalMetadata(std::optional<Message::Metadata> const& optMetadata, Message::Buffer& destination)
{
    PackChunk(static_cast<std::uint8_t>(optMetadata.has_value()), destination);
    if (!optMetadata) { return; }

    PackChunk(static_cast<std::uint16_t>(optMetadata->size()), destination);
    for (auto const& [key, value] : *optMetadata) {
        PackChunk<std::uint16_t>(std::string_view{ key }, destination);
        PackChunk<std::uint16_t>(std::string_view{ value }, destination);
    }
}

//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] inline bool UnpackOptionalMetadata(
    ReadableIterator& begin, ReadableIterator const& end, std::optional<Message::Metadata>& optDestination)
{
    std::uint8_t present = 0;
    if (!UnpackChunk(begin, end, present) || present > 1) { return false; }
    if (present == 0) { optDestination.reset(); return true; }

    std::uint16_t count = 0;
    if (!UnpackChunk(begin, end, count)) { return false; }

    Message::Metadata metadata;
    for (std::uint16_t idx = 0; idx < count; ++idx) {
        std::string key;
        std::string value;
        if (!UnpackSizedChunk<std::uint16_t>(begin, end, key)) { return false; }
        if (!UnpackSizedChunk<std::uint16_t>(begin, end, value)) { return false; }
        if (!metadata.emplace(std::move(key), std::move(value)).second) { return false; } // Duplicate keys are invalid.
    }

    optDestination = std::move(metadata);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
} // PackUtils namespace
//----------------------------------------------------------------------------------------------------------------------
