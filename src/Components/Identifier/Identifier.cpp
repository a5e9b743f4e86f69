//----------------------------------------------------------------------------------------------------------------------
// File: Identifier.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Identifier.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cassert>
#include <cctype>
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view HexCharacters = "0123456789abcdef";
constexpr std::array<std::size_t, 4> SeparatorPositions = { 8, 13, 18, 23 };

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Identifier::OptionalBuffer Identifier::GenerateRandomData(std::size_t size)
{
    assert(std::in_range<std::int32_t>(size));
    auto buffer = std::vector<std::uint8_t>(size, 0x00);
    if (!RAND_bytes(buffer.data(), static_cast<std::int32_t>(size))) { return {}; }
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Identifier::Generate()
{
    auto optBuffer = GenerateRandomData(RandomBytes);
    if (!optBuffer) { return {}; }

    auto& buffer = *optBuffer;
    buffer[6] = static_cast<std::uint8_t>((buffer[6] & 0x0F) | 0x40); // Version 4
    buffer[8] = static_cast<std::uint8_t>((buffer[8] & 0x3F) | 0x80); // RFC 4122 variant

    std::string identifier;
    identifier.reserve(FormattedSize);
    for (std::size_t idx = 0; idx < buffer.size(); ++idx) {
        if (idx == 4 || idx == 6 || idx == 8 || idx == 10) { identifier.push_back('-'); }
        identifier.push_back(local::HexCharacters[buffer[idx] >> 4]);
        identifier.push_back(local::HexCharacters[buffer[idx] & 0x0F]);
    }

    assert(identifier.size() == FormattedSize);
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

bool Identifier::IsFormatted(std::string_view identifier)
{
    if (identifier.size() != FormattedSize) { return false; }
    for (std::size_t idx = 0; idx < identifier.size(); ++idx) {
        bool const separator = std::ranges::find(local::SeparatorPositions, idx) != local::SeparatorPositions.end();
        if (separator) {
            if (identifier[idx] != '-') { return false; }
        } else if (!std::isxdigit(static_cast<unsigned char>(identifier[idx]))) {
            return false;
        }
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
