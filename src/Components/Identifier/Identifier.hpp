//----------------------------------------------------------------------------------------------------------------------
// File: Identifier.hpp
// Description: Generation of the random identifiers used for envelopes, multipart boundaries, and ephemeral peers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Identifier {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t RandomBytes = 16;
constexpr std::size_t FormattedSize = 36; // 32 hex characters and 4 group separators.

using OptionalBuffer = std::optional<std::vector<std::uint8_t>>;

[[nodiscard]] OptionalBuffer GenerateRandomData(std::size_t size);

// Returns a random RFC 4122 version 4 formatted identifier. An empty string is returned if the random source fails.
[[nodiscard]] std::string Generate();

[[nodiscard]] bool IsFormatted(std::string_view identifier);

//----------------------------------------------------------------------------------------------------------------------
} // Identifier namespace
//----------------------------------------------------------------------------------------------------------------------
