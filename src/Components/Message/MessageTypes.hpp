//----------------------------------------------------------------------------------------------------------------------
// File: MessageTypes.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Message {
//----------------------------------------------------------------------------------------------------------------------

using Buffer = std::vector<std::uint8_t>;
using Metadata = std::map<std::string, std::string>;
using SequenceNumber = std::int64_t;

enum class ValidationStatus : std::uint32_t { Success, Error };

//----------------------------------------------------------------------------------------------------------------------
} // Message namespace
//----------------------------------------------------------------------------------------------------------------------
