//----------------------------------------------------------------------------------------------------------------------
// File: StatusCode.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

enum class StatusCode : std::uint32_t { Success, DecodeError, InputError, FileError };

// The status is paired with a message describing the failure. The message is empty on success.
using StatusResult = std::pair<StatusCode, std::string>;
using DeserializationResult = StatusResult;
using SerializationResult = StatusResult;
using ValidationResult = StatusResult;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
