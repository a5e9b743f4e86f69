//----------------------------------------------------------------------------------------------------------------------
// File: SerializationErrors.hpp
// Description: Builders for the messages reported when a configuration file can not be read. Field paths are joined
// with a '.' (e.g. "session.service_type").
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <fmt/format.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cctype>
#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] inline std::string_view GetIndefiniteArticle(std::string_view value)
{
    if (value.empty()) { return ""; }
    switch (std::tolower(static_cast<unsigned char>(value.front()))) {
        case 'a':
        case 'e':
        case 'i':
        case 'o':
        case 'u': return "an";
        default: return "a";
    }
}

//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] inline std::string CreateExpectedValuesString(std::span<std::string_view const> values)
{
    if (values.empty()) { return "See documentation for supported values."; }

    std::string result = "Expected: ";
    for (std::size_t idx = 0; idx < values.size(); ++idx) {
        if (idx > 0) { result.append(values.size() == 2 ? " " : ", "); }
        if (idx > 0 && idx == values.size() - 1) { result.append("or "); }
        result.append("\"").append(values[idx]).append("\"");
    }
    result.append(".");
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string ConcatenateFieldNames(Fields const&... fields)
{
    std::string result;
    ((result.append(result.empty() ? "" : ".").append(std::string_view{ fields })), ...);
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMissingFieldMessage(Fields const&... fields)
{
    return fmt::format("The '{}' field was not found.", ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMismatchedValueTypeMessage(std::string_view type, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field must be {} {}.", ConcatenateFieldNames(fields...), GetIndefiniteArticle(type), type);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateInvalidValueMessage(Fields const&... fields)
{
    return fmt::format(
        "The '{}' field contains an invalid value. See documentation for supported values.",
        ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateUnexpectedValueMessage(
    std::span<std::string_view const> values, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field contains an invalid value. {}",
        ConcatenateFieldNames(fields...), CreateExpectedValuesString(values));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateExceededValueLimitMessage(std::integral auto max, Fields const&... fields)
{
    return fmt::format("The '{}' field must not exceed a value of '{}'.", ConcatenateFieldNames(fields...), max);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateExceededCharacterLimitMessage(std::integral auto max, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field exceeds the maximum allowed length of '{}' characters.",
        ConcatenateFieldNames(fields...), max);
}

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
