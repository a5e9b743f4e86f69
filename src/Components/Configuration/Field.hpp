//----------------------------------------------------------------------------------------------------------------------
// File: Field.hpp
// Description: A named configuration value. The field's name is derived from a tag type such that the json key and
// the C++ identifier cannot drift apart. Fields track whether they were changed after being read from a file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

template<typename T>
concept FieldNameTag = requires(T t)
{
    { static_cast<std::string_view>(t) } -> std::same_as<std::string_view>;
};

template<std::size_t SourceSize>
constexpr std::size_t GetSnakeCaseSize(char const (&source)[SourceSize])
{
    std::size_t size = SourceSize > 0 ? 1 : 0;
    for (std::size_t idx = 1; idx < SourceSize; ++idx) {
        if (source[idx] >= 'A' && source[idx] <= 'Z' && source[idx - 1] >= 'a' && source[idx - 1] <= 'z') { ++size; }
        ++size;
    }
    return size;
}

template<std::size_t DestinationSize, std::size_t SourceSize>
constexpr auto ConvertToSnakeCase(char const (&source)[SourceSize])
{
    std::array<char, DestinationSize> converted{};
    std::size_t idx = 0;
    for (std::size_t jdx = 0; jdx < SourceSize - 1; ++jdx) {
        if (source[jdx] >= 'A' && source[jdx] <= 'Z') {
            if (jdx > 0 && source[jdx - 1] >= 'a' && source[jdx - 1] <= 'z') { converted[idx++] = '_'; }
            converted[idx++] = static_cast<char>(source[jdx] - 'A' + 'a');
        } else {
            converted[idx++] = source[jdx];
        }
    }
    converted[idx] = '\0';
    return converted;
}

// e.g. PARLEY_DEFINE_FIELD_NAME(DisplayName) declares a tag whose field name is "display_name".
#define PARLEY_DEFINE_FIELD_NAME(name) \
    struct name { \
        static constexpr auto FieldName = ::Configuration::ConvertToSnakeCase< \
            ::Configuration::GetSnakeCaseSize(#name)>(#name); \
        static constexpr std::string_view GetFieldName() { return FieldName.data(); } \
        constexpr operator std::string_view() const { return FieldName.data(); } \
    }

template<FieldNameTag ProvidedNameTag, typename ValueType>
class Field;

template<FieldNameTag ProvidedNameTag, typename ValueType>
class OptionalField;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

template<Configuration::FieldNameTag ProvidedNameTag, typename ValueType>
class Configuration::Field
{
public:
    using Validator = std::function<bool(ValueType const&)>;

    static constexpr std::string_view FieldName = ProvidedNameTag{};

    explicit Field(Validator const& validator = {})
        : m_modified(false)
        , m_value()
        , m_validator(validator)
    {
    }

    explicit Field(ValueType const& value, Validator const& validator = {})
        : m_modified(false)
        , m_value(value)
        , m_validator(validator)
    {
    }

    [[nodiscard]] bool operator==(Field const& other) const noexcept { return m_value == other.m_value; }

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return FieldName; }

    [[nodiscard]] ValueType const& GetValue() const { return m_value; }

    [[nodiscard]] bool Modified() const { return m_modified; }
    [[nodiscard]] bool NotModified() const { return !m_modified; }

    // Sets a value provided by the application. The field is marked as modified.
    [[nodiscard]] bool SetValue(ValueType const& value)
    {
        if (value == m_value) { return true; }
        if (!IsAllowable(value)) { return false; }
        m_value = value;
        m_modified = true;
        return true;
    }

    // Sets a value read from a configuration file. The modified flag is left unchanged.
    [[nodiscard]] bool SetValueFromConfig(ValueType const& value)
    {
        if (!IsAllowable(value)) { return false; }
        m_value = value;
        return true;
    }

private:
    [[nodiscard]] bool IsAllowable(ValueType const& value) const { return !m_validator || m_validator(value); }

    bool m_modified;
    ValueType m_value;
    Validator m_validator;
};

//----------------------------------------------------------------------------------------------------------------------

template<Configuration::FieldNameTag ProvidedNameTag, typename ValueType>
class Configuration::OptionalField
{
public:
    using Validator = std::function<bool(ValueType const&)>;

    static constexpr std::string_view FieldName = ProvidedNameTag{};

    explicit OptionalField(Validator const& validator = {})
        : m_modified(false)
        , m_optValue()
        , m_validator(validator)
    {
    }

    [[nodiscard]] bool operator==(OptionalField const& other) const noexcept { return m_optValue == other.m_optValue; }

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return FieldName; }

    [[nodiscard]] bool HasValue() const { return m_optValue.has_value(); }
    [[nodiscard]] std::optional<ValueType> const& GetOptionalValue() const { return m_optValue; }

    [[nodiscard]] ValueType GetValueOrElse(ValueType const& defaultValue) const
    {
        return m_optValue.value_or(defaultValue);
    }

    [[nodiscard]] bool Modified() const { return m_modified; }
    [[nodiscard]] bool NotModified() const { return !m_modified; }

    [[nodiscard]] bool SetValue(ValueType const& value)
    {
        if (m_optValue == value) { return true; }
        if (!IsAllowable(value)) { return false; }
        m_optValue = value;
        m_modified = true;
        return true;
    }

    [[nodiscard]] bool SetValueFromConfig(ValueType const& value)
    {
        if (!IsAllowable(value)) { return false; }
        m_optValue = value;
        return true;
    }

private:
    [[nodiscard]] bool IsAllowable(ValueType const& value) const { return !m_validator || m_validator(value); }

    bool m_modified;
    std::optional<ValueType> m_optValue;
    Validator m_validator;
};

//----------------------------------------------------------------------------------------------------------------------
