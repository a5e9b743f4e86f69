//----------------------------------------------------------------------------------------------------------------------
// File: Options.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Components/Identifier/Identifier.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace allowable {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::array<std::string_view, 7> VerbosityValues = {
    "off", "critical", "error", "warn", "info", "debug", "trace"
};

//----------------------------------------------------------------------------------------------------------------------
} // allowable namespace
//----------------------------------------------------------------------------------------------------------------------
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<std::uint64_t> GetUnsignedInteger(boost::json::value const& value);
[[nodiscard]] std::string ToString(boost::json::string const& value);
[[nodiscard]] std::string_view GetVerbosityName(spdlog::level::level_enum verbosity);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Identity::Identity()
    : m_optPeerId([] (auto const& value) { return !value.empty() && value.size() <= PeerIdSizeLimit; })
    , m_displayName([] (auto const& value) { return value.size() <= DisplayNameSizeLimit; })
    , m_optDeviceInfo([] (auto const& value) { return value.size() <= DeviceInfoSizeLimit; })
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Identity::Identity(std::string_view displayName)
    : Identity()
{
    [[maybe_unused]] bool changed = false;
    [[maybe_unused]] bool const success = SetDisplayName(displayName, changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Identity::operator==(Identity const& other) const noexcept
{
    return m_optPeerId == other.m_optPeerId &&
           m_displayName == other.m_displayName &&
           m_optDeviceInfo == other.m_optDeviceInfo;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Identity::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "identity": {
    //     "peer_id": Optional String,
    //     "display_name": String,
    //     "device_info": Optional String
    // },

    if (m_optPeerId.NotModified()) {
        if (auto const itr = json.find(m_optPeerId.GetFieldName()); itr != json.end()) {
            if (itr->value().is_string()) {
                if (!m_optPeerId.SetValueFromConfig(local::ToString(itr->value().as_string()))) {
                    return {
                        StatusCode::InputError,
                        CreateInvalidValueMessage(GetFieldName(), m_optPeerId.GetFieldName())
                    };
                }
            } else {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("string", GetFieldName(), m_optPeerId.GetFieldName())
                };
            }
        }
    }

    if (m_displayName.NotModified()) {
        if (auto const itr = json.find(m_displayName.GetFieldName()); itr != json.end()) {
            if (itr->value().is_string()) {
                if (!m_displayName.SetValueFromConfig(local::ToString(itr->value().as_string()))) {
                    return {
                        StatusCode::InputError,
                        CreateExceededCharacterLimitMessage(
                            DisplayNameSizeLimit, GetFieldName(), m_displayName.GetFieldName())
                    };
                }
            } else {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("string", GetFieldName(), m_displayName.GetFieldName())
                };
            }
        } else {
            return { StatusCode::DecodeError, CreateMissingFieldMessage(GetFieldName(), m_displayName.GetFieldName()) };
        }
    }

    if (m_optDeviceInfo.NotModified()) {
        if (auto const itr = json.find(m_optDeviceInfo.GetFieldName()); itr != json.end()) {
            if (itr->value().is_string()) {
                if (!m_optDeviceInfo.SetValueFromConfig(local::ToString(itr->value().as_string()))) {
                    return {
                        StatusCode::InputError,
                        CreateExceededCharacterLimitMessage(
                            DeviceInfoSizeLimit, GetFieldName(), m_optDeviceInfo.GetFieldName())
                    };
                }
            } else {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("string", GetFieldName(), m_optDeviceInfo.GetFieldName())
                };
            }
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Identity::Write(boost::json::object& json) const
{
    boost::json::object group;

    if (auto const& optPeerId = m_optPeerId.GetOptionalValue(); optPeerId) {
        group[m_optPeerId.GetFieldName()] = *optPeerId;
    }

    group[m_displayName.GetFieldName()] = m_displayName.GetValue();

    if (auto const& optDeviceInfo = m_optDeviceInfo.GetOptionalValue(); optDeviceInfo) {
        group[m_optDeviceInfo.GetFieldName()] = *optDeviceInfo;
    }

    json.emplace(Symbol, std::move(group));

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Identity::AreOptionsAllowable() const
{
    if (m_displayName.GetValue().empty()) {
        return { StatusCode::InputError, CreateMissingFieldMessage(GetFieldName(), m_displayName.GetFieldName()) };
    }

    if (!m_optPeerId.HasValue()) {
        return { StatusCode::InputError, CreateMissingFieldMessage(GetFieldName(), m_optPeerId.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> const& Configuration::Options::Identity::GetPeerId() const
{
    return m_optPeerId.GetOptionalValue();
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Options::Identity::GetDisplayName() const { return m_displayName.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> const& Configuration::Options::Identity::GetDeviceInfo() const
{
    return m_optDeviceInfo.GetOptionalValue();
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Identity::InitializePeerId(bool& changed)
{
    if (m_optPeerId.HasValue()) { return true; }

    auto const generated = ::Identifier::Generate();
    if (generated.empty()) { return false; }

    if (!m_optPeerId.SetValue(generated)) { return false; }
    changed = true;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Identity::SetPeerId(std::string_view peerId, bool& changed)
{
    if (!m_optPeerId.SetValue(std::string{ peerId })) { return false; }
    if (m_optPeerId.Modified()) { changed = true; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Identity::SetDisplayName(std::string_view displayName, bool& changed)
{
    if (displayName.empty()) { return false; }
    if (!m_displayName.SetValue(std::string{ displayName })) { return false; }
    if (m_displayName.Modified()) { changed = true; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Identity::SetDeviceInfo(std::string_view deviceInfo, bool& changed)
{
    if (!m_optDeviceInfo.SetValue(std::string{ deviceInfo })) { return false; }
    if (m_optDeviceInfo.Modified()) { changed = true; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Session::Session()
    : m_serviceType(std::string{ Defaults::ServiceType }, &Session::IsAllowableServiceType)
    , m_optReliableThreshold([] (auto const& value) { return value > 0; })
    , m_optInviteTimeout([] (auto const& value) { return value > 0 && value <= InviteTimeoutLimit; })
    , m_optAutoAccept()
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Session::operator==(Session const& other) const noexcept
{
    return m_serviceType == other.m_serviceType &&
           m_optReliableThreshold == other.m_optReliableThreshold &&
           m_optInviteTimeout == other.m_optInviteTimeout &&
           m_optAutoAccept == other.m_optAutoAccept;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Session::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "session": {
    //     "service_type": String,
    //     "reliable_threshold": Optional Unsigned Integer,
    //     "invite_timeout": Optional Unsigned Integer (milliseconds),
    //     "auto_accept": Optional Boolean
    // },

    if (m_serviceType.NotModified()) {
        if (auto const itr = json.find(m_serviceType.GetFieldName()); itr != json.end()) {
            if (itr->value().is_string()) {
                if (!m_serviceType.SetValueFromConfig(local::ToString(itr->value().as_string()))) {
                    return {
                        StatusCode::InputError,
                        CreateInvalidValueMessage(GetFieldName(), m_serviceType.GetFieldName())
                    };
                }
            } else {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("string", GetFieldName(), m_serviceType.GetFieldName())
                };
            }
        } else {
            return { StatusCode::DecodeError, CreateMissingFieldMessage(GetFieldName(), m_serviceType.GetFieldName()) };
        }
    }

    if (m_optReliableThreshold.NotModified()) {
        if (auto const itr = json.find(m_optReliableThreshold.GetFieldName()); itr != json.end()) {
            auto const optThreshold = local::GetUnsignedInteger(itr->value());
            if (!optThreshold) {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage(
                        "unsigned integer", GetFieldName(), m_optReliableThreshold.GetFieldName())
                };
            }

            if (!m_optReliableThreshold.SetValueFromConfig(*optThreshold)) {
                return {
                    StatusCode::InputError,
                    CreateInvalidValueMessage(GetFieldName(), m_optReliableThreshold.GetFieldName())
                };
            }
        }
    }

    if (m_optInviteTimeout.NotModified()) {
        if (auto const itr = json.find(m_optInviteTimeout.GetFieldName()); itr != json.end()) {
            auto const optTimeout = local::GetUnsignedInteger(itr->value());
            if (!optTimeout) {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage(
                        "unsigned integer", GetFieldName(), m_optInviteTimeout.GetFieldName())
                };
            }

            if (!m_optInviteTimeout.SetValueFromConfig(*optTimeout)) {
                return {
                    StatusCode::InputError,
                    CreateExceededValueLimitMessage(
                        InviteTimeoutLimit, GetFieldName(), m_optInviteTimeout.GetFieldName())
                };
            }
        }
    }

    if (m_optAutoAccept.NotModified()) {
        if (auto const itr = json.find(m_optAutoAccept.GetFieldName()); itr != json.end()) {
            if (itr->value().is_bool()) {
                [[maybe_unused]] bool const success = m_optAutoAccept.SetValueFromConfig(itr->value().as_bool());
            } else {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("boolean", GetFieldName(), m_optAutoAccept.GetFieldName())
                };
            }
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Session::Write(boost::json::object& json) const
{
    boost::json::object group;

    group[m_serviceType.GetFieldName()] = m_serviceType.GetValue();

    if (auto const& optThreshold = m_optReliableThreshold.GetOptionalValue(); optThreshold) {
        group[m_optReliableThreshold.GetFieldName()] = *optThreshold;
    }

    if (auto const& optTimeout = m_optInviteTimeout.GetOptionalValue(); optTimeout) {
        group[m_optInviteTimeout.GetFieldName()] = *optTimeout;
    }

    if (auto const& optAutoAccept = m_optAutoAccept.GetOptionalValue(); optAutoAccept) {
        group[m_optAutoAccept.GetFieldName()] = *optAutoAccept;
    }

    json.emplace(Symbol, std::move(group));

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Session::AreOptionsAllowable() const
{
    if (!IsAllowableServiceType(m_serviceType.GetValue())) {
        return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), m_serviceType.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Peer::SessionOptions Configuration::Options::Session::GetSessionOptions() const
{
    Peer::SessionOptions options;
    options.serviceType = m_serviceType.GetValue();
    options.reliableThreshold = static_cast<std::size_t>(
        m_optReliableThreshold.GetValueOrElse(Defaults::ReliableThreshold));
    options.inviteTimeout = std::chrono::milliseconds{
        m_optInviteTimeout.GetValueOrElse(static_cast<std::uint64_t>(Defaults::InviteTimeout.count())) };
    options.autoAccept = m_optAutoAccept.GetValueOrElse(Defaults::AutoAccept);
    return options;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Session::SetServiceType(std::string_view serviceType, bool& changed)
{
    if (!m_serviceType.SetValue(std::string{ serviceType })) { return false; }
    if (m_serviceType.Modified()) { changed = true; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Session::SetReliableThreshold(std::uint64_t threshold, bool& changed)
{
    if (!m_optReliableThreshold.SetValue(threshold)) { return false; }
    if (m_optReliableThreshold.Modified()) { changed = true; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Session::SetInviteTimeout(std::chrono::milliseconds const& timeout, bool& changed)
{
    if (timeout.count() <= 0) { return false; }
    if (!m_optInviteTimeout.SetValue(static_cast<std::uint64_t>(timeout.count()))) { return false; }
    if (m_optInviteTimeout.Modified()) { changed = true; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::Session::SetAutoAccept(bool autoAccept, bool& changed)
{
    [[maybe_unused]] bool const success = m_optAutoAccept.SetValue(autoAccept);
    if (m_optAutoAccept.Modified()) { changed = true; }
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Session::IsAllowableServiceType(std::string_view serviceType)
{
    if (serviceType.empty() || serviceType.size() > ServiceTypeSizeLimit) { return false; }
    return std::ranges::all_of(serviceType, [] (char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Typing::Typing()
    : m_optWindow([] (auto const& value) { return value > 0 && value <= WindowLimit; })
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Typing::operator==(Typing const& other) const noexcept
{
    return m_optWindow == other.m_optWindow;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Typing::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "typing": {
    //     "window": Optional Unsigned Integer (milliseconds)
    // },

    if (m_optWindow.NotModified()) {
        if (auto const itr = json.find(m_optWindow.GetFieldName()); itr != json.end()) {
            auto const optWindow = local::GetUnsignedInteger(itr->value());
            if (!optWindow) {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("unsigned integer", GetFieldName(), m_optWindow.GetFieldName())
                };
            }

            if (!m_optWindow.SetValueFromConfig(*optWindow)) {
                return {
                    StatusCode::InputError,
                    CreateExceededValueLimitMessage(WindowLimit, GetFieldName(), m_optWindow.GetFieldName())
                };
            }
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Typing::Write(boost::json::object& json) const
{
    boost::json::object group;
    if (auto const& optWindow = m_optWindow.GetOptionalValue(); optWindow) {
        group[m_optWindow.GetFieldName()] = *optWindow;
    }

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Typing::AreOptionsAllowable() const
{
    return { StatusCode::Success, "" }; // The window is checked as it is set.
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Typing::GetWindow() const
{
    return std::chrono::milliseconds{
        m_optWindow.GetValueOrElse(static_cast<std::uint64_t>(Defaults::TypingWindow.count())) };
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Typing::SetWindow(std::chrono::milliseconds const& window, bool& changed)
{
    if (window.count() <= 0) { return false; }
    if (!m_optWindow.SetValue(static_cast<std::uint64_t>(window.count()))) { return false; }
    if (m_optWindow.Modified()) { changed = true; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Logging::Logging()
    : m_optVerbosity([] (auto const& value) { return Logger::ParseVerbosity(value).has_value(); })
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Logging::operator==(Logging const& other) const noexcept
{
    return m_optVerbosity == other.m_optVerbosity;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Logging::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "logging": {
    //     "verbosity": Optional String
    // },

    if (m_optVerbosity.NotModified()) {
        if (auto const itr = json.find(m_optVerbosity.GetFieldName()); itr != json.end()) {
            if (itr->value().is_string()) {
                if (!m_optVerbosity.SetValueFromConfig(local::ToString(itr->value().as_string()))) {
                    return {
                        StatusCode::InputError,
                        CreateUnexpectedValueMessage(
                            allowable::VerbosityValues, GetFieldName(), m_optVerbosity.GetFieldName())
                    };
                }
            } else {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("string", GetFieldName(), m_optVerbosity.GetFieldName())
                };
            }
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Logging::Write(boost::json::object& json) const
{
    boost::json::object group;
    if (auto const& optVerbosity = m_optVerbosity.GetOptionalValue(); optVerbosity) {
        group[m_optVerbosity.GetFieldName()] = *optVerbosity;
    }

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Logging::AreOptionsAllowable() const
{
    return { StatusCode::Success, "" }; // The verbosity is checked as it is set.
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Configuration::Options::Logging::GetVerbosity() const
{
    auto const verbosity = m_optVerbosity.GetValueOrElse(std::string{ Defaults::Verbosity });
    return Logger::ParseVerbosity(verbosity).value_or(spdlog::level::info);
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::Logging::SetVerbosity(spdlog::level::level_enum verbosity, bool& changed)
{
    [[maybe_unused]] bool const success = m_optVerbosity.SetValue(std::string{ local::GetVerbosityName(verbosity) });
    if (m_optVerbosity.Modified()) { changed = true; }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint64_t> local::GetUnsignedInteger(boost::json::value const& value)
{
    if (auto const* const pUnsigned = value.if_uint64(); pUnsigned) { return *pUnsigned; }
    if (auto const* const pSigned = value.if_int64(); pSigned && *pSigned >= 0) {
        return static_cast<std::uint64_t>(*pSigned);
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::ToString(boost::json::string const& value)
{
    return std::string{ value.data(), value.size() };
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view local::GetVerbosityName(spdlog::level::level_enum verbosity)
{
    auto const itr = std::ranges::find_if(allowable::VerbosityValues, [&verbosity] (std::string_view name) {
        return Logger::ParseVerbosity(name) == verbosity;
    });
    return itr != allowable::VerbosityValues.end() ? *itr : Defaults::Verbosity;
}

//----------------------------------------------------------------------------------------------------------------------
