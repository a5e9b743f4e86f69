//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description: The sections of the configuration file. Each section merges its values from a json object, writes them
// back out, and reports whether the values it holds may be used.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "StatusCode.hpp"
#include "Components/Peer/SessionOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/fwd.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------
namespace Options {
//----------------------------------------------------------------------------------------------------------------------

class Identity;
class Session;
class Typing;
class Logging;

//----------------------------------------------------------------------------------------------------------------------
} // Options namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

PARLEY_DEFINE_FIELD_NAME(AutoAccept);
PARLEY_DEFINE_FIELD_NAME(DeviceInfo);
PARLEY_DEFINE_FIELD_NAME(DisplayName);
PARLEY_DEFINE_FIELD_NAME(Identity);
PARLEY_DEFINE_FIELD_NAME(InviteTimeout);
PARLEY_DEFINE_FIELD_NAME(Logging);
PARLEY_DEFINE_FIELD_NAME(PeerId);
PARLEY_DEFINE_FIELD_NAME(ReliableThreshold);
PARLEY_DEFINE_FIELD_NAME(ServiceType);
PARLEY_DEFINE_FIELD_NAME(Session);
PARLEY_DEFINE_FIELD_NAME(Typing);
PARLEY_DEFINE_FIELD_NAME(Verbosity);
PARLEY_DEFINE_FIELD_NAME(Window);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: The identity presented to other peers. A missing peer identifier is generated when the options are
// fetched and written back to the file.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Identity
{
public:
    static constexpr std::string_view Symbol = Symbols::Identity{};
    static constexpr std::size_t PeerIdSizeLimit = 128;
    static constexpr std::size_t DisplayNameSizeLimit = 64;
    static constexpr std::size_t DeviceInfoSizeLimit = 256;

    Identity();
    explicit Identity(std::string_view displayName);

    [[nodiscard]] bool operator==(Identity const& other) const noexcept;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return false; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::optional<std::string> const& GetPeerId() const;
    [[nodiscard]] std::string const& GetDisplayName() const;
    [[nodiscard]] std::optional<std::string> const& GetDeviceInfo() const;

    // Generates a peer identifier when none has been provided. Returns false if the random source fails.
    [[nodiscard]] bool InitializePeerId(bool& changed);

    [[nodiscard]] bool SetPeerId(std::string_view peerId, bool& changed);
    [[nodiscard]] bool SetDisplayName(std::string_view displayName, bool& changed);
    [[nodiscard]] bool SetDeviceInfo(std::string_view deviceInfo, bool& changed);

private:
    OptionalField<Symbols::PeerId, std::string> m_optPeerId;
    Field<Symbols::DisplayName, std::string> m_displayName;
    OptionalField<Symbols::DeviceInfo, std::string> m_optDeviceInfo;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The options forwarded to the peer session.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Session
{
public:
    static constexpr std::string_view Symbol = Symbols::Session{};
    static constexpr std::size_t ServiceTypeSizeLimit = 15;
    static constexpr std::uint64_t InviteTimeoutLimit = 3'600'000; // One hour in milliseconds.

    Session();

    [[nodiscard]] bool operator==(Session const& other) const noexcept;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] Peer::SessionOptions GetSessionOptions() const;

    [[nodiscard]] bool SetServiceType(std::string_view serviceType, bool& changed);
    [[nodiscard]] bool SetReliableThreshold(std::uint64_t threshold, bool& changed);
    [[nodiscard]] bool SetInviteTimeout(std::chrono::milliseconds const& timeout, bool& changed);
    void SetAutoAccept(bool autoAccept, bool& changed);

    // The service type is advertised to nearby peers and is limited to lowercase letters, digits, and hyphens.
    [[nodiscard]] static bool IsAllowableServiceType(std::string_view serviceType);

private:
    Field<Symbols::ServiceType, std::string> m_serviceType;
    OptionalField<Symbols::ReliableThreshold, std::uint64_t> m_optReliableThreshold;
    OptionalField<Symbols::InviteTimeout, std::uint64_t> m_optInviteTimeout;
    OptionalField<Symbols::AutoAccept, bool> m_optAutoAccept;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The window after which a silent typing indicator expires.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Typing
{
public:
    static constexpr std::string_view Symbol = Symbols::Typing{};
    static constexpr std::uint64_t WindowLimit = 60'000; // One minute in milliseconds.

    Typing();

    [[nodiscard]] bool operator==(Typing const& other) const noexcept;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::chrono::milliseconds GetWindow() const;
    [[nodiscard]] bool SetWindow(std::chrono::milliseconds const& window, bool& changed);

private:
    OptionalField<Symbols::Window, std::uint64_t> m_optWindow;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The verbosity of the named loggers.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Logging
{
public:
    static constexpr std::string_view Symbol = Symbols::Logging{};

    Logging();

    [[nodiscard]] bool operator==(Logging const& other) const noexcept;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;
    void SetVerbosity(spdlog::level::level_enum verbosity, bool& changed);

private:
    OptionalField<Symbols::Verbosity, std::string> m_optVerbosity;
};

//----------------------------------------------------------------------------------------------------------------------
