//----------------------------------------------------------------------------------------------------------------------
// File: Parser.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

template<typename OptionsType>
[[nodiscard]] Configuration::DeserializationResult MergeSection(
    boost::json::object const& json, OptionsType& options);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema.
//----------------------------------------------------------------------------------------------------------------------
// "version": String,
// "identity": {
//     "peer_id": Optional String,
//     "display_name": String,
//     "device_info": Optional String
// },
// "session": {
//     "service_type": String,
//     "reliable_threshold": Optional Unsigned Integer,
//     "invite_timeout": Optional Unsigned Integer,
//     "auto_accept": Optional Boolean
// },
// "typing": {
//     "window": Optional Unsigned Integer
// },
// "logging": {
//     "verbosity": Optional String
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser()
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_version(std::string{ Defaults::Version })
    , m_filepath()
    , m_identity()
    , m_session()
    , m_typing()
    , m_logging()
    , m_validated(false)
    , m_changed(false)
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath)
    : Parser()
{
    m_filepath = filepath;
    if (!m_filepath.empty() && !m_filepath.has_filename()) { m_filepath /= Defaults::ConfigurationFilename; }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::~Parser()
{
    if (!m_filepath.empty() && m_changed) {
        if (auto const status = Serialize(); status.first != StatusCode::Success) {
            m_logger->warn("Unable to write pending configuration changes! Reason: {}", status.second);
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    if (auto const status = ProcessFile(); status.first != StatusCode::Success) { return status; }
    if (auto const status = InitializeOptions(); status.first != StatusCode::Success) { return status; }
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    // Update the configuration file as the initialization of options may create new values for certain options.
    if (!m_changed) { return { StatusCode::Success, "" }; }

    auto const status = Serialize();
    if (status.first != StatusCode::Success) {
        m_logger->error(
            "Failed to update configuration file at: {}! Reason: {}", m_filepath.string(), status.second);
    }

    return status;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Parser::Serialize()
{
    if (m_changed) {
        if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }
    }

    if (m_filepath.empty()) {
        m_changed = false; // There is nowhere to write the changes.
        return { StatusCode::Success, "" };
    }

    if (m_filepath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(m_filepath.parent_path(), error);
        if (error) { return { StatusCode::FileError, "Failed to create the configuration folder." }; }
    }

    boost::json::object json;
    json[m_version.GetFieldName()] = m_version.GetValue();

    if (auto const status = m_identity.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_session.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_typing.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_logging.Write(json); status.first != StatusCode::Success) { return status; }

    std::ofstream os(m_filepath, std::ofstream::out | std::ofstream::trunc);
    if (os.fail()) { return { StatusCode::FileError, "Failed to open file." }; }

    os << boost::json::serialize(json) << '\n';
    os.close();
    if (os.fail()) { return { StatusCode::FileError, "Failed to write file." }; }

    m_changed = false; // On success, all changes have been processed.
    m_logger->debug("Wrote configuration file at: {}.", m_filepath.string());

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Parser::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetFilepath(std::filesystem::path const& filepath)
{
    m_changed = true; // The options will be serialized to the new file.
    m_filepath = filepath;
    if (!m_filepath.empty() && !m_filepath.has_filename()) { m_filepath /= Defaults::ConfigurationFilename; }
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::DisableFilesystem() { m_filepath.clear(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::FilesystemDisabled() const { return m_filepath.empty(); }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Peer::Identity> Configuration::Parser::GetLocalIdentity() const
{
    auto const& optPeerId = m_identity.GetPeerId();
    if (!optPeerId || m_identity.GetDisplayName().empty()) { return {}; }
    return Peer::Identity{ *optPeerId, m_identity.GetDisplayName(), m_identity.GetDeviceInfo() };
}

//----------------------------------------------------------------------------------------------------------------------

Peer::SessionOptions Configuration::Parser::GetSessionOptions() const { return m_session.GetSessionOptions(); }

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Parser::GetTypingWindow() const { return m_typing.GetWindow(); }

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Configuration::Parser::GetVerbosity() const { return m_logging.GetVerbosity(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Validated() const { return m_validated && !m_changed; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Changed() const { return m_changed; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetPeerId(std::string_view peerId) { return m_identity.SetPeerId(peerId, m_changed); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetDisplayName(std::string_view displayName)
{
    return m_identity.SetDisplayName(displayName, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetDeviceInfo(std::string_view deviceInfo)
{
    return m_identity.SetDeviceInfo(deviceInfo, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetServiceType(std::string_view serviceType)
{
    return m_session.SetServiceType(serviceType, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetReliableThreshold(std::uint64_t threshold)
{
    return m_session.SetReliableThreshold(threshold, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetInviteTimeout(std::chrono::milliseconds const& timeout)
{
    return m_session.SetInviteTimeout(timeout, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetAutoAccept(bool autoAccept) { m_session.SetAutoAccept(autoAccept, m_changed); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetTypingWindow(std::chrono::milliseconds const& window)
{
    return m_typing.SetWindow(window, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetVerbosity(spdlog::level::level_enum verbosity)
{
    m_logging.SetVerbosity(verbosity, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ProcessFile()
{
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; } // Filesystem usage is disabled.
    if (m_validated && !m_changed) { return { StatusCode::Success, "" }; } // The file has already been processed.

    if (std::filesystem::exists(m_filepath)) {
        m_logger->debug("Reading configuration file at: {}.", m_filepath.string());
        return Deserialize();
    }

    // A missing file may be created from the values the application has provided.
    if (m_changed) { return { StatusCode::Success, "" }; }

    std::ostringstream oss;
    oss << "Failed to locate a configuration file at: " << m_filepath;
    return { StatusCode::FileError, oss.str() };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize()
{
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; }

    try {
        boost::json::parse_options options;
        options.allow_comments = true;
        options.allow_trailing_commas = true;

        std::error_code sizeError;
        auto const size = std::filesystem::file_size(m_filepath, sizeError);
        if (sizeError) { return { StatusCode::FileError, "Failed to determine the configuration file size." }; }
        if (size > Defaults::FileSizeLimit) {
            return { StatusCode::FileError, "The configuration file exceeds the maximum allowable size." };
        }

        std::stringstream buffer;
        {
            std::ifstream reader{ m_filepath };
            if (reader.fail()) [[unlikely]] {
                return { StatusCode::FileError, "Failed to open configuration file for reading." };
            }
            buffer << reader.rdbuf();
        }

        auto const serialized = buffer.str();
        if (serialized.empty()) { return { StatusCode::DecodeError, "The configuration file is empty." }; }

        boost::json::error_code error;
        auto const value = boost::json::parse(serialized, error, boost::json::storage_ptr{}, options);
        if (error || !value.is_object()) {
            return { StatusCode::DecodeError, "Failed to read the configuration file as valid JSON." };
        }

        auto const& json = value.as_object();

        if (auto const itr = json.find(m_version.GetFieldName()); itr != json.end()) {
            if (itr->value().is_string()) {
                auto const& version = itr->value().as_string();
                if (version.empty() || !m_version.SetValueFromConfig(std::string{ version.data(), version.size() })) {
                    return { StatusCode::InputError, CreateInvalidValueMessage(m_version.GetFieldName()) };
                }
            } else {
                return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", m_version.GetFieldName()) };
            }
        } else {
            return { StatusCode::DecodeError, CreateMissingFieldMessage(m_version.GetFieldName()) };
        }

        if (auto const status = local::MergeSection(json, m_identity); status.first != StatusCode::Success) {
            return status;
        }

        if (auto const status = local::MergeSection(json, m_session); status.first != StatusCode::Success) {
            return status;
        }

        if (auto const status = local::MergeSection(json, m_typing); status.first != StatusCode::Success) {
            return status;
        }

        if (auto const status = local::MergeSection(json, m_logging); status.first != StatusCode::Success) {
            return status;
        }
    } catch (std::exception const& exception) {
        m_logger->error("Encountered an unexpected error while reading the configuration file: {}", exception.what());
        return { StatusCode::DecodeError, "Encountered an unexpected error while deserializing the configuration file." };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::InitializeOptions()
{
    if (!m_identity.InitializePeerId(m_changed)) {
        return { StatusCode::InputError, "Failed to generate an identifier for the local peer." };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails.

    if (auto const status = m_identity.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_session.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_typing.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_logging.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }

    m_validated = true;

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename OptionsType>
Configuration::DeserializationResult local::MergeSection(boost::json::object const& json, OptionsType& options)
{
    using namespace Configuration;

    auto const itr = json.find(OptionsType::GetFieldName());
    if (itr == json.end()) {
        if constexpr (OptionsType::IsOptional()) {
            return { StatusCode::Success, "" };
        } else {
            return { StatusCode::DecodeError, CreateMissingFieldMessage(OptionsType::GetFieldName()) };
        }
    }

    if (!itr->value().is_object()) {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("object", OptionsType::GetFieldName()) };
    }

    return options.Merge(itr->value().as_object());
}

//----------------------------------------------------------------------------------------------------------------------
