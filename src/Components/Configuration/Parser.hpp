//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description: Reads, validates, and writes the json configuration file. Values set by the application take precedence
// over the values read from the file, and any change is written back when the options are serialized.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "Options.hpp"
#include "StatusCode.hpp"
#include "Components/Peer/Identity.hpp"
#include "Components/Peer/SessionOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

PARLEY_DEFINE_FIELD_NAME(Version);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    Parser(); // Constructs a parser with the filesystem disabled.
    explicit Parser(std::filesystem::path const& filepath);
    ~Parser();

    Parser(Parser const&) = delete;
    Parser& operator=(Parser const&) = delete;

    // Reads the file when one has been provided, fills in the generated values, and validates the result. The file is
    // rewritten if anything was generated or changed.
    [[nodiscard]] DeserializationResult FetchOptions();
    [[nodiscard]] SerializationResult Serialize();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;
    void SetFilepath(std::filesystem::path const& filepath);
    void DisableFilesystem();
    [[nodiscard]] bool FilesystemDisabled() const;

    [[nodiscard]] std::optional<Peer::Identity> GetLocalIdentity() const;
    [[nodiscard]] Peer::SessionOptions GetSessionOptions() const;
    [[nodiscard]] std::chrono::milliseconds GetTypingWindow() const;
    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;

    [[nodiscard]] bool Validated() const;
    [[nodiscard]] bool Changed() const;

    [[nodiscard]] bool SetPeerId(std::string_view peerId);
    [[nodiscard]] bool SetDisplayName(std::string_view displayName);
    [[nodiscard]] bool SetDeviceInfo(std::string_view deviceInfo);
    [[nodiscard]] bool SetServiceType(std::string_view serviceType);
    [[nodiscard]] bool SetReliableThreshold(std::uint64_t threshold);
    [[nodiscard]] bool SetInviteTimeout(std::chrono::milliseconds const& timeout);
    void SetAutoAccept(bool autoAccept);
    [[nodiscard]] bool SetTypingWindow(std::chrono::milliseconds const& window);
    void SetVerbosity(spdlog::level::level_enum verbosity);

private:
    [[nodiscard]] DeserializationResult ProcessFile();
    [[nodiscard]] DeserializationResult Deserialize();
    [[nodiscard]] ValidationResult InitializeOptions();
    [[nodiscard]] ValidationResult ValidateOptions();

    std::shared_ptr<spdlog::logger> m_logger;

    Field<Symbols::Version, std::string> m_version;
    std::filesystem::path m_filepath;

    Options::Identity m_identity;
    Options::Session m_session;
    Options::Typing m_typing;
    Options::Logging m_logging;

    bool m_validated;
    bool m_changed;
};

//----------------------------------------------------------------------------------------------------------------------
