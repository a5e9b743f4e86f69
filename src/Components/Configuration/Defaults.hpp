//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chat/TypingMonitor.hpp"
#include "Components/Peer/SessionOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "0.1.0";
constexpr std::uint32_t FileSizeLimit = 12'000; // Limit the configuration files to 12KB

std::filesystem::path const ConfigurationFilename = "parley.json";

constexpr std::string_view ServiceType = Peer::Defaults::ServiceType;
constexpr std::uint64_t ReliableThreshold = Peer::Defaults::ReliableThreshold;
constexpr auto InviteTimeout = Peer::Defaults::InviteTimeout;
constexpr bool AutoAccept = Peer::Defaults::AutoAccept;

constexpr auto TypingWindow = Chat::Defaults::TypingWindow;

constexpr std::string_view Verbosity = "info";

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
