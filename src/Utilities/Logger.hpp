//----------------------------------------------------------------------------------------------------------------------
// File: Logger.hpp
// Description: Registration of the named spdlog loggers used throughout the library. Components fetch their logger
// through spdlog::get(Logger::Name::...) and keep the shared pointer for their lifetime.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Logger {
//----------------------------------------------------------------------------------------------------------------------

namespace Name {

constexpr std::string_view Core = "core";
constexpr std::string_view Transport = "transport";

constexpr std::array<std::string_view, 2> All = { Core, Transport };

} // Name namespace

constexpr std::string_view MessagePattern = "[%T.%e] [%n] [%l] %v";

void Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink);
void AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink);
void SetVerbosity(spdlog::level::level_enum verbosity);

[[nodiscard]] std::optional<spdlog::level::level_enum> ParseVerbosity(std::string_view value);

//----------------------------------------------------------------------------------------------------------------------
} // Logger namespace
//----------------------------------------------------------------------------------------------------------------------

inline void Logger::Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink)
{
    // All named loggers share the same set of sinks, such that attaching a sink captures the output of every component.
    std::shared_ptr<spdlog::sinks::sink> spConsoleSink;
    if (useStdOutSink) { spConsoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>(); }

    for (auto const& name : Name::All) {
        if (auto const spLogger = spdlog::get(name.data()); spLogger) { continue; }
        auto const spLogger = std::make_shared<spdlog::logger>(name.data());
        if (spConsoleSink) { spLogger->sinks().emplace_back(spConsoleSink); }
        spLogger->set_pattern(MessagePattern.data());
        spdlog::register_logger(spLogger);
    }

    SetVerbosity(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline void Logger::AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink)
{
    spSink->set_pattern(MessagePattern.data());
    for (auto const& name : Name::All) {
        auto const spLogger = spdlog::get(name.data());
        assert(spLogger); // The loggers must be initialized before a sink can be attached.
        spLogger->sinks().emplace_back(spSink);
    }
}

//----------------------------------------------------------------------------------------------------------------------

inline void Logger::SetVerbosity(spdlog::level::level_enum verbosity)
{
    spdlog::set_level(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<spdlog::level::level_enum> Logger::ParseVerbosity(std::string_view value)
{
    using enum spdlog::level::level_enum;
    constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> Levels = {
        std::make_pair("off", off),
        std::make_pair("critical", critical),
        std::make_pair("error", err),
        std::make_pair("warn", warn),
        std::make_pair("info", info),
        std::make_pair("debug", debug),
        std::make_pair("trace", trace)
    };

    for (auto const& [name, level] : Levels) {
        if (name == value) { return level; }
    }

    return {};
}

//----------------------------------------------------------------------------------------------------------------------
