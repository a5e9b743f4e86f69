//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Defaults.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Configuration/StatusCode.hpp"
#include "Components/Peer/SessionOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

using namespace std::chrono_literals;

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view CompleteConfiguration = R"({
    "version": "0.1.0",
    "identity": {
        "peer_id": "7d1f3a2c-alice",
        "display_name": "Alice",
        "device_info": "Pixel 8"
    },
    "session": {
        "service_type": "parley-test",
        "reliable_threshold": 1024,
        "invite_timeout": 5000,
        "auto_accept": false
    },
    "typing": {
        "window": 2000
    },
    "logging": {
        "verbosity": "debug"
    }
})";

constexpr std::string_view MinimalConfiguration = R"({
    // Only the display name is required, everything else is generated or defaulted.
    "version": "0.1.0",
    "identity": { "display_name": "Bob", },
})";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class ParserSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        auto const info = testing::UnitTest::GetInstance()->current_test_info();
        m_directory = std::filesystem::temp_directory_path() / "parley-tests" / info->name();
        std::filesystem::remove_all(m_directory);
        m_filepath = m_directory / Configuration::Defaults::ConfigurationFilename;
    }

    void TearDown() override
    {
        std::error_code error;
        std::filesystem::remove_all(m_directory, error);
    }

    void WriteConfiguration(std::string_view content) const
    {
        std::filesystem::create_directories(m_directory);
        std::ofstream writer{ m_filepath, std::ofstream::out | std::ofstream::trunc };
        writer << content;
    }

    [[nodiscard]] std::string ReadConfiguration() const
    {
        std::ifstream reader{ m_filepath };
        std::stringstream buffer;
        buffer << reader.rdbuf();
        return buffer.str();
    }

    std::filesystem::path m_directory;
    std::filesystem::path m_filepath;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ParserSuite, CompleteFileTest)
{
    WriteConfiguration(test::CompleteConfiguration);

    Configuration::Parser parser{ m_filepath };
    auto const [status, message] = parser.FetchOptions();
    ASSERT_EQ(status, Configuration::StatusCode::Success) << message;
    EXPECT_TRUE(parser.Validated());
    EXPECT_FALSE(parser.Changed());

    auto const optIdentity = parser.GetLocalIdentity();
    ASSERT_TRUE(optIdentity);
    EXPECT_EQ(optIdentity->GetPeerId(), "7d1f3a2c-alice");
    EXPECT_EQ(optIdentity->GetDisplayName(), "Alice");
    EXPECT_EQ(optIdentity->GetDeviceInfo(), "Pixel 8");

    auto const options = parser.GetSessionOptions();
    EXPECT_EQ(options.serviceType, "parley-test");
    EXPECT_EQ(options.reliableThreshold, std::size_t{ 1024 });
    EXPECT_EQ(options.inviteTimeout, 5000ms);
    EXPECT_FALSE(options.autoAccept);

    EXPECT_EQ(parser.GetTypingWindow(), 2000ms);
    EXPECT_EQ(parser.GetVerbosity(), spdlog::level::debug);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ParserSuite, GeneratedValuesTest)
{
    WriteConfiguration(test::MinimalConfiguration);

    std::string generated;
    {
        Configuration::Parser parser{ m_filepath };
        auto const [status, message] = parser.FetchOptions();
        ASSERT_EQ(status, Configuration::StatusCode::Success) << message;
        EXPECT_FALSE(parser.Changed()); // The generated identifier has been written back to the file.

        auto const optIdentity = parser.GetLocalIdentity();
        ASSERT_TRUE(optIdentity);
        EXPECT_FALSE(optIdentity->GetPeerId().empty());
        EXPECT_EQ(optIdentity->GetDisplayName(), "Bob");
        EXPECT_FALSE(optIdentity->GetDeviceInfo());
        generated = optIdentity->GetPeerId();

        EXPECT_EQ(parser.GetSessionOptions(), Peer::SessionOptions{});
        EXPECT_EQ(parser.GetTypingWindow(), Configuration::Defaults::TypingWindow);
        EXPECT_EQ(parser.GetVerbosity(), spdlog::level::info);
    }

    EXPECT_NE(ReadConfiguration().find(generated), std::string::npos);

    // The identifier is stable across reads.
    Configuration::Parser parser{ m_directory / "" };
    EXPECT_EQ(parser.GetFilepath(), m_filepath);
    ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    auto const optIdentity = parser.GetLocalIdentity();
    ASSERT_TRUE(optIdentity);
    EXPECT_EQ(optIdentity->GetPeerId(), generated);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ParserSuite, MissingFieldTest)
{
    {
        WriteConfiguration(R"({ "version": "0.1.0", "identity": { "device_info": "Laptop" } })");
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
        EXPECT_FALSE(parser.Validated());
    }

    {
        WriteConfiguration(R"({ "version": "0.1.0" })");
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    }

    {
        WriteConfiguration(R"({ "identity": { "display_name": "Alice" } })");
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    }

    {
        WriteConfiguration(R"({ "version": "0.1.0", "identity": { "display_name": "Alice" }, "session": {} })");
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ParserSuite, MismatchedTypeTest)
{
    constexpr std::string_view Configurations[] = {
        R"({ "version": 1, "identity": { "display_name": "Alice" } })",
        R"({ "version": "0.1.0", "identity": "Alice" })",
        R"({ "version": "0.1.0", "identity": { "display_name": 42 } })",
        R"({ "version": "0.1.0", "identity": { "display_name": "Alice" },
             "session": { "service_type": "parley-chat", "reliable_threshold": "large" } })",
        R"({ "version": "0.1.0", "identity": { "display_name": "Alice" },
             "session": { "service_type": "parley-chat", "reliable_threshold": -1 } })",
        R"({ "version": "0.1.0", "identity": { "display_name": "Alice" },
             "session": { "service_type": "parley-chat", "auto_accept": "yes" } })",
        R"({ "version": "0.1.0", "identity": { "display_name": "Alice" }, "typing": { "window": 1.5 } })",
        R"({ "version": "0.1.0", "identity": { "display_name": "Alice" }, "logging": { "verbosity": 3 } })",
    };

    for (auto const& configuration : Configurations) {
        WriteConfiguration(configuration);
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError) << configuration;
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ParserSuite, InvalidValueTest)
{
    constexpr std::string_view Configurations[] = {
        R"({ "version": "0.1.0", "identity": { "display_name": "Alice" },
             "session": { "service_type": "Bad_Type!" } })",
        R"({ "version": "0.1.0", "identity": { "display_name": "Alice" },
             "session": { "service_type": "parley-chat", "reliable_threshold": 0 } })",
        R"({ "version": "0.1.0", "identity": { "display_name": "Alice" },
             "session": { "service_type": "parley-chat", "invite_timeout": 3600001 } })",
        R"({ "version": "0.1.0", "identity": { "display_name": "Alice" }, "typing": { "window": 0 } })",
        R"({ "version": "0.1.0", "identity": { "display_name": "Alice" }, "logging": { "verbosity": "loud" } })",
        R"({ "version": "0.1.0", "identity": { "display_name": "" } })",
    };

    for (auto const& configuration : Configurations) {
        WriteConfiguration(configuration);
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::InputError) << configuration;
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ParserSuite, MalformedFileTest)
{
    {
        WriteConfiguration(R"({ "version": "0.1.0", )");
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    }

    {
        WriteConfiguration(R"([ "version", "0.1.0" ])");
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    }

    {
        WriteConfiguration("");
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    }

    {
        WriteConfiguration(std::string(Configuration::Defaults::FileSizeLimit + 1, ' '));
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::FileError);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ParserSuite, MissingFileTest)
{
    {
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::FileError);
    }

    {
        Configuration::Parser parser{ m_filepath };
        EXPECT_TRUE(parser.SetDisplayName("Carol"));
        EXPECT_TRUE(parser.SetServiceType("parley-lab"));
        auto const [status, message] = parser.FetchOptions();
        ASSERT_EQ(status, Configuration::StatusCode::Success) << message;
    }

    ASSERT_TRUE(std::filesystem::exists(m_filepath));

    Configuration::Parser parser{ m_filepath };
    ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    ASSERT_TRUE(parser.GetLocalIdentity());
    EXPECT_EQ(parser.GetLocalIdentity()->GetDisplayName(), "Carol");
    EXPECT_EQ(parser.GetSessionOptions().serviceType, "parley-lab");
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ParserSuite, ApplicationOverrideTest)
{
    WriteConfiguration(test::CompleteConfiguration);

    {
        Configuration::Parser parser{ m_filepath };
        EXPECT_TRUE(parser.SetDisplayName("Alicia"));
        parser.SetVerbosity(spdlog::level::warn);
        ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);

        ASSERT_TRUE(parser.GetLocalIdentity());
        EXPECT_EQ(parser.GetLocalIdentity()->GetDisplayName(), "Alicia");
        EXPECT_EQ(parser.GetLocalIdentity()->GetPeerId(), "7d1f3a2c-alice");
        EXPECT_EQ(parser.GetVerbosity(), spdlog::level::warn);
        EXPECT_EQ(parser.GetTypingWindow(), 2000ms); // Values without an override are read from the file.
    }

    Configuration::Parser parser{ m_filepath };
    ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_EQ(parser.GetLocalIdentity()->GetDisplayName(), "Alicia");
    EXPECT_EQ(parser.GetVerbosity(), spdlog::level::warn);
    EXPECT_EQ(parser.GetSessionOptions().serviceType, "parley-test");
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ParserSuite, FilesystemDisabledTest)
{
    Configuration::Parser parser;
    EXPECT_TRUE(parser.FilesystemDisabled());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::InputError); // A display name is required.
    EXPECT_FALSE(parser.GetLocalIdentity());

    EXPECT_FALSE(parser.SetDisplayName(""));
    EXPECT_FALSE(parser.SetDisplayName(std::string(65, 'a')));
    EXPECT_TRUE(parser.SetDisplayName("Dana"));
    EXPECT_TRUE(parser.SetDeviceInfo("Tablet"));

    EXPECT_FALSE(parser.SetServiceType("Not Allowed"));
    EXPECT_FALSE(parser.SetServiceType("a-service-type-that-is-too-long"));
    EXPECT_TRUE(parser.SetServiceType("parley-2"));

    EXPECT_FALSE(parser.SetReliableThreshold(0));
    EXPECT_TRUE(parser.SetReliableThreshold(4096));

    EXPECT_FALSE(parser.SetInviteTimeout(0ms));
    EXPECT_FALSE(parser.SetInviteTimeout(std::chrono::hours{ 2 }));
    EXPECT_TRUE(parser.SetInviteTimeout(10s));

    EXPECT_FALSE(parser.SetTypingWindow(0ms));
    EXPECT_FALSE(parser.SetTypingWindow(60001ms));
    EXPECT_TRUE(parser.SetTypingWindow(3s));

    parser.SetAutoAccept(false);
    parser.SetVerbosity(spdlog::level::trace);
    EXPECT_TRUE(parser.Changed());

    auto const [status, message] = parser.FetchOptions();
    ASSERT_EQ(status, Configuration::StatusCode::Success) << message;
    EXPECT_FALSE(parser.Changed());
    EXPECT_TRUE(parser.Validated());

    auto const optIdentity = parser.GetLocalIdentity();
    ASSERT_TRUE(optIdentity);
    EXPECT_FALSE(optIdentity->GetPeerId().empty());
    EXPECT_EQ(optIdentity->GetDisplayName(), "Dana");
    EXPECT_EQ(optIdentity->GetDeviceInfo(), "Tablet");

    auto const options = parser.GetSessionOptions();
    EXPECT_EQ(options.serviceType, "parley-2");
    EXPECT_EQ(options.reliableThreshold, std::size_t{ 4096 });
    EXPECT_EQ(options.inviteTimeout, 10s);
    EXPECT_FALSE(options.autoAccept);
    EXPECT_EQ(parser.GetTypingWindow(), 3s);
    EXPECT_EQ(parser.GetVerbosity(), spdlog::level::trace);

    EXPECT_FALSE(std::filesystem::exists(m_filepath));
}

//----------------------------------------------------------------------------------------------------------------------
