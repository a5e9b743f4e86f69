//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Chat/Message.hpp"
#include "Components/Identifier/Identifier.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <set>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------

TEST(IdentifierSuite, GenerateTest)
{
    std::set<std::string> generated;
    for (std::uint32_t idx = 0; idx < 64; ++idx) {
        auto const identifier = Identifier::Generate();
        ASSERT_EQ(identifier.size(), Identifier::FormattedSize);
        EXPECT_TRUE(Identifier::IsFormatted(identifier));
        EXPECT_EQ(identifier[14], '4'); // Version nibble
        generated.emplace(identifier);
    }
    EXPECT_EQ(generated.size(), std::size_t{ 64 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(IdentifierSuite, IsFormattedTest)
{
    EXPECT_TRUE(Identifier::IsFormatted("0f8fad5b-d9cb-469f-a165-70867728950e"));
    EXPECT_TRUE(Identifier::IsFormatted("0F8FAD5B-D9CB-469F-A165-70867728950E"));
    EXPECT_FALSE(Identifier::IsFormatted(""));
    EXPECT_FALSE(Identifier::IsFormatted("0f8fad5bd9cb469fa16570867728950e"));
    EXPECT_FALSE(Identifier::IsFormatted("0f8fad5b-d9cb-469f-a165-70867728950"));
    EXPECT_FALSE(Identifier::IsFormatted("0f8fad5b-d9cb-469f-a165-70867728950z"));
    EXPECT_FALSE(Identifier::IsFormatted("0f8fad5b+d9cb-469f-a165-70867728950e"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChatMessageSuite, CreateOutboundTest)
{
    Chat::Attachment const attachment{ { 0xFF, 0xD8, 0xFF }, {}, "photo.jpg", "image/jpeg", "Sunset" };
    auto message = Chat::Message::CreateOutbound(Chat::Test::Alice, "Hello", { attachment });

    EXPECT_TRUE(Identifier::IsFormatted(message.GetId()));
    EXPECT_EQ(message.GetAuthor(), Chat::Test::Alice);
    EXPECT_EQ(message.GetOrigin(), Chat::Origin::Local);
    EXPECT_EQ(message.GetStatus(), Chat::Status::Sending);
    EXPECT_TRUE(message.HasText());
    EXPECT_TRUE(message.HasAttachments());
    EXPECT_FALSE(message.HasRawContent());
    EXPECT_EQ(message.GetFacetCount(), std::size_t{ 2 });

    message.AddAttachment(attachment);
    EXPECT_EQ(message.GetFacetCount(), std::size_t{ 3 });

    message.SetStatus(Chat::Status::Sent);
    EXPECT_EQ(message.GetStatus(), Chat::Status::Sent);

    auto const other = Chat::Message::CreateOutbound(Chat::Test::Alice, "Hello");
    EXPECT_NE(other.GetId(), message.GetId());
    EXPECT_FALSE(other.HasAttachments());
    EXPECT_EQ(other.GetFacetCount(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChatMessageSuite, StatusNameTest)
{
    for (auto const status : { Chat::Status::Sending, Chat::Status::Sent, Chat::Status::Delivered, Chat::Status::Read,
                               Chat::Status::Failed }) {
        auto const optStatus = Chat::ParseStatus(Chat::ToString(status));
        ASSERT_TRUE(optStatus);
        EXPECT_EQ(*optStatus, status);
    }

    EXPECT_EQ(Chat::ToString(Chat::Status::Delivered), "delivered");
    EXPECT_FALSE(Chat::ParseStatus("Delivered"));
    EXPECT_FALSE(Chat::ParseStatus(""));
}

//----------------------------------------------------------------------------------------------------------------------
