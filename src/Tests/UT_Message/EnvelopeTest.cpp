//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Result.hpp"
#include "Components/Message/ContentType.hpp"
#include "Components/Message/Envelope.hpp"
#include "Components/Peer/Identity.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Message::Envelope GenerateEnvelope();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Peer::Identity const Sender{ "9f1c2b3a-sender", "Alice", std::string{ "Pixel 8" }, Message::Buffer{ 0x01, 0x02 } };

constexpr std::string_view EnvelopeId = "3c1f8e0e-0000-4000-8000-000000000001";
constexpr std::string_view Payload = "Hello, World!";
TimeUtils::Timepoint const Timestamp = TimeUtils::TimestampToTimepoint(TimeUtils::Timestamp{ 1'700'000'000'123 });

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(EnvelopeSuite, BuilderTest)
{
    auto const envelope = local::GenerateEnvelope();

    EXPECT_EQ(envelope.GetId(), test::EnvelopeId);
    EXPECT_EQ(envelope.GetTimestamp(), test::Timestamp);
    EXPECT_EQ(envelope.GetSender(), test::Sender);
    EXPECT_TRUE(envelope.GetSender().IsEquivalent(test::Sender));
    EXPECT_EQ(envelope.GetContentType(), Message::ContentType::TextPlain);
    EXPECT_EQ(envelope.GetPayload(), Message::Buffer(test::Payload.begin(), test::Payload.end()));
    EXPECT_EQ(envelope.GetMetadataValue("encoding"), "utf-8");
    EXPECT_FALSE(envelope.GetMetadataValue("missing"));
    EXPECT_EQ(envelope.GetSequenceNumber(), Message::SequenceNumber{ 42 });
    EXPECT_EQ(envelope.Validate(), Message::ValidationStatus::Success);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EnvelopeSuite, GeneratedFieldsTest)
{
    auto const before = TimeUtils::GetSystemTimepoint();
    auto const optEnvelope = Message::Envelope::GetBuilder()
        .SetSender(test::Sender)
        .SetContentType(Message::ContentType::TextPlain)
        .SetPayload(test::Payload)
        .ValidatedBuild();
    ASSERT_TRUE(optEnvelope);

    EXPECT_FALSE(optEnvelope->GetId().empty());
    EXPECT_GE(optEnvelope->GetTimestamp(), before);
    EXPECT_FALSE(optEnvelope->GetMetadata());
    EXPECT_FALSE(optEnvelope->GetSequenceNumber());

    auto const optOther = Message::Envelope::GetBuilder()
        .SetSender(test::Sender)
        .SetContentType(Message::ContentType::TextPlain)
        .ValidatedBuild();
    ASSERT_TRUE(optOther);
    EXPECT_NE(optEnvelope->GetId(), optOther->GetId());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EnvelopeSuite, InvalidBuildTest)
{
    {
        auto const optEnvelope = Message::Envelope::GetBuilder()
            .SetSender(test::Sender)
            .SetPayload(test::Payload)
            .ValidatedBuild();
        EXPECT_FALSE(optEnvelope); // The content type is required.
    }

    {
        auto const optEnvelope = Message::Envelope::GetBuilder()
            .SetSender(Peer::Identity{ "", "Nobody" })
            .SetContentType(Message::ContentType::TextPlain)
            .ValidatedBuild();
        EXPECT_FALSE(optEnvelope); // The sender must be identifiable.
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EnvelopeSuite, PackTest)
{
    auto const envelope = local::GenerateEnvelope();
    auto const pack = envelope.GetPack();
    EXPECT_EQ(pack.size(), envelope.GetPackSize());
    EXPECT_EQ(pack.front(), Message::EnvelopeVersion);

    Parley::Result result;
    auto const optDecoded = Message::Decode(pack, result);
    ASSERT_TRUE(optDecoded);
    EXPECT_TRUE(result.IsSuccess());

    EXPECT_EQ(*optDecoded, envelope);
    EXPECT_EQ(optDecoded->GetTimestamp(), test::Timestamp);
    EXPECT_TRUE(optDecoded->GetSender().IsEquivalent(test::Sender));
    EXPECT_EQ(optDecoded->GetMetadata(), envelope.GetMetadata());
    EXPECT_EQ(optDecoded->GetSequenceNumber(), envelope.GetSequenceNumber());
    EXPECT_EQ(optDecoded->GetPack(), pack);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EnvelopeSuite, PreEpochTimestampTest)
{
    auto const timestamp = TimeUtils::TimestampToTimepoint(TimeUtils::Timestamp{ -1'000 });
    auto const optEnvelope = Message::Envelope::GetBuilder()
        .SetId(test::EnvelopeId)
        .SetTimestamp(timestamp)
        .SetSender(test::Sender)
        .SetContentType(Message::ContentType::TextPlain)
        .SetPayload(test::Payload)
        .ValidatedBuild();
    ASSERT_TRUE(optEnvelope);

    Parley::Result result;
    auto const optDecoded = Message::Decode(optEnvelope->GetPack(), result);
    ASSERT_TRUE(optDecoded);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(optDecoded->GetTimestamp(), timestamp);
    EXPECT_EQ(*optDecoded, *optEnvelope);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EnvelopeSuite, BinaryPayloadTest)
{
    Message::Buffer payload;
    for (std::uint32_t value = 0; value < 512; ++value) { payload.emplace_back(static_cast<std::uint8_t>(value)); }

    auto const optEnvelope = Message::Envelope::GetBuilder()
        .SetSender(test::Sender)
        .SetContentType(Message::ContentType::ApplicationOctetStream)
        .SetPayload(std::span<std::uint8_t const>{ payload })
        .ValidatedBuild();
    ASSERT_TRUE(optEnvelope);

    Parley::Result result;
    auto const optDecoded = Message::Decode(optEnvelope->GetPack(), result);
    ASSERT_TRUE(optDecoded);
    EXPECT_EQ(optDecoded->GetPayload(), payload);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EnvelopeSuite, DecodeTruncatedTest)
{
    auto const pack = local::GenerateEnvelope().GetPack();

    for (std::size_t size = 0; size < pack.size(); ++size) {
        Parley::Result result;
        auto const optDecoded = Message::Decode(std::span{ pack.data(), size }, result);
        EXPECT_FALSE(optDecoded) << "Decoded a pack truncated to " << size << " bytes.";
        EXPECT_EQ(result, Parley::ResultCode::DecodeError);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EnvelopeSuite, DecodeTrailingBytesTest)
{
    auto pack = local::GenerateEnvelope().GetPack();
    pack.emplace_back(0x00);

    Parley::Result result;
    EXPECT_FALSE(Message::Decode(pack, result));
    EXPECT_EQ(result, Parley::ResultCode::DecodeError);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EnvelopeSuite, DecodeUnknownVersionTest)
{
    auto pack = local::GenerateEnvelope().GetPack();
    pack.front() = Message::EnvelopeVersion + 1;

    Parley::Result result;
    EXPECT_FALSE(Message::Decode(pack, result));
    EXPECT_EQ(result, Parley::ResultCode::DecodeError);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EnvelopeSuite, DecodeGarbageTest)
{
    Message::Buffer const garbage = { 0x01, 0xFF, 0xFF, 0x41, 0x42 };

    Parley::Result result;
    EXPECT_FALSE(Message::Decode(garbage, result));
    EXPECT_EQ(result, Parley::ResultCode::DecodeError);
}

//----------------------------------------------------------------------------------------------------------------------

Message::Envelope local::GenerateEnvelope()
{
    auto optEnvelope = Message::Envelope::GetBuilder()
        .SetId(test::EnvelopeId)
        .SetTimestamp(test::Timestamp)
        .SetSender(test::Sender)
        .SetContentType(Message::ContentType::TextPlain)
        .SetPayload(test::Payload)
        .AddMetadata("encoding", "utf-8")
        .SetSequenceNumber(42)
        .ValidatedBuild();
    EXPECT_TRUE(optEnvelope);
    return std::move(*optEnvelope);
}

//----------------------------------------------------------------------------------------------------------------------
