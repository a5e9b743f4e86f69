//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chat/Events.hpp"
#include "Components/Chat/Message.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Handler/Control.hpp"
#include "Components/Handler/Generic.hpp"
#include "Components/Handler/Image.hpp"
#include "Components/Handler/Multipart.hpp"
#include "Components/Handler/Reaction.hpp"
#include "Components/Handler/Records.hpp"
#include "Components/Handler/Text.hpp"
#include "Components/Handler/Typing.hpp"
#include "Components/Message/ContentType.hpp"
#include "Components/Message/Envelope.hpp"
#include "Components/Peer/Identity.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Message::Envelope GenerateEnvelope(
    Peer::Identity const& sender,
    std::string_view contentType,
    std::span<std::uint8_t const> payload,
    std::optional<Message::Metadata> const& optMetadata = {});

template<typename EventType>
[[nodiscard]] EventType const* FindEvent(Handler::OptionalEvent const& optEvent);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Peer::Identity const LocalIdentity{ "local-peer", "Local" };
Peer::Identity const RemoteIdentity{ "remote-peer", "Remote" };

Message::Buffer const ImageData = { 0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 0x4A, 0x46, 0x49, 0x46 };

[[nodiscard]] Message::Buffer ToBuffer(std::string_view text) { return Message::Buffer{ text.begin(), text.end() }; }

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(TextHandlerSuite, HandleTest)
{
    Handler::Text const handler{ test::LocalIdentity };

    {
        auto const envelope = local::GenerateEnvelope(
            test::RemoteIdentity, Message::ContentType::TextPlain, test::ToBuffer("Hello, 世界!"));

        Parley::Result result;
        auto const optEvent = handler.Handle(envelope, result);
        EXPECT_TRUE(result.IsSuccess());

        auto const pEvent = local::FindEvent<Chat::NewMessage>(optEvent);
        ASSERT_NE(pEvent, nullptr);
        auto const& [message] = *pEvent;
        EXPECT_EQ(message.GetId(), envelope.GetId());
        EXPECT_EQ(message.GetTimestamp(), envelope.GetTimestamp());
        EXPECT_EQ(message.GetText(), "Hello, 世界!");
        EXPECT_EQ(message.GetOrigin(), Chat::Origin::Remote);
        EXPECT_EQ(message.GetStatus(), Chat::Status::Delivered);
        EXPECT_FALSE(message.HasAttachments());
    }

    {
        auto const envelope = local::GenerateEnvelope(
            test::LocalIdentity, Message::ContentType::TextMarkdown, test::ToBuffer("**echo**"));

        Parley::Result result;
        auto const optEvent = handler.Handle(envelope, result);
        auto const pEvent = local::FindEvent<Chat::NewMessage>(optEvent);
        ASSERT_NE(pEvent, nullptr);
        auto const& [message] = *pEvent;
        EXPECT_EQ(message.GetOrigin(), Chat::Origin::Local);
        EXPECT_EQ(message.GetStatus(), Chat::Status::Sent);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(TextHandlerSuite, InvalidUtf8Test)
{
    Handler::Text const handler{ test::LocalIdentity };

    Message::Buffer const payload = { 'h', 'i', 0xC3, 0x28 };
    auto const envelope = local::GenerateEnvelope(test::RemoteIdentity, Message::ContentType::TextPlain, payload);

    Parley::Result result;
    EXPECT_FALSE(handler.Handle(envelope, result));
    EXPECT_EQ(result, Parley::ResultCode::InvalidPayload);

    EXPECT_TRUE(Handler::Text::IsValidUtf8(""));
    EXPECT_TRUE(Handler::Text::IsValidUtf8("plain ascii"));
    EXPECT_TRUE(Handler::Text::IsValidUtf8("\xF0\x9F\x91\x8D"));
    EXPECT_FALSE(Handler::Text::IsValidUtf8("\xC0\xAF")); // Overlong
    EXPECT_FALSE(Handler::Text::IsValidUtf8("\xED\xA0\x80")); // Surrogate
    EXPECT_FALSE(Handler::Text::IsValidUtf8("\xF4\x90\x80\x80")); // Beyond U+10FFFF
    EXPECT_FALSE(Handler::Text::IsValidUtf8("\xE2\x82")); // Truncated
}

//----------------------------------------------------------------------------------------------------------------------

TEST(TextHandlerSuite, EncodeTest)
{
    Handler::Text const handler{ test::LocalIdentity };

    auto const message = Chat::Message::CreateOutbound(test::LocalIdentity, "hello");
    auto const optEnvelope = handler.Encode(message);
    ASSERT_TRUE(optEnvelope);
    EXPECT_EQ(optEnvelope->GetId(), message.GetId());
    EXPECT_EQ(optEnvelope->GetTimestamp(), message.GetTimestamp());
    EXPECT_EQ(optEnvelope->GetSender(), test::LocalIdentity);
    EXPECT_EQ(optEnvelope->GetContentType(), Message::ContentType::TextPlain);
    EXPECT_EQ(optEnvelope->GetPayload(), test::ToBuffer("hello"));
    EXPECT_EQ(optEnvelope->GetMetadataValue("encoding"), "utf-8");

    Chat::Attachment const attachment{
        .data = test::ImageData, .thumbnail = {}, .filename = "a.jpg", .contentType = "image/jpeg", .caption = {} };
    EXPECT_FALSE(handler.Encode(Chat::Message::CreateOutbound(test::LocalIdentity, "hello", { attachment })));
    EXPECT_FALSE(handler.Encode(Chat::Message::CreateOutbound(test::LocalIdentity, "")));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ImageHandlerSuite, RawPayloadTest)
{
    Handler::Image const handler{ test::LocalIdentity };

    {
        auto const envelope = local::GenerateEnvelope(
            test::RemoteIdentity, Message::ContentType::ImagePng, test::ImageData,
            Message::Metadata{ { "filename", "cat.png" }, { "caption", "A cat" } });

        Parley::Result result;
        auto const optEvent = handler.Handle(envelope, result);
        auto const pEvent = local::FindEvent<Chat::NewMessage>(optEvent);
        ASSERT_NE(pEvent, nullptr);
        auto const& [message] = *pEvent;
        ASSERT_EQ(message.GetAttachments().size(), std::size_t{ 1 });

        auto const& attachment = message.GetAttachments().front();
        EXPECT_EQ(attachment.data, test::ImageData);
        EXPECT_EQ(attachment.filename, "cat.png");
        EXPECT_EQ(attachment.contentType, Message::ContentType::ImagePng);
        EXPECT_EQ(attachment.caption, "A cat");
        EXPECT_EQ(message.GetText(), "A cat");
    }

    {
        auto const envelope = local::GenerateEnvelope(test::RemoteIdentity, Message::ContentType::ImageGif, test::ImageData);

        Parley::Result result;
        auto const optEvent = handler.Handle(envelope, result);
        auto const pEvent = local::FindEvent<Chat::NewMessage>(optEvent);
        ASSERT_NE(pEvent, nullptr);
        auto const& [message] = *pEvent;
        ASSERT_EQ(message.GetAttachments().size(), std::size_t{ 1 });
        EXPECT_EQ(message.GetAttachments().front().filename, "image.gif");
        EXPECT_FALSE(message.GetAttachments().front().caption);
        EXPECT_FALSE(message.HasText());
    }

    {
        auto const envelope = local::GenerateEnvelope(test::RemoteIdentity, Message::ContentType::ImageJpeg, {});

        Parley::Result result;
        EXPECT_FALSE(handler.Handle(envelope, result));
        EXPECT_EQ(result, Parley::ResultCode::InvalidPayload);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ImageHandlerSuite, StructuredPayloadTest)
{
    Handler::Image const handler{ test::LocalIdentity };

    Message::Buffer const thumbnail = { 0x01, 0x02, 0x03 };
    Chat::Attachment const attachment{
        .data = test::ImageData, .thumbnail = thumbnail, .filename = "", .contentType = "Image/PNG", .caption = {} };
    auto const outbound = Chat::Message::CreateOutbound(test::LocalIdentity, "Sunset", { attachment });

    auto const optEnvelope = handler.Encode(outbound);
    ASSERT_TRUE(optEnvelope);
    EXPECT_EQ(optEnvelope->GetContentType(), Message::ContentType::ImagePng);
    EXPECT_EQ(optEnvelope->GetMetadataValue("structured"), "true");
    EXPECT_EQ(optEnvelope->GetMetadataValue("filename"), "image.png");

    Parley::Result result;
    auto const optEvent = handler.Handle(*optEnvelope, result);
    auto const pEvent = local::FindEvent<Chat::NewMessage>(optEvent);
    ASSERT_NE(pEvent, nullptr);
    auto const& [message] = *pEvent;
    ASSERT_EQ(message.GetAttachments().size(), std::size_t{ 1 });

    auto const& received = message.GetAttachments().front();
    EXPECT_EQ(received.data, test::ImageData);
    EXPECT_EQ(received.thumbnail, thumbnail);
    EXPECT_EQ(received.filename, "image.png");
    EXPECT_EQ(received.caption, "Sunset");
    EXPECT_EQ(message.GetText(), "Sunset");
    EXPECT_EQ(message.GetOrigin(), Chat::Origin::Local);

    // A structured flag on a payload that is not a record is rejected.
    auto const malformed = local::GenerateEnvelope(
        test::RemoteIdentity, Message::ContentType::ImagePng, test::ImageData, Message::Metadata{ { "structured", "true" } });
    EXPECT_FALSE(handler.Handle(malformed, result));
    EXPECT_EQ(result, Parley::ResultCode::DeserializationFailed);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ImageHandlerSuite, EncodeApplicabilityTest)
{
    Handler::Image const handler{ test::LocalIdentity };

    Chat::Attachment const video{
        .data = test::ImageData, .thumbnail = {}, .filename = "clip.mp4", .contentType = "video/mp4", .caption = {} };
    EXPECT_FALSE(handler.Encode(Chat::Message::CreateOutbound(test::LocalIdentity, "", { video })));
    EXPECT_FALSE(handler.Encode(Chat::Message::CreateOutbound(test::LocalIdentity, "text only")));

    EXPECT_EQ(Handler::Image::GetDefaultFilename(Message::ContentType::ImageHeic), "image.heic");
    EXPECT_EQ(Handler::Image::GetDefaultFilename("image"), "image.jpg");

    auto const optEnvelope = Handler::Image::CreateImageEnvelope(
        test::ImageData, Message::ContentType::ImageJpeg, "photo.jpg", std::string{ "Hi" }, test::RemoteIdentity);
    ASSERT_TRUE(optEnvelope);
    EXPECT_EQ(optEnvelope->GetMetadataValue("filename"), "photo.jpg");
    EXPECT_EQ(optEnvelope->GetMetadataValue("caption"), "Hi");
    EXPECT_FALSE(optEnvelope->GetMetadataValue("structured"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ReactionHandlerSuite, HandleTest)
{
    Handler::Reaction const handler{ test::LocalIdentity };

    auto const optEnvelope = Handler::Reaction::CreateReactionEnvelope(
        "message-1", "👍", Chat::ReactionAction::Remove, test::RemoteIdentity);
    ASSERT_TRUE(optEnvelope);
    EXPECT_EQ(optEnvelope->GetContentType(), Message::ContentType::Reaction);

    Parley::Result result;
    auto const optEvent = handler.Handle(*optEnvelope, result);
    auto const pEvent = local::FindEvent<Chat::Reaction>(optEvent);
    ASSERT_NE(pEvent, nullptr);
    auto const& reaction = *pEvent;
    EXPECT_EQ(reaction.messageId, "message-1");
    EXPECT_EQ(reaction.emoji, "👍");
    EXPECT_EQ(reaction.action, Chat::ReactionAction::Remove);
    EXPECT_EQ(reaction.reactor, test::RemoteIdentity);

    EXPECT_FALSE(handler.Encode(Chat::Message::CreateOutbound(test::LocalIdentity, "👍")));

    auto const garbage = local::GenerateEnvelope(
        test::RemoteIdentity, Message::ContentType::Reaction, test::ToBuffer("not a record"));
    EXPECT_FALSE(handler.Handle(garbage, result));
    EXPECT_EQ(result, Parley::ResultCode::DeserializationFailed);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(TypingHandlerSuite, HandleTest)
{
    Handler::Typing const handler{ test::LocalIdentity };

    {
        auto const optEnvelope = Handler::Typing::CreateTypingEnvelope(true, test::RemoteIdentity, std::string{ "Hel" });
        ASSERT_TRUE(optEnvelope);
        EXPECT_EQ(optEnvelope->GetMetadataValue("has-preview"), "true");

        Parley::Result result;
        auto const optEvent = handler.Handle(*optEnvelope, result);
        auto const pEvent = local::FindEvent<Chat::TypingStatus>(optEvent);
        ASSERT_NE(pEvent, nullptr);
        auto const& status = *pEvent;
        EXPECT_EQ(status.peer, test::RemoteIdentity);
        EXPECT_TRUE(status.isTyping);
        EXPECT_EQ(status.preview, "Hel");
    }

    {
        auto const optEnvelope = Handler::Typing::CreateTypingEnvelope(false, test::RemoteIdentity, {});
        ASSERT_TRUE(optEnvelope);
        EXPECT_FALSE(optEnvelope->GetMetadataValue("has-preview"));

        Parley::Result result;
        auto const optEvent = handler.Handle(*optEnvelope, result);
        auto const pEvent = local::FindEvent<Chat::TypingStatus>(optEvent);
        ASSERT_NE(pEvent, nullptr);
        auto const& status = *pEvent;
        EXPECT_FALSE(status.isTyping);
        EXPECT_FALSE(status.preview);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MultipartHandlerSuite, TextPartsTest)
{
    Handler::Multipart const handler{ test::LocalIdentity };

    Handler::Records::Multipart const record{
        .boundary = "boundary",
        .parts = {
            { .contentType = "text/plain", .contentId = std::string{ "one" }, .headers = {}, .data = test::ToBuffer("A") },
            { .contentType = "text/plain", .contentId = std::string{ "two" }, .headers = {}, .data = test::ToBuffer("B") }
        }
    };

    auto const optPack = record.GetPack();
    ASSERT_TRUE(optPack);

    auto const envelope = local::GenerateEnvelope(test::RemoteIdentity, Message::ContentType::MultipartMixed, *optPack);

    Parley::Result result;
    auto const optEvent = handler.Handle(envelope, result);
    EXPECT_TRUE(result.IsSuccess());

    auto const pEvent = local::FindEvent<Chat::NewMessage>(optEvent);
    ASSERT_NE(pEvent, nullptr);
    auto const& [message] = *pEvent;
    EXPECT_EQ(message.GetId(), envelope.GetId());
    EXPECT_EQ(message.GetText(), "A\nB");
    EXPECT_FALSE(message.HasAttachments());
    EXPECT_EQ(message.GetOrigin(), Chat::Origin::Remote);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MultipartHandlerSuite, MixedPartsTest)
{
    Handler::Multipart const handler{ test::LocalIdentity };

    auto const optEnvelope = Handler::Multipart::CreateMultipartEnvelope(
        std::string{ "Look" }, { test::ImageData, test::ImageData }, test::RemoteIdentity,
        Message::Metadata{ { "thread", "general" } });
    ASSERT_TRUE(optEnvelope);
    EXPECT_EQ(optEnvelope->GetContentType(), Message::ContentType::MultipartMixed);
    EXPECT_EQ(optEnvelope->GetMetadataValue("parts-count"), "3");
    EXPECT_EQ(optEnvelope->GetMetadataValue("thread"), "general");

    Parley::Result result;
    auto const optEvent = handler.Handle(*optEnvelope, result);
    auto const pEvent = local::FindEvent<Chat::NewMessage>(optEvent);
    ASSERT_NE(pEvent, nullptr);
    auto const& [message] = *pEvent;
    EXPECT_EQ(message.GetText(), "Look");
    ASSERT_EQ(message.GetAttachments().size(), std::size_t{ 2 });
    EXPECT_EQ(message.GetAttachments()[0].filename, "image_0.jpg");
    EXPECT_EQ(message.GetAttachments()[1].filename, "image_1.jpg");
    EXPECT_EQ(message.GetAttachments()[1].data, test::ImageData);

    EXPECT_FALSE(Handler::Multipart::CreateMultipartEnvelope({}, {}, test::RemoteIdentity, {}));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MultipartHandlerSuite, ReactionPartTest)
{
    Handler::Multipart const handler{ test::LocalIdentity };

    auto const optReaction = Handler::Reaction::CreateReactionEnvelope(
        "message-2", "🎉", Chat::ReactionAction::Add, test::RemoteIdentity);
    ASSERT_TRUE(optReaction);

    Handler::Records::Multipart const record{
        .boundary = "boundary",
        .parts = {
            { .contentType = "text/plain", .contentId = {}, .headers = {}, .data = test::ToBuffer("ignored") },
            {
                .contentType = std::string{ Message::ContentType::Reaction },
                .contentId = {},
                .headers = {},
                .data = optReaction->GetPayload()
            }
        }
    };

    auto const optPack = record.GetPack();
    ASSERT_TRUE(optPack);

    auto const envelope = local::GenerateEnvelope(test::RemoteIdentity, Message::ContentType::MultipartMixed, *optPack);

    Parley::Result result;
    auto const optEvent = handler.Handle(envelope, result);
    auto const pEvent = local::FindEvent<Chat::Reaction>(optEvent);
    ASSERT_NE(pEvent, nullptr);
    auto const& reaction = *pEvent;
    EXPECT_EQ(reaction.messageId, "message-2");
    EXPECT_EQ(reaction.emoji, "🎉");
    EXPECT_EQ(reaction.action, Chat::ReactionAction::Add);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MultipartHandlerSuite, UnrecognizedPartsTest)
{
    Handler::Multipart const handler{ test::LocalIdentity };

    Handler::Records::Multipart const record{
        .boundary = "boundary",
        .parts = {
            { .contentType = "application/pdf", .contentId = {}, .headers = {}, .data = test::ToBuffer("%PDF") }
        }
    };

    auto const optPack = record.GetPack();
    ASSERT_TRUE(optPack);

    auto const envelope = local::GenerateEnvelope(test::RemoteIdentity, Message::ContentType::MultipartMixed, *optPack);

    Parley::Result result;
    auto const optEvent = handler.Handle(envelope, result);
    auto const pEvent = local::FindEvent<Chat::NewMessage>(optEvent);
    ASSERT_NE(pEvent, nullptr);
    auto const& [message] = *pEvent;
    EXPECT_EQ(message.GetText(), "[mixed content]");
    ASSERT_TRUE(message.HasRawContent());
    EXPECT_EQ(message.GetRawContent()->data, *optPack);

    auto const garbage = local::GenerateEnvelope(
        test::RemoteIdentity, Message::ContentType::MultipartMixed, test::ToBuffer("garbage"));
    EXPECT_FALSE(handler.Handle(garbage, result));
    EXPECT_EQ(result, Parley::ResultCode::DeserializationFailed);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MultipartHandlerSuite, EncodeTest)
{
    Handler::Multipart const handler{ test::LocalIdentity };

    Chat::Attachment const attachment{
        .data = test::ImageData, .thumbnail = {}, .filename = "", .contentType = "image/png", .caption = "Left" };

    EXPECT_FALSE(handler.Encode(Chat::Message::CreateOutbound(test::LocalIdentity, "single facet")));

    auto const outbound = Chat::Message::CreateOutbound(test::LocalIdentity, "Two views", { attachment });
    auto const optEnvelope = handler.Encode(outbound);
    ASSERT_TRUE(optEnvelope);
    EXPECT_EQ(optEnvelope->GetId(), outbound.GetId());
    EXPECT_EQ(optEnvelope->GetMetadataValue("parts-count"), "2");

    auto const optRecord = Handler::Records::Multipart::FromPack(optEnvelope->GetPayload());
    ASSERT_TRUE(optRecord);
    ASSERT_EQ(optRecord->parts.size(), std::size_t{ 2 });
    EXPECT_EQ(optRecord->parts[0].contentType, Message::ContentType::TextPlain);
    EXPECT_EQ(optRecord->parts[0].contentId, Handler::Multipart::TextContentId);
    EXPECT_EQ(optRecord->parts[1].contentType, Message::ContentType::ImagePng);
    EXPECT_EQ(optRecord->parts[1].contentId, "image_0");
    ASSERT_TRUE(optRecord->parts[1].headers);
    EXPECT_EQ(optRecord->parts[1].headers->at("filename"), "image.png");
    EXPECT_EQ(optRecord->parts[1].headers->at("caption"), "Left");

    Parley::Result result;
    auto const optEvent = handler.Handle(*optEnvelope, result);
    auto const pEvent = local::FindEvent<Chat::NewMessage>(optEvent);
    ASSERT_NE(pEvent, nullptr);
    auto const& [message] = *pEvent;
    EXPECT_EQ(message.GetText(), "Two views");
    ASSERT_EQ(message.GetAttachments().size(), std::size_t{ 1 });
    EXPECT_EQ(message.GetAttachments().front().caption, "Left");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ControlHandlerSuite, HandleTest)
{
    Handler::Control const handler{ test::LocalIdentity };
    Parley::Result result;

    {
        auto const optEnvelope = Handler::Control::CreateReceiptEnvelope("message-3", Chat::Status::Read, test::RemoteIdentity);
        ASSERT_TRUE(optEnvelope);
        auto const optEvent = handler.Handle(*optEnvelope, result);
        auto const pEvent = local::FindEvent<Chat::Receipt>(optEvent);
        ASSERT_NE(pEvent, nullptr);
        auto const& receipt = *pEvent;
        EXPECT_EQ(receipt.id, "message-3");
        EXPECT_EQ(receipt.status, Chat::Status::Read);
        EXPECT_EQ(receipt.reporter, test::RemoteIdentity);
    }

    {
        auto const optEnvelope = Handler::Control::CreateEditEnvelope("message-3", "corrected", test::RemoteIdentity);
        ASSERT_TRUE(optEnvelope);
        auto const optEvent = handler.Handle(*optEnvelope, result);
        auto const pEvent = local::FindEvent<Chat::EditMessage>(optEvent);
        ASSERT_NE(pEvent, nullptr);
        auto const& edit = *pEvent;
        EXPECT_EQ(edit.id, "message-3");
        EXPECT_EQ(edit.text, "corrected");
        EXPECT_EQ(edit.editor, test::RemoteIdentity);
    }

    {
        auto const optEnvelope = Handler::Control::CreateDeleteEnvelope("message-3", test::RemoteIdentity);
        ASSERT_TRUE(optEnvelope);
        auto const optEvent = handler.Handle(*optEnvelope, result);
        auto const pEvent = local::FindEvent<Chat::DeleteMessage>(optEvent);
        ASSERT_NE(pEvent, nullptr);
        auto const& deletion = *pEvent;
        EXPECT_EQ(deletion.id, "message-3");
        EXPECT_EQ(deletion.requester, test::RemoteIdentity);
    }

    {
        auto const optEnvelope = Handler::Control::CreateSystemEnvelope(
            Chat::SystemEventKind::Notice, "Remote changed the topic", test::RemoteIdentity);
        ASSERT_TRUE(optEnvelope);
        auto const optEvent = handler.Handle(*optEnvelope, result);
        auto const pEvent = local::FindEvent<Chat::SystemEvent>(optEvent);
        ASSERT_NE(pEvent, nullptr);
        auto const& system = *pEvent;
        EXPECT_EQ(system.kind, Chat::SystemEventKind::Notice);
        EXPECT_EQ(system.text, "Remote changed the topic");
        EXPECT_EQ(system.peer, test::RemoteIdentity);
    }

    {
        auto const optEnvelope = Handler::Control::CreateEditEnvelope("message-3", "\xC3\x28", test::RemoteIdentity);
        ASSERT_TRUE(optEnvelope);
        EXPECT_FALSE(handler.Handle(*optEnvelope, result));
        EXPECT_EQ(result, Parley::ResultCode::InvalidPayload);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(GenericHandlerSuite, HandleTest)
{
    Handler::Generic const handler{ test::LocalIdentity };

    auto const payload = test::ToBuffer("{\"key\":1}");
    auto const envelope = local::GenerateEnvelope(test::RemoteIdentity, Message::ContentType::ApplicationJson, payload);

    Parley::Result result;
    auto const optEvent = handler.Handle(envelope, result);
    auto const pEvent = local::FindEvent<Chat::NewMessage>(optEvent);
    ASSERT_NE(pEvent, nullptr);
    auto const& [message] = *pEvent;
    EXPECT_EQ(message.GetText(), "[json content]");
    ASSERT_TRUE(message.HasRawContent());
    EXPECT_EQ(message.GetRawContent()->contentType, Message::ContentType::ApplicationJson);
    EXPECT_EQ(message.GetRawContent()->data, payload);

    EXPECT_EQ(Handler::Generic::DescribeContent("video/mp4"), "[mp4 content]");
    EXPECT_EQ(Handler::Generic::DescribeContent("unknown"), "[Unknown content]");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(GenericHandlerSuite, EncodeTest)
{
    Handler::Generic const handler{ test::LocalIdentity };

    auto message = Chat::Message::CreateOutbound(test::LocalIdentity, "");
    EXPECT_FALSE(handler.Encode(message));

    message.SetRawContent(Chat::RawContent{ .contentType = "application/pdf", .data = test::ToBuffer("%PDF") });
    auto const optEnvelope = handler.Encode(message);
    ASSERT_TRUE(optEnvelope);
    EXPECT_EQ(optEnvelope->GetContentType(), Message::ContentType::ApplicationPdf);
    EXPECT_EQ(optEnvelope->GetPayload(), test::ToBuffer("%PDF"));
}

//----------------------------------------------------------------------------------------------------------------------

Message::Envelope local::GenerateEnvelope(
    Peer::Identity const& sender,
    std::string_view contentType,
    std::span<std::uint8_t const> payload,
    std::optional<Message::Metadata> const& optMetadata)
{
    auto optEnvelope = Message::Envelope::GetBuilder()
        .SetSender(sender)
        .SetContentType(contentType)
        .SetPayload(payload)
        .SetMetadata(optMetadata)
        .ValidatedBuild();
    EXPECT_TRUE(optEnvelope);
    return std::move(*optEnvelope);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename EventType>
EventType const* local::FindEvent(Handler::OptionalEvent const& optEvent)
{
    if (!optEvent) {
        ADD_FAILURE() << "Expected an event to be produced.";
        return nullptr;
    }

    auto const pEvent = std::get_if<EventType>(&*optEvent);
    if (!pEvent) { ADD_FAILURE() << "Produced the " << Chat::GetEventName(*optEvent) << " event instead."; }
    return pEvent;
}

//----------------------------------------------------------------------------------------------------------------------
