//----------------------------------------------------------------------------------------------------------------------
// File: Control.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Control.hpp"
#include "Records.hpp"
#include "Text.hpp"
#include "Components/Message/ContentType.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const SupportedTypes = {
    std::string{ Message::ContentType::Receipt },
    std::string{ Message::ContentType::Edit },
    std::string{ Message::ContentType::Delete },
    std::string{ Message::ContentType::System }
};

template<typename RecordType>
[[nodiscard]] Handler::OptionalEnvelope CreateControlEnvelope(
    RecordType const& record, std::string_view contentType, Peer::Identity const& sender);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Handler::Control::Control(Peer::Identity const& identity)
    : IHandler(Priority::Specific, identity)
{
}

//----------------------------------------------------------------------------------------------------------------------

Handler::ContentTypes const& Handler::Control::GetContentTypes() const { return local::SupportedTypes; }

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Control::Handle(Message::Envelope const& envelope, Parley::Result& result) const
{
    auto const contentType = Message::ContentType::Normalize(envelope.GetContentType());
    if (contentType == Message::ContentType::Receipt) { return HandleReceipt(envelope, result); }
    if (contentType == Message::ContentType::Edit) { return HandleEdit(envelope, result); }
    if (contentType == Message::ContentType::Delete) { return HandleDelete(envelope, result); }
    if (contentType == Message::ContentType::System) { return HandleSystem(envelope, result); }

    result = Parley::ResultCode::UnsupportedContentType;
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Control::Encode(Chat::Message const&) const { return {}; }

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Control::CreateReceiptEnvelope(
    std::string_view messageId, Chat::Status status, Peer::Identity const& sender)
{
    Records::Receipt const record{ .messageId = std::string{ messageId }, .status = status };
    return local::CreateControlEnvelope(record, Message::ContentType::Receipt, sender);
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Control::CreateEditEnvelope(
    std::string_view messageId, std::string_view text, Peer::Identity const& sender)
{
    Records::Edit const record{ .messageId = std::string{ messageId }, .text = std::string{ text } };
    return local::CreateControlEnvelope(record, Message::ContentType::Edit, sender);
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Control::CreateDeleteEnvelope(
    std::string_view messageId, Peer::Identity const& sender)
{
    Records::Delete const record{ .messageId = std::string{ messageId } };
    return local::CreateControlEnvelope(record, Message::ContentType::Delete, sender);
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEnvelope Handler::Control::CreateSystemEnvelope(
    Chat::SystemEventKind kind, std::string_view text, Peer::Identity const& sender)
{
    Records::System const record{ .kind = kind, .text = std::string{ text } };
    return local::CreateControlEnvelope(record, Message::ContentType::System, sender);
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Control::HandleReceipt(Message::Envelope const& envelope, Parley::Result& result) const
{
    auto optRecord = Records::Receipt::FromPack(envelope.GetPayload());
    if (!optRecord) {
        m_logger->warn("Failed to unpack a receipt record from {}.", envelope.GetSender().GetPeerId());
        result = Parley::ResultCode::DeserializationFailed;
        return {};
    }

    result = Parley::ResultCode::Success;
    return Chat::Receipt{
        .id = std::move(optRecord->messageId), .status = optRecord->status, .reporter = envelope.GetSender() };
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Control::HandleEdit(Message::Envelope const& envelope, Parley::Result& result) const
{
    auto optRecord = Records::Edit::FromPack(envelope.GetPayload());
    if (!optRecord) {
        m_logger->warn("Failed to unpack an edit record from {}.", envelope.GetSender().GetPeerId());
        result = Parley::ResultCode::DeserializationFailed;
        return {};
    }

    if (!Text::IsValidUtf8(optRecord->text)) {
        result = Parley::ResultCode::InvalidPayload;
        return {};
    }

    result = Parley::ResultCode::Success;
    return Chat::EditMessage{
        .id = std::move(optRecord->messageId), .text = std::move(optRecord->text), .editor = envelope.GetSender() };
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Control::HandleDelete(Message::Envelope const& envelope, Parley::Result& result) const
{
    auto optRecord = Records::Delete::FromPack(envelope.GetPayload());
    if (!optRecord) {
        m_logger->warn("Failed to unpack a delete record from {}.", envelope.GetSender().GetPeerId());
        result = Parley::ResultCode::DeserializationFailed;
        return {};
    }

    result = Parley::ResultCode::Success;
    return Chat::DeleteMessage{ .id = std::move(optRecord->messageId), .requester = envelope.GetSender() };
}

//----------------------------------------------------------------------------------------------------------------------

Handler::OptionalEvent Handler::Control::HandleSystem(Message::Envelope const& envelope, Parley::Result& result) const
{
    auto optRecord = Records::System::FromPack(envelope.GetPayload());
    if (!optRecord) {
        m_logger->warn("Failed to unpack a system record from {}.", envelope.GetSender().GetPeerId());
        result = Parley::ResultCode::DeserializationFailed;
        return {};
    }

    result = Parley::ResultCode::Success;
    return Chat::SystemEvent{
        .kind = optRecord->kind, .peer = envelope.GetSender(), .text = std::move(optRecord->text) };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename RecordType>
Handler::OptionalEnvelope local::CreateControlEnvelope(
    RecordType const& record, std::string_view contentType, Peer::Identity const& sender)
{
    auto optPack = record.GetPack();
    if (!optPack) { return {}; }

    return Message::Envelope::GetBuilder()
        .SetSender(sender)
        .SetContentType(contentType)
        .SetPayload(std::move(*optPack))
        .ValidatedBuild();
}

//----------------------------------------------------------------------------------------------------------------------
