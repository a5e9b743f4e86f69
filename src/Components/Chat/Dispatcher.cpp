//----------------------------------------------------------------------------------------------------------------------
// File: Dispatcher.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Dispatcher.hpp"
#include "Components/Handler/Control.hpp"
#include "Components/Handler/Reaction.hpp"
#include "Components/Handler/Typing.hpp"
#include "Components/Message/Processor.hpp"
#include "Components/Peer/Session.hpp"
#include "Interfaces/EventSink.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string CreateJoinedText(Peer::Identity const& peer);
[[nodiscard]] std::string CreateLeftText(Peer::Identity const& peer);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Chat::Dispatcher::Dispatcher(
    std::shared_ptr<Peer::Session> const& spSession,
    std::shared_ptr<::Message::Processor> const& spProcessor,
    IEventSink* const sink,
    std::chrono::milliseconds typingWindow)
    : m_spSession(spSession)
    , m_spProcessor(spProcessor)
    , m_sink(sink)
    , m_outboundMutex()
    , m_outbound()
    , m_typing(typingWindow)
    , m_logger(spdlog::get(Logger::Name::Core.data()))
{
    assert(m_logger);
    assert(m_spSession && m_spProcessor && m_sink);

    m_typing.SetExpirationHandler([this] (Peer::Identity const& peer) {
        Publish(TypingStatus{ .peer = peer, .isTyping = false, .preview = {} });
    });

    m_spSession->RegisterObserver(this);
}

//----------------------------------------------------------------------------------------------------------------------

Chat::Dispatcher::~Dispatcher()
{
    m_spSession->UnpublishObserver(this);
    m_typing.SetExpirationHandler({});
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Chat::Dispatcher::SendMessage(
    std::string_view text, Attachments const& attachments, Parley::Result& result)
{
    if (text.empty() && attachments.empty()) {
        result = Parley::ResultCode::InvalidArgument;
        return {};
    }

    auto message = Message::CreateOutbound(m_spSession->GetLocalIdentity(), text, attachments);
    auto const id = message.GetId();
    {
        std::scoped_lock lock{ m_outboundMutex };
        m_outbound.emplace(id, message);
    }

    Publish(NewMessage{ .message = message });

    result = Transmit(message);
    if (result.IsError()) { UpdateStatus(id, Status::Failed); }

    return id;
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Chat::Dispatcher::RetryMessage(std::string_view id)
{
    std::optional<Message> optMessage;
    {
        std::scoped_lock lock{ m_outboundMutex };
        auto const itr = m_outbound.find(std::string{ id });
        if (itr == m_outbound.end() || itr->second.GetStatus() != Status::Failed) {
            m_logger->warn("Unable to retry message {}. Only failed messages may be retried.", id);
            return Parley::ResultCode::InvalidArgument;
        }
        itr->second.SetStatus(Status::Sending);
        optMessage = itr->second;
    }

    m_logger->debug("Retrying message {}.", id);
    Publish(UpdateMessage{ .id = optMessage->GetId(), .patch = { .status = Status::Sending, .text = {} } });

    auto const result = Transmit(*optMessage);
    if (result.IsError()) { UpdateStatus(optMessage->GetId(), Status::Failed); }
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Chat::Dispatcher::SendReaction(std::string_view messageId, std::string_view emoji, ReactionAction action)
{
    if (messageId.empty() || emoji.empty()) { return Parley::ResultCode::InvalidArgument; }
    auto const& identity = m_spSession->GetLocalIdentity();
    return Broadcast(Handler::Reaction::CreateReactionEnvelope(messageId, emoji, action, identity), "reaction");
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Chat::Dispatcher::SendTypingIndicator(bool isTyping, std::optional<std::string> const& optPreview)
{
    auto const& identity = m_spSession->GetLocalIdentity();
    return Broadcast(Handler::Typing::CreateTypingEnvelope(isTyping, identity, optPreview), "typing indicator");
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Chat::Dispatcher::SendReceipt(std::string_view messageId, Status status)
{
    if (messageId.empty()) { return Parley::ResultCode::InvalidArgument; }
    auto const& identity = m_spSession->GetLocalIdentity();
    return Broadcast(Handler::Control::CreateReceiptEnvelope(messageId, status, identity), "receipt");
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Chat::Dispatcher::SendEdit(std::string_view messageId, std::string_view text)
{
    if (messageId.empty()) { return Parley::ResultCode::InvalidArgument; }

    {
        std::scoped_lock lock{ m_outboundMutex };
        if (auto const itr = m_outbound.find(std::string{ messageId }); itr != m_outbound.end()) {
            itr->second.SetText(text);
        }
    }

    auto const& identity = m_spSession->GetLocalIdentity();
    return Broadcast(Handler::Control::CreateEditEnvelope(messageId, text, identity), "edit");
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Chat::Dispatcher::SendDelete(std::string_view messageId)
{
    if (messageId.empty()) { return Parley::ResultCode::InvalidArgument; }

    {
        std::scoped_lock lock{ m_outboundMutex };
        m_outbound.erase(std::string{ messageId });
    }

    auto const& identity = m_spSession->GetLocalIdentity();
    return Broadcast(Handler::Control::CreateDeleteEnvelope(messageId, identity), "delete request");
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chat::Status> Chat::Dispatcher::GetMessageStatus(std::string_view id) const
{
    std::scoped_lock lock{ m_outboundMutex };
    if (auto const itr = m_outbound.find(std::string{ id }); itr != m_outbound.end()) {
        return itr->second.GetStatus();
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Chat::TypingMonitor const& Chat::Dispatcher::GetTypingMonitor() const { return m_typing; }

//----------------------------------------------------------------------------------------------------------------------

void Chat::Dispatcher::OnDataReceived(std::span<std::uint8_t const> buffer, Peer::Identity const& peer)
{
    Parley::Result result;
    auto const optEnvelope = ::Message::Decode(buffer, result);
    if (!optEnvelope) {
        m_logger->warn("Discarding {} bytes from {}. Reason: {}", buffer.size(), peer.GetPeerId(), result.what());
        PublishError(result);
        return;
    }

    if (optEnvelope->GetSender() != peer) {
        m_logger->debug("Envelope {} was relayed by {} on behalf of {}.",
            optEnvelope->GetId(), peer.GetPeerId(), optEnvelope->GetSender().GetPeerId());
    }

    auto const optEvent = m_spProcessor->Process(*optEnvelope, result);
    if (!optEvent) {
        PublishError(result);
        return;
    }

    OnEventProcessed(*optEvent);
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::Dispatcher::OnPeerStateChanged(Peer::Identity const& peer, Peer::ConnectionState state)
{
    switch (state) {
        case Peer::ConnectionState::Connected: {
            Publish(SystemEvent{
                .kind = SystemEventKind::PeerJoined, .peer = peer, .text = local::CreateJoinedText(peer) });
        } break;
        case Peer::ConnectionState::NotConnected:
        case Peer::ConnectionState::Disconnected: {
            if (m_typing.Clear(peer.GetPeerId())) {
                Publish(TypingStatus{ .peer = peer, .isTyping = false, .preview = {} });
            }
            Publish(SystemEvent{
                .kind = SystemEventKind::PeerLeft, .peer = peer, .text = local::CreateLeftText(peer) });
        } break;
        case Peer::ConnectionState::Connecting: break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::Dispatcher::OnError(Parley::Result const& result)
{
    PublishError(result);
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::Dispatcher::OnPeerDiscovered(Peer::Identity const& peer)
{
    m_logger->debug("{} is available to join the chat.", peer.GetDisplayName());
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::Dispatcher::OnPeerLost(Peer::Identity const& peer)
{
    m_logger->debug("{} is no longer available.", peer.GetDisplayName());
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Chat::Dispatcher::Transmit(Message const& message)
{
    Parley::Result result;
    auto const optEnvelope = m_spProcessor->Encode(message, result);
    if (!optEnvelope) { return result; }

    return m_spSession->ScheduleBroadcast(*optEnvelope,
        [wpDispatcher = weak_from_this(), id = message.GetId()] (Parley::Result const& outcome) {
            auto const spDispatcher = wpDispatcher.lock();
            if (!spDispatcher) { return; }
            if (outcome.IsError()) {
                spDispatcher->m_logger->warn("Failed to send message {}. Reason: {}", id, outcome.what());
            }
            spDispatcher->UpdateStatus(id, outcome.IsSuccess() ? Status::Sent : Status::Failed);
        });
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Chat::Dispatcher::Broadcast(
    std::optional<::Message::Envelope> const& optEnvelope, std::string_view description)
{
    if (!optEnvelope) {
        m_logger->warn("Failed to create the {} envelope.", description);
        return Parley::ResultCode::SerializationFailed;
    }

    return m_spSession->ScheduleBroadcast(*optEnvelope,
        [wpDispatcher = weak_from_this(), description = std::string{ description }] (Parley::Result const& result) {
            auto const spDispatcher = wpDispatcher.lock();
            if (!spDispatcher || result.IsSuccess()) { return; }
            // Indications sent while alone in the chat are expected to have no recipients.
            if (result == Parley::ResultCode::NoPeersConnected) { return; }
            spDispatcher->m_logger->warn("Failed to send a {}. Reason: {}", description, result.what());
            spDispatcher->PublishError(result);
        });
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::Dispatcher::UpdateStatus(std::string const& id, Status status)
{
    {
        std::scoped_lock lock{ m_outboundMutex };
        auto const itr = m_outbound.find(id);
        if (itr == m_outbound.end()) { return; }
        itr->second.SetStatus(status);
    }

    Publish(UpdateMessage{ .id = id, .patch = { .status = status, .text = {} } });
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::Dispatcher::OnEventProcessed(Event const& event)
{
    if (auto const pTyping = std::get_if<TypingStatus>(&event); pTyping) {
        m_typing.Update(pTyping->peer, pTyping->isTyping);
    } else if (auto const pReceipt = std::get_if<Receipt>(&event); pReceipt) {
        std::scoped_lock lock{ m_outboundMutex };
        if (auto const itr = m_outbound.find(pReceipt->id); itr != m_outbound.end()) {
            itr->second.SetStatus(pReceipt->status);
        }
    } else if (auto const pDelete = std::get_if<DeleteMessage>(&event); pDelete) {
        std::scoped_lock lock{ m_outboundMutex };
        m_outbound.erase(pDelete->id);
    }

    m_logger->trace("Publishing a {} event.", GetEventName(event));
    Publish(event);
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::Dispatcher::Publish(Event const& event)
{
    m_sink->OnEvent(event);
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::Dispatcher::PublishError(Parley::Result const& result)
{
    m_sink->OnError(result);
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::CreateJoinedText(Peer::Identity const& peer)
{
    return peer.GetDisplayName() + " joined the chat";
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::CreateLeftText(Peer::Identity const& peer)
{
    return peer.GetDisplayName() + " left the chat";
}

//----------------------------------------------------------------------------------------------------------------------
