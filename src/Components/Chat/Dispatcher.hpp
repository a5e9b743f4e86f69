//----------------------------------------------------------------------------------------------------------------------
// File: Dispatcher.hpp
// Description: Connects a peer session to the message processor. Inbound data is decoded, interpreted, and published
// to the event sink. Outbound messages are encoded and broadcast with their delivery status tracked until the send
// completes.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Events.hpp"
#include "Message.hpp"
#include "TypingMonitor.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Message/Envelope.hpp"
#include "Interfaces/SessionObserver.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

class IEventSink;

namespace Message { class Processor; }
namespace Peer { class Session; }
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Chat {
//----------------------------------------------------------------------------------------------------------------------

class Dispatcher;

//----------------------------------------------------------------------------------------------------------------------
} // Chat namespace
//----------------------------------------------------------------------------------------------------------------------

class Chat::Dispatcher final : public ISessionObserver, public std::enable_shared_from_this<Chat::Dispatcher>
{
public:
    // Note: The sink must outlive the dispatcher. The dispatcher registers itself with the session on construction and
    // unpublishes itself on destruction. Send completions are only tracked when the dispatcher is owned by a shared_ptr.
    Dispatcher(
        std::shared_ptr<Peer::Session> const& spSession,
        std::shared_ptr<::Message::Processor> const& spProcessor,
        IEventSink* const sink,
        std::chrono::milliseconds typingWindow = Defaults::TypingWindow);
    ~Dispatcher();

    Dispatcher(Dispatcher const&) = delete;
    Dispatcher& operator=(Dispatcher const&) = delete;

    // Publishes the message locally and broadcasts it. The identifier is returned whenever the message has been
    // accepted, the result reports whether the broadcast could be scheduled.
    [[nodiscard]] std::optional<std::string> SendMessage(
        std::string_view text, Attachments const& attachments, Parley::Result& result);
    Parley::Result RetryMessage(std::string_view id);

    Parley::Result SendReaction(std::string_view messageId, std::string_view emoji, ReactionAction action);
    Parley::Result SendTypingIndicator(bool isTyping, std::optional<std::string> const& optPreview = {});
    Parley::Result SendReceipt(std::string_view messageId, Status status);
    Parley::Result SendEdit(std::string_view messageId, std::string_view text);
    Parley::Result SendDelete(std::string_view messageId);

    [[nodiscard]] std::optional<Status> GetMessageStatus(std::string_view id) const;
    [[nodiscard]] TypingMonitor const& GetTypingMonitor() const;

    // ISessionObserver {
    virtual void OnDataReceived(std::span<std::uint8_t const> buffer, Peer::Identity const& peer) override;
    virtual void OnPeerStateChanged(Peer::Identity const& peer, Peer::ConnectionState state) override;
    virtual void OnError(Parley::Result const& result) override;
    virtual void OnPeerDiscovered(Peer::Identity const& peer) override;
    virtual void OnPeerLost(Peer::Identity const& peer) override;
    // } ISessionObserver

private:
    using OutboundMap = std::unordered_map<std::string, Message>;

    [[nodiscard]] Parley::Result Transmit(Message const& message);
    [[nodiscard]] Parley::Result Broadcast(
        std::optional<::Message::Envelope> const& optEnvelope, std::string_view description);

    void UpdateStatus(std::string const& id, Status status);
    void OnEventProcessed(Event const& event);
    void Publish(Event const& event);
    void PublishError(Parley::Result const& result);

    std::shared_ptr<Peer::Session> const m_spSession;
    std::shared_ptr<::Message::Processor> const m_spProcessor;
    IEventSink* const m_sink;

    mutable std::mutex m_outboundMutex;
    OutboundMap m_outbound;

    TypingMonitor m_typing;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
