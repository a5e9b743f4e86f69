//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chat/Events.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Peer/ConnectionState.hpp"
#include "Components/Peer/Identity.hpp"
#include "Interfaces/EventSink.hpp"
#include "Interfaces/PeerTransport.hpp"
#include "Interfaces/TransportMediator.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Chat::Test {
//----------------------------------------------------------------------------------------------------------------------

class Transport;
class EventSink;

Peer::Identity const Alice{ "alice-peer", "Alice" };
Peer::Identity const Bob{ "bob-peer", "Bob" };

constexpr auto EventTimeout = std::chrono::seconds{ 2 };

//----------------------------------------------------------------------------------------------------------------------
} // Chat::Test namespace
//----------------------------------------------------------------------------------------------------------------------

// Delivers sends directly to the mediator of the linked transport, as if the remote peer received them.
class Chat::Test::Transport : public IPeerTransport
{
public:
    explicit Transport(std::string const& peerId)
        : m_peerId(peerId)
        , m_mutex()
        , m_pMediator(nullptr)
        , m_pRemote(nullptr)
        , m_sends(0)
    {
    }

    void Link(Transport* const remote)
    {
        std::scoped_lock lock{ m_mutex };
        m_pRemote = remote;
    }

    // IPeerTransport {
    virtual void SetMediator(ITransportMediator* const mediator) override
    {
        std::scoped_lock lock{ m_mutex };
        m_pMediator = mediator;
    }

    virtual void StartAdvertising(Peer::DiscoveryInfo const&) override {}
    virtual void StopAdvertising() override {}
    virtual void StartBrowsing() override {}
    virtual void StopBrowsing() override {}
    virtual void Invite(std::string const&, std::chrono::milliseconds const&) override {}

    [[nodiscard]] virtual bool Send(
        std::span<std::uint8_t const> buffer, Peer::PeerIds const&, Peer::TransportMode) override
    {
        Transport* remote = nullptr;
        {
            std::scoped_lock lock{ m_mutex };
            ++m_sends;
            remote = m_pRemote;
        }

        if (!remote) { return false; }
        remote->Deliver(buffer, m_peerId);
        return true;
    }

    virtual void Disconnect() override {}
    // } IPeerTransport

    [[nodiscard]] std::size_t GetSendCount() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_sends;
    }

private:
    void Deliver(std::span<std::uint8_t const> buffer, std::string const& source)
    {
        ITransportMediator* mediator = nullptr;
        {
            std::scoped_lock lock{ m_mutex };
            mediator = m_pMediator;
        }
        if (mediator) { mediator->OnDataReceived(buffer, source); }
    }

    std::string const m_peerId;
    mutable std::mutex m_mutex;
    ITransportMediator* m_pMediator;
    Transport* m_pRemote;
    std::size_t m_sends;
};

//----------------------------------------------------------------------------------------------------------------------

class Chat::Test::EventSink : public IEventSink
{
public:
    EventSink() = default;

    // IEventSink {
    virtual void OnEvent(Chat::Event const& event) override
    {
        {
            std::scoped_lock lock{ m_mutex };
            m_events.emplace_back(event);
        }
        m_condition.notify_all();
    }

    virtual void OnError(Parley::Result const& result) override
    {
        {
            std::scoped_lock lock{ m_mutex };
            m_errors.emplace_back(result);
        }
        m_condition.notify_all();
    }
    // } IEventSink

    // Waits for a published event of the given type that satisfies the predicate. Events that have already been
    // published are considered.
    template<typename EventType>
    [[nodiscard]] std::optional<EventType> WaitFor(
        std::function<bool(EventType const&)> const& predicate = [] (EventType const&) { return true; })
    {
        std::optional<EventType> optFound;
        std::unique_lock lock{ m_mutex };
        m_condition.wait_for(lock, EventTimeout, [&] () {
            for (auto const& event : m_events) {
                if (auto const pEvent = std::get_if<EventType>(&event); pEvent && predicate(*pEvent)) {
                    optFound = *pEvent;
                    return true;
                }
            }
            return false;
        });
        return optFound;
    }

    [[nodiscard]] std::optional<Parley::Result> WaitForError()
    {
        std::unique_lock lock{ m_mutex };
        if (!m_condition.wait_for(lock, EventTimeout, [this] () { return !m_errors.empty(); })) { return {}; }
        return m_errors.front();
    }

    template<typename EventType>
    [[nodiscard]] std::size_t Count() const
    {
        std::scoped_lock lock{ m_mutex };
        std::size_t count = 0;
        for (auto const& event : m_events) { count += std::holds_alternative<EventType>(event) ? 1 : 0; }
        return count;
    }

    [[nodiscard]] std::vector<Chat::Event> GetEvents() const { std::scoped_lock lock{ m_mutex }; return m_events; }
    [[nodiscard]] std::vector<Parley::Result> GetErrors() const { std::scoped_lock lock{ m_mutex }; return m_errors; }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::vector<Chat::Event> m_events;
    std::vector<Parley::Result> m_errors;
};

//----------------------------------------------------------------------------------------------------------------------
