//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Result.hpp"
#include "Components/Message/MessageTypes.hpp"
#include "Components/Peer/ConnectionState.hpp"
#include "Components/Peer/Identity.hpp"
#include "Interfaces/PeerTransport.hpp"
#include "Interfaces/SessionObserver.hpp"
#include "Interfaces/TransportMediator.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Peer::Test {
//----------------------------------------------------------------------------------------------------------------------

class Transport;
class Observer;

Identity const LocalIdentity{ "local-peer", "Local", std::string{ "Test Device" }, std::nullopt };
Identity const Bob{ "bob-peer", "Bob" };
Identity const Carol{ "carol-peer", "Carol" };

//----------------------------------------------------------------------------------------------------------------------
} // Peer::Test namespace
//----------------------------------------------------------------------------------------------------------------------

// Records every request made by the session. Sends succeed unless the transport has been told to fail them.
class Peer::Test::Transport : public IPeerTransport
{
public:
    struct SendRecord
    {
        Message::Buffer buffer;
        PeerIds peerIds;
        TransportMode mode;
    };

    using InviteRecord = std::pair<std::string, std::chrono::milliseconds>;

    Transport()
        : m_mutex()
        , m_pMediator(nullptr)
        , m_optAdvertisedInfo()
        , m_advertisements(0)
        , m_browsing(false)
        , m_invites()
        , m_sends()
        , m_disconnects(0)
        , m_failSends(false)
    {
    }

    // IPeerTransport {
    virtual void SetMediator(ITransportMediator* const mediator) override
    {
        std::scoped_lock lock{ m_mutex };
        m_pMediator = mediator;
    }

    virtual void StartAdvertising(DiscoveryInfo const& info) override
    {
        std::scoped_lock lock{ m_mutex };
        m_optAdvertisedInfo = info;
        ++m_advertisements;
    }

    virtual void StopAdvertising() override
    {
        std::scoped_lock lock{ m_mutex };
        m_optAdvertisedInfo.reset();
    }

    virtual void StartBrowsing() override
    {
        std::scoped_lock lock{ m_mutex };
        m_browsing = true;
    }

    virtual void StopBrowsing() override
    {
        std::scoped_lock lock{ m_mutex };
        m_browsing = false;
    }

    virtual void Invite(std::string const& peerId, std::chrono::milliseconds const& timeout) override
    {
        std::scoped_lock lock{ m_mutex };
        m_invites.emplace_back(peerId, timeout);
    }

    [[nodiscard]] virtual bool Send(
        std::span<std::uint8_t const> buffer, PeerIds const& peerIds, TransportMode mode) override
    {
        std::scoped_lock lock{ m_mutex };
        if (m_failSends) { return false; }
        m_sends.emplace_back(SendRecord{ Message::Buffer{ buffer.begin(), buffer.end() }, peerIds, mode });
        return true;
    }

    virtual void Disconnect() override
    {
        std::scoped_lock lock{ m_mutex };
        ++m_disconnects;
    }
    // } IPeerTransport

    [[nodiscard]] ITransportMediator* GetMediator() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_pMediator;
    }

    [[nodiscard]] std::optional<DiscoveryInfo> GetAdvertisedInfo() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_optAdvertisedInfo;
    }

    [[nodiscard]] std::size_t GetAdvertisementCount() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_advertisements;
    }

    [[nodiscard]] bool IsBrowsing() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_browsing;
    }

    [[nodiscard]] std::vector<InviteRecord> GetInvites() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_invites;
    }

    [[nodiscard]] std::vector<SendRecord> GetSends() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_sends;
    }

    [[nodiscard]] std::size_t GetDisconnectCount() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_disconnects;
    }

    void FailSends(bool fail)
    {
        std::scoped_lock lock{ m_mutex };
        m_failSends = fail;
    }

private:
    mutable std::mutex m_mutex;
    ITransportMediator* m_pMediator;
    std::optional<DiscoveryInfo> m_optAdvertisedInfo;
    std::size_t m_advertisements;
    bool m_browsing;
    std::vector<InviteRecord> m_invites;
    std::vector<SendRecord> m_sends;
    std::size_t m_disconnects;
    bool m_failSends;
};

//----------------------------------------------------------------------------------------------------------------------

class Peer::Test::Observer : public ISessionObserver
{
public:
    using StateChange = std::pair<Identity, ConnectionState>;
    using DataRecord = std::pair<Message::Buffer, Identity>;

    Observer() = default;

    // ISessionObserver {
    virtual void OnDataReceived(std::span<std::uint8_t const> buffer, Identity const& peer) override
    {
        std::scoped_lock lock{ m_mutex };
        m_data.emplace_back(Message::Buffer{ buffer.begin(), buffer.end() }, peer);
    }

    virtual void OnPeerStateChanged(Identity const& peer, ConnectionState state) override
    {
        std::scoped_lock lock{ m_mutex };
        m_changes.emplace_back(peer, state);
    }

    virtual void OnError(Parley::Result const& result) override
    {
        std::scoped_lock lock{ m_mutex };
        m_errors.emplace_back(result);
    }

    virtual void OnPeerDiscovered(Identity const& peer) override
    {
        std::scoped_lock lock{ m_mutex };
        m_discovered.emplace_back(peer);
    }

    virtual void OnPeerLost(Identity const& peer) override
    {
        std::scoped_lock lock{ m_mutex };
        m_lost.emplace_back(peer);
    }
    // } ISessionObserver

    [[nodiscard]] std::vector<DataRecord> GetData() const { std::scoped_lock lock{ m_mutex }; return m_data; }
    [[nodiscard]] std::vector<StateChange> GetChanges() const { std::scoped_lock lock{ m_mutex }; return m_changes; }
    [[nodiscard]] std::vector<Parley::Result> GetErrors() const { std::scoped_lock lock{ m_mutex }; return m_errors; }
    [[nodiscard]] std::vector<Identity> GetDiscovered() const { std::scoped_lock lock{ m_mutex }; return m_discovered; }
    [[nodiscard]] std::vector<Identity> GetLost() const { std::scoped_lock lock{ m_mutex }; return m_lost; }

private:
    mutable std::mutex m_mutex;
    std::vector<DataRecord> m_data;
    std::vector<StateChange> m_changes;
    std::vector<Parley::Result> m_errors;
    std::vector<Identity> m_discovered;
    std::vector<Identity> m_lost;
};

//----------------------------------------------------------------------------------------------------------------------
