//----------------------------------------------------------------------------------------------------------------------
// File: Session.hpp
// Description: The peer session mediates between the point to point transport and the rest of the library. It tracks
// the discovered and connected peers, selects the transport mode for outbound envelopes, and publishes the transport's
// activity to the registered session observers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "ConnectionState.hpp"
#include "Identity.hpp"
#include "SessionOptions.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Message/Envelope.hpp"
#include "Components/Scheduler/Worker.hpp"
#include "Interfaces/PeerTransport.hpp"
#include "Interfaces/TransportMediator.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index/tag.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class ISessionObserver;

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Peer {
//----------------------------------------------------------------------------------------------------------------------

class Session;

using Identities = std::vector<Identity>;

//----------------------------------------------------------------------------------------------------------------------
} // Peer namespace
//----------------------------------------------------------------------------------------------------------------------

class Peer::Session final : public ITransportMediator
{
public:
    using InvitationPolicy = std::function<bool(Identity const&)>;
    using OnSendComplete = std::function<void(Parley::Result const&)>;

    Session(
        Identity const& identity,
        std::shared_ptr<IPeerTransport> const& spTransport,
        SessionOptions const& options = {});
    ~Session();

    Session(Session const&) = delete;
    Session& operator=(Session const&) = delete;

    // Note: Observers may call back into the session from within a notification. An observer unpublished during a
    // notification is not notified for the remainder of it, and unpublishing from another thread waits for the
    // notification in progress to complete.
    void RegisterObserver(ISessionObserver* const observer);
    void UnpublishObserver(ISessionObserver* const observer);

    // Replaces the invitation policy. Providing an empty policy restores the configured auto accept behavior.
    void SetInvitationPolicy(InvitationPolicy const& policy);

    [[nodiscard]] Identity const& GetLocalIdentity() const;
    [[nodiscard]] SessionOptions const& GetOptions() const;

    Parley::Result StartAdvertising();
    void StopAdvertising();
    Parley::Result StartBrowsing();
    void StopBrowsing();
    [[nodiscard]] bool IsAdvertising() const;
    [[nodiscard]] bool IsBrowsing() const;

    Parley::Result Invite(std::string_view peerId);

    Parley::Result Send(Message::Envelope const& envelope, PeerIds const& peerIds);
    Parley::Result Broadcast(Message::Envelope const& envelope);

    // Performs the send on the session's worker. The returned result indicates whether the send was scheduled, the
    // outcome of the send itself is provided to the callback on the worker's thread.
    Parley::Result ScheduleSend(Message::Envelope const& envelope, PeerIds const& peerIds, OnSendComplete callback);
    Parley::Result ScheduleBroadcast(Message::Envelope const& envelope, OnSendComplete callback);

    void Disconnect();
    void Shutdown();

    [[nodiscard]] Identities GetConnectedPeers() const;
    [[nodiscard]] Identities GetDiscoveredPeers() const;
    [[nodiscard]] ConnectionState GetPeerState(std::string_view peerId) const;
    [[nodiscard]] std::optional<Identity> GetPeerIdentity(std::string_view peerId) const;

    [[nodiscard]] static TransportMode SelectTransportMode(std::size_t size, std::size_t threshold);
    [[nodiscard]] static DiscoveryInfo GetDiscoveryInfo();

    // ITransportMediator {
    virtual void OnPeerFound(Identity const& identity, DiscoveryInfo const& info) override;
    virtual void OnPeerLost(std::string const& peerId) override;
    [[nodiscard]] virtual bool OnInvitation(Identity const& identity) override;
    virtual void OnPeerStateChanged(std::string const& peerId, ConnectionState state) override;
    virtual void OnDataReceived(std::span<std::uint8_t const> buffer, std::string const& peerId) override;
    virtual void OnTransportError(std::string_view description) override;
    // } ITransportMediator

private:
    struct PeerRecord
    {
        std::string peerId;
        Identity identity;
        ConnectionState state;
        bool discoverable; // Set while the transport reports the peer as reachable through browsing.

        [[nodiscard]] bool IsConnected() const { return state == ConnectionState::Connected; }
        [[nodiscard]] bool IsDiscovered() const { return !IsConnected() && discoverable; }
    };

    struct IdentifierIndex {};
    struct SequenceIndex {};

    using PeerTrackingMap = boost::multi_index_container<
        PeerRecord,
        boost::multi_index::indexed_by<
            boost::multi_index::hashed_unique<
                boost::multi_index::tag<IdentifierIndex>,
                boost::multi_index::member<PeerRecord, std::string, &PeerRecord::peerId>>,
            boost::multi_index::sequenced<boost::multi_index::tag<SequenceIndex>>>>;

    using ObserverSet = std::set<ISessionObserver*>;

    [[nodiscard]] Parley::Result Dispatch(Message::Envelope const& envelope, PeerIds const& peerIds);
    [[nodiscard]] Identity GetOrCreateIdentity(std::string const& peerId) const;

    template<typename FunctionType, typename...Args>
    void NotifyObservers(FunctionType const& function, Args&&...args);

    Identity const m_identity;
    SessionOptions const m_options;
    std::shared_ptr<IPeerTransport> const m_spTransport;

    mutable std::mutex m_policyMutex;
    InvitationPolicy m_policy;

    std::atomic_bool m_advertising;
    std::atomic_bool m_browsing;
    std::atomic_bool m_active;

    mutable std::recursive_mutex m_observersMutex;
    ObserverSet m_observers;

    mutable std::shared_mutex m_peersMutex;
    PeerTrackingMap m_peers;

    Scheduler::Worker m_worker;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
