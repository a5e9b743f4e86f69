//----------------------------------------------------------------------------------------------------------------------
// File: Session.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Session.hpp"
#include "Interfaces/SessionObserver.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/config.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "version";
constexpr std::string_view Platform = "platform";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
//----------------------------------------------------------------------------------------------------------------------
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view DiscoveryVersion = "1.0";

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Peer::Session::Session(
    Identity const& identity, std::shared_ptr<IPeerTransport> const& spTransport, SessionOptions const& options)
    : m_identity(identity)
    , m_options(options)
    , m_spTransport(spTransport)
    , m_policyMutex()
    , m_policy()
    , m_advertising(false)
    , m_browsing(false)
    , m_active(true)
    , m_observersMutex()
    , m_observers()
    , m_peersMutex()
    , m_peers()
    , m_worker("session")
    , m_logger(spdlog::get(Logger::Name::Transport.data()))
{
    assert(m_logger);
    if (m_spTransport) {
        m_spTransport->SetMediator(this);
    } else {
        m_logger->warn("The session for {} has been created without a transport.", m_identity.GetPeerId());
    }
}

//----------------------------------------------------------------------------------------------------------------------

Peer::Session::~Session()
{
    Shutdown();
    if (m_spTransport) { m_spTransport->SetMediator(nullptr); }
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::RegisterObserver(ISessionObserver* const observer)
{
    std::scoped_lock lock{ m_observersMutex };
    m_observers.emplace(observer);
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::UnpublishObserver(ISessionObserver* const observer)
{
    std::scoped_lock lock{ m_observersMutex };
    m_observers.erase(observer);
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::SetInvitationPolicy(InvitationPolicy const& policy)
{
    std::scoped_lock lock{ m_policyMutex };
    m_policy = policy;
}

//----------------------------------------------------------------------------------------------------------------------

Peer::Identity const& Peer::Session::GetLocalIdentity() const { return m_identity; }

//----------------------------------------------------------------------------------------------------------------------

Peer::SessionOptions const& Peer::Session::GetOptions() const { return m_options; }

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Peer::Session::StartAdvertising()
{
    if (!m_spTransport || !m_active) { return Parley::ResultCode::SessionNotInitialized; }
    if (m_advertising.exchange(true)) {
        m_logger->debug("The session is already advertising.");
        return Parley::ResultCode::Success;
    }

    m_logger->info("Advertising {} on the {} service.", m_identity.GetDisplayName(), m_options.serviceType);
    m_spTransport->StartAdvertising(GetDiscoveryInfo());
    return Parley::ResultCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::StopAdvertising()
{
    if (!m_spTransport || !m_advertising.exchange(false)) { return; }
    m_spTransport->StopAdvertising();
    m_logger->info("Stopped advertising on the {} service.", m_options.serviceType);
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Peer::Session::StartBrowsing()
{
    if (!m_spTransport || !m_active) { return Parley::ResultCode::SessionNotInitialized; }
    if (m_browsing.exchange(true)) {
        m_logger->debug("The session is already browsing.");
        return Parley::ResultCode::Success;
    }

    m_logger->info("Browsing for peers on the {} service.", m_options.serviceType);
    m_spTransport->StartBrowsing();
    return Parley::ResultCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::StopBrowsing()
{
    if (!m_spTransport || !m_browsing.exchange(false)) { return; }
    m_spTransport->StopBrowsing();
    m_logger->info("Stopped browsing on the {} service.", m_options.serviceType);
}

//----------------------------------------------------------------------------------------------------------------------

bool Peer::Session::IsAdvertising() const { return m_advertising; }

//----------------------------------------------------------------------------------------------------------------------

bool Peer::Session::IsBrowsing() const { return m_browsing; }

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Peer::Session::Invite(std::string_view peerId)
{
    if (!m_spTransport || !m_active) { return Parley::ResultCode::SessionNotInitialized; }

    std::string identifier{ peerId };
    {
        std::shared_lock lock{ m_peersMutex };
        auto const& index = m_peers.get<IdentifierIndex>();
        if (auto const itr = index.find(identifier); itr == index.end() || !itr->IsDiscovered()) {
            m_logger->warn("Unable to invite {}. The peer has not been discovered.", peerId);
            return Parley::ResultCode::PeerNotFound;
        }
    }

    m_logger->debug("Inviting {} to the session.", peerId);
    m_spTransport->Invite(identifier, m_options.inviteTimeout);
    return Parley::ResultCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Peer::Session::Send(Message::Envelope const& envelope, PeerIds const& peerIds)
{
    if (!m_spTransport || !m_active) { return Parley::ResultCode::SessionNotInitialized; }
    if (peerIds.empty()) { return Parley::ResultCode::InvalidArgument; }

    {
        std::shared_lock lock{ m_peersMutex };
        auto const& index = m_peers.get<IdentifierIndex>();
        for (auto const& peerId : peerIds) {
            if (auto const itr = index.find(peerId); itr == index.end() || !itr->IsConnected()) {
                m_logger->warn("Unable to send envelope {}. {} is not connected.", envelope.GetId(), peerId);
                return Parley::ResultCode::PeerNotFound;
            }
        }
    }

    return Dispatch(envelope, peerIds);
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Peer::Session::Broadcast(Message::Envelope const& envelope)
{
    if (!m_spTransport || !m_active) { return Parley::ResultCode::SessionNotInitialized; }

    PeerIds peerIds;
    {
        std::shared_lock lock{ m_peersMutex };
        for (auto const& record : m_peers.get<SequenceIndex>()) {
            if (record.IsConnected()) { peerIds.emplace_back(record.peerId); }
        }
    }

    if (peerIds.empty()) {
        m_logger->debug("Unable to broadcast envelope {}. There are no connected peers.", envelope.GetId());
        return Parley::ResultCode::NoPeersConnected;
    }

    return Dispatch(envelope, peerIds);
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Peer::Session::ScheduleSend(
    Message::Envelope const& envelope, PeerIds const& peerIds, OnSendComplete callback)
{
    if (!m_spTransport || !m_active) { return Parley::ResultCode::SessionNotInitialized; }

    bool const scheduled = m_worker.Post([this, envelope, peerIds, callback = std::move(callback)] () {
        auto const result = Send(envelope, peerIds);
        if (callback) { callback(result); }
    });

    return scheduled ? Parley::ResultCode::Success : Parley::ResultCode::SessionNotInitialized;
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Peer::Session::ScheduleBroadcast(Message::Envelope const& envelope, OnSendComplete callback)
{
    if (!m_spTransport || !m_active) { return Parley::ResultCode::SessionNotInitialized; }

    bool const scheduled = m_worker.Post([this, envelope, callback = std::move(callback)] () {
        auto const result = Broadcast(envelope);
        if (callback) { callback(result); }
    });

    return scheduled ? Parley::ResultCode::Success : Parley::ResultCode::SessionNotInitialized;
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::Disconnect()
{
    if (m_spTransport) { m_spTransport->Disconnect(); }

    Identities disconnected;
    {
        std::scoped_lock lock{ m_peersMutex };
        for (auto const& record : m_peers.get<SequenceIndex>()) {
            if (record.IsConnected()) { disconnected.emplace_back(record.identity); }
        }
        m_peers.clear();
    }

    for (auto const& identity : disconnected) {
        NotifyObservers(&ISessionObserver::OnPeerStateChanged, identity, ConnectionState::Disconnected);
    }

    m_logger->info("Disconnected from {} peer(s).", disconnected.size());
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::Shutdown()
{
    if (!m_active.exchange(false)) { return; }
    StopAdvertising();
    StopBrowsing();
    Disconnect();
    m_worker.Stop();
}

//----------------------------------------------------------------------------------------------------------------------

Peer::Identities Peer::Session::GetConnectedPeers() const
{
    Identities identities;
    std::shared_lock lock{ m_peersMutex };
    for (auto const& record : m_peers.get<SequenceIndex>()) {
        if (record.IsConnected()) { identities.emplace_back(record.identity); }
    }
    return identities;
}

//----------------------------------------------------------------------------------------------------------------------

Peer::Identities Peer::Session::GetDiscoveredPeers() const
{
    Identities identities;
    std::shared_lock lock{ m_peersMutex };
    for (auto const& record : m_peers.get<SequenceIndex>()) {
        if (record.IsDiscovered()) { identities.emplace_back(record.identity); }
    }
    return identities;
}

//----------------------------------------------------------------------------------------------------------------------

Peer::ConnectionState Peer::Session::GetPeerState(std::string_view peerId) const
{
    std::shared_lock lock{ m_peersMutex };
    auto const& index = m_peers.get<IdentifierIndex>();
    if (auto const itr = index.find(std::string{ peerId }); itr != index.end()) { return itr->state; }
    return ConnectionState::NotConnected;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Peer::Identity> Peer::Session::GetPeerIdentity(std::string_view peerId) const
{
    std::shared_lock lock{ m_peersMutex };
    auto const& index = m_peers.get<IdentifierIndex>();
    if (auto const itr = index.find(std::string{ peerId }); itr != index.end()) { return itr->identity; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Peer::TransportMode Peer::Session::SelectTransportMode(std::size_t size, std::size_t threshold)
{
    return (size <= threshold) ? TransportMode::Reliable : TransportMode::Unreliable;
}

//----------------------------------------------------------------------------------------------------------------------

Peer::DiscoveryInfo Peer::Session::GetDiscoveryInfo()
{
    return {
        { std::string{ symbols::Version }, std::string{ local::DiscoveryVersion } },
        { std::string{ symbols::Platform }, BOOST_PLATFORM }
    };
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::OnPeerFound(Identity const& identity, DiscoveryInfo const& info)
{
    bool discovered = false;
    {
        std::scoped_lock lock{ m_peersMutex };
        auto& index = m_peers.get<IdentifierIndex>();
        if (auto const itr = index.find(identity.GetPeerId()); itr != index.end()) {
            discovered = !itr->IsConnected();
            index.modify(itr, [&identity] (PeerRecord& record) {
                if (!record.IsConnected()) { record.identity = identity; }
                record.discoverable = true;
            });
        } else {
            m_peers.get<SequenceIndex>().push_back(PeerRecord{
                .peerId = identity.GetPeerId(),
                .identity = identity,
                .state = ConnectionState::NotConnected,
                .discoverable = true });
            discovered = true;
        }
    }

    if (!discovered) {
        m_logger->debug("Ignoring the discovery of {}. The peer is already connected.", identity.GetPeerId());
        return;
    }

    if (auto const itr = info.find(std::string{ symbols::Platform }); itr != info.end()) {
        m_logger->info("Discovered {} ({}) on {}.", identity.GetDisplayName(), identity.GetPeerId(), itr->second);
    } else {
        m_logger->info("Discovered {} ({}).", identity.GetDisplayName(), identity.GetPeerId());
    }

    NotifyObservers(&ISessionObserver::OnPeerDiscovered, identity);
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::OnPeerLost(std::string const& peerId)
{
    std::optional<Identity> optLost;
    {
        std::scoped_lock lock{ m_peersMutex };
        auto& index = m_peers.get<IdentifierIndex>();
        auto const itr = index.find(peerId);
        if (itr == index.end() || !itr->discoverable) { return; }

        optLost = itr->identity;
        if (itr->IsConnected()) {
            index.modify(itr, [] (PeerRecord& record) { record.discoverable = false; });
        } else {
            index.erase(itr);
        }
    }

    m_logger->info("Lost sight of {}.", peerId);
    NotifyObservers(&ISessionObserver::OnPeerLost, *optLost);
}

//----------------------------------------------------------------------------------------------------------------------

bool Peer::Session::OnInvitation(Identity const& identity)
{
    bool accepted = m_options.autoAccept;
    {
        std::scoped_lock lock{ m_policyMutex };
        if (m_policy) { accepted = m_policy(identity); }
    }

    if (accepted && m_active) {
        std::scoped_lock lock{ m_peersMutex };
        auto& index = m_peers.get<IdentifierIndex>();
        if (auto const itr = index.find(identity.GetPeerId()); itr == index.end()) {
            m_peers.get<SequenceIndex>().push_back(PeerRecord{
                .peerId = identity.GetPeerId(),
                .identity = identity,
                .state = ConnectionState::NotConnected,
                .discoverable = false });
        }
    }

    m_logger->info("{} the invitation from {} ({}).",
        accepted ? "Accepted" : "Declined", identity.GetDisplayName(), identity.GetPeerId());

    return accepted && m_active;
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::OnPeerStateChanged(std::string const& peerId, ConnectionState state)
{
    std::optional<Identity> optChanged;
    {
        std::scoped_lock lock{ m_peersMutex };
        auto& index = m_peers.get<IdentifierIndex>();
        auto itr = index.find(peerId);
        if (itr == index.end()) {
            // An unknown peer reporting a disconnected state has no transition to report.
            if (state == ConnectionState::NotConnected || state == ConnectionState::Disconnected) { return; }
            auto const inserted = m_peers.get<SequenceIndex>().push_back(PeerRecord{
                .peerId = peerId,
                .identity = Identity{ peerId, peerId },
                .state = ConnectionState::NotConnected,
                .discoverable = false });
            assert(inserted.second);
            itr = m_peers.project<IdentifierIndex>(inserted.first);
        }

        if (itr->state == state) { return; }
        optChanged = itr->identity;

        bool const isDisconnected = state == ConnectionState::NotConnected || state == ConnectionState::Disconnected;
        if (isDisconnected && !itr->discoverable) {
            index.erase(itr);
        } else {
            index.modify(itr, [state] (PeerRecord& record) { record.state = state; });
        }
    }

    m_logger->info("{} ({}) is now {}.", optChanged->GetDisplayName(), peerId, ToString(state));
    NotifyObservers(&ISessionObserver::OnPeerStateChanged, *optChanged, state);
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::OnDataReceived(std::span<std::uint8_t const> buffer, std::string const& peerId)
{
    auto const identity = GetOrCreateIdentity(peerId);
    m_logger->trace("Received {} bytes from {}.", buffer.size(), peerId);
    NotifyObservers(&ISessionObserver::OnDataReceived, buffer, identity);
}

//----------------------------------------------------------------------------------------------------------------------

void Peer::Session::OnTransportError(std::string_view description)
{
    m_logger->error("The transport encountered an error: {}", description);
    NotifyObservers(&ISessionObserver::OnError, Parley::Result{ Parley::ResultCode::TransportError });
}

//----------------------------------------------------------------------------------------------------------------------

Parley::Result Peer::Session::Dispatch(Message::Envelope const& envelope, PeerIds const& peerIds)
{
    auto const pack = envelope.GetPack();
    auto const mode = SelectTransportMode(pack.size(), m_options.reliableThreshold);

    m_logger->trace("Sending envelope {} ({} bytes) to {} peer(s) using the {} mode.",
        envelope.GetId(), pack.size(), peerIds.size(), ToString(mode));

    if (!m_spTransport->Send(pack, peerIds, mode)) {
        m_logger->warn("The transport failed to send envelope {}.", envelope.GetId());
        return Parley::ResultCode::SendFailed;
    }

    return Parley::ResultCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

Peer::Identity Peer::Session::GetOrCreateIdentity(std::string const& peerId) const
{
    std::shared_lock lock{ m_peersMutex };
    auto const& index = m_peers.get<IdentifierIndex>();
    if (auto const itr = index.find(peerId); itr != index.end()) { return itr->identity; }
    return Identity{ peerId, peerId };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename FunctionType, typename...Args>
void Peer::Session::NotifyObservers(FunctionType const& function, Args&&...args)
{
    std::scoped_lock lock{ m_observersMutex };
    ObserverSet const observers = m_observers; // An observer may modify the set from within the notification.
    for (auto const observer : observers) {
        if (!observer || !m_observers.contains(observer)) { continue; }
        std::invoke(function, observer, args...);
    }
}

//----------------------------------------------------------------------------------------------------------------------
