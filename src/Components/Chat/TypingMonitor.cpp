//----------------------------------------------------------------------------------------------------------------------
// File: TypingMonitor.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "TypingMonitor.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <optional>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Chat::TypingMonitor::TypingMonitor(std::chrono::milliseconds window)
    : m_window(window)
    , m_mutex()
    , m_windows()
    , m_generation(0)
    , m_handler()
    , m_worker("typing")
    , m_logger(spdlog::get(Logger::Name::Core.data()))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Chat::TypingMonitor::~TypingMonitor()
{
    Reset();
    m_worker.Stop();
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::TypingMonitor::SetExpirationHandler(OnExpired const& handler)
{
    std::scoped_lock lock{ m_mutex };
    m_handler = handler;
}

//----------------------------------------------------------------------------------------------------------------------

bool Chat::TypingMonitor::Update(Peer::Identity const& peer, bool isTyping)
{
    if (!isTyping) { return Clear(peer.GetPeerId()); }

    std::scoped_lock lock{ m_mutex };
    auto const generation = ++m_generation;
    auto [itr, emplaced] = m_windows.try_emplace(peer.GetPeerId(), Window{ peer, generation, nullptr });
    auto& window = itr->second;
    if (!emplaced) {
        // Cancelling the previous timer is not sufficient on its own, the completion may already be queued. The
        // generation is used to discard a stale completion.
        window.peer = peer;
        window.generation = generation;
        window.upTimer->cancel();
    } else {
        window.upTimer = std::make_unique<boost::asio::steady_timer>(m_worker.GetContext());
    }

    window.upTimer->expires_after(m_window);
    window.upTimer->async_wait([this, peerId = peer.GetPeerId(), generation] (boost::system::error_code const& error) {
        if (error == boost::asio::error::operation_aborted) { return; }
        OnWindowElapsed(peerId, generation);
    });

    return emplaced;
}

//----------------------------------------------------------------------------------------------------------------------

bool Chat::TypingMonitor::Clear(std::string_view peerId)
{
    std::scoped_lock lock{ m_mutex };
    return m_windows.erase(std::string{ peerId }) != 0; // Destroying the timer cancels the pending wait.
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::TypingMonitor::Reset()
{
    std::scoped_lock lock{ m_mutex };
    m_windows.clear();
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Chat::TypingMonitor::GetWindow() const { return m_window; }

//----------------------------------------------------------------------------------------------------------------------

bool Chat::TypingMonitor::IsTyping(std::string_view peerId) const
{
    std::scoped_lock lock{ m_mutex };
    return m_windows.contains(std::string{ peerId });
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Peer::Identity> Chat::TypingMonitor::GetTypingPeers() const
{
    std::vector<Peer::Identity> peers;
    std::scoped_lock lock{ m_mutex };
    peers.reserve(m_windows.size());
    for (auto const& [peerId, window] : m_windows) { peers.emplace_back(window.peer); }
    return peers;
}

//----------------------------------------------------------------------------------------------------------------------

void Chat::TypingMonitor::OnWindowElapsed(std::string const& peerId, Generation generation)
{
    std::optional<Peer::Identity> optExpired;
    OnExpired handler;
    {
        std::scoped_lock lock{ m_mutex };
        auto const itr = m_windows.find(peerId);
        if (itr == m_windows.end() || itr->second.generation != generation) { return; }
        optExpired = std::move(itr->second.peer);
        m_windows.erase(itr);
        handler = m_handler;
    }

    m_logger->debug("The typing window for {} has elapsed.", peerId);
    if (handler) { handler(*optExpired); }
}

//----------------------------------------------------------------------------------------------------------------------
