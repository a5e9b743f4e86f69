//----------------------------------------------------------------------------------------------------------------------
// File: TypingMonitor.hpp
// Description: Tracks which peers are currently typing. A typing indication opens a window for the peer, the window is
// replaced by every subsequent indication and the peer is reported as idle once it lapses.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Peer/Identity.hpp"
#include "Components/Scheduler/Worker.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/steady_timer.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Chat {
//----------------------------------------------------------------------------------------------------------------------

class TypingMonitor;

namespace Defaults {

constexpr std::chrono::milliseconds TypingWindow = std::chrono::seconds{ 5 };

} // Defaults namespace

//----------------------------------------------------------------------------------------------------------------------
} // Chat namespace
//----------------------------------------------------------------------------------------------------------------------

class Chat::TypingMonitor
{
public:
    // Invoked from the monitor's worker when a peer's typing window lapses.
    using OnExpired = std::function<void(Peer::Identity const&)>;

    explicit TypingMonitor(std::chrono::milliseconds window = Defaults::TypingWindow);
    ~TypingMonitor();

    TypingMonitor(TypingMonitor const&) = delete;
    TypingMonitor& operator=(TypingMonitor const&) = delete;

    void SetExpirationHandler(OnExpired const& handler);

    // Returns whether the peer's typing state changed as a result of the update.
    bool Update(Peer::Identity const& peer, bool isTyping);
    bool Clear(std::string_view peerId);
    void Reset();

    [[nodiscard]] std::chrono::milliseconds GetWindow() const;
    [[nodiscard]] bool IsTyping(std::string_view peerId) const;
    [[nodiscard]] std::vector<Peer::Identity> GetTypingPeers() const;

private:
    using Generation = std::uint64_t;

    struct Window
    {
        Peer::Identity peer;
        Generation generation;
        std::unique_ptr<boost::asio::steady_timer> upTimer;
    };

    using WindowMap = std::unordered_map<std::string, Window>;

    void OnWindowElapsed(std::string const& peerId, Generation generation);

    std::chrono::milliseconds const m_window;

    mutable std::mutex m_mutex;
    WindowMap m_windows;
    Generation m_generation;
    OnExpired m_handler;

    Scheduler::Worker m_worker;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
