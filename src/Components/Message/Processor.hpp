//----------------------------------------------------------------------------------------------------------------------
// File: Processor.hpp
// Description: The registry of payload handlers keyed by content type. Inbound envelopes are dispatched to the handler
// bound to their content type, outbound messages are offered to the handlers in priority order until one encodes it.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Envelope.hpp"
#include "Components/Chat/Events.hpp"
#include "Components/Chat/Message.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Handler/Handler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Message {
//----------------------------------------------------------------------------------------------------------------------

class Processor;

//----------------------------------------------------------------------------------------------------------------------
} // Message namespace
//----------------------------------------------------------------------------------------------------------------------

class Message::Processor
{
public:
    Processor();

    Processor(Processor const&) = delete;
    Processor& operator=(Processor const&) = delete;

    // Binds the handler to each of its content types. An existing binding for a content type is replaced.
    void Register(Handler::SharedHandler const& spHandler);
    void RegisterHandlers(Handler::Handlers const& handlers);
    void SetFallbackHandler(Handler::SharedHandler const& spHandler);
    bool RemoveHandler(std::string_view contentType);
    void ClearHandlers(); // Note: The fallback handler is cleared as well.

    [[nodiscard]] bool IsSupported(std::string_view contentType) const;
    [[nodiscard]] std::vector<std::string> GetSupportedContentTypes() const;
    [[nodiscard]] std::size_t GetHandlerCount() const;
    [[nodiscard]] bool HasFallbackHandler() const;

    [[nodiscard]] std::optional<Chat::Event> Process(Envelope const& envelope, Parley::Result& result) const;
    [[nodiscard]] std::optional<Envelope> Encode(Chat::Message const& message, Parley::Result& result) const;

private:
    using HandlerMap = std::unordered_map<std::string, Handler::SharedHandler>;

    void RegisterLocked(Handler::SharedHandler const& spHandler);
    void PruneRegistrations();

    [[nodiscard]] std::optional<Envelope> TryEncode(
        Handler::IHandler const& handler, Chat::Message const& message) const;

    mutable std::shared_mutex m_mutex;
    HandlerMap m_handlers;
    Handler::Handlers m_registrations; // Unique handlers in the order they were first registered.
    Handler::SharedHandler m_spFallback;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
