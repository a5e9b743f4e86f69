//----------------------------------------------------------------------------------------------------------------------
// File: Handler.hpp
// Description: Defines the payload handler interface. A handler translates between wire envelopes of the content types
// it claims and application level chat events and messages.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chat/Events.hpp"
#include "Components/Chat/Message.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Message/Envelope.hpp"
#include "Components/Peer/Identity.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Handler {
//----------------------------------------------------------------------------------------------------------------------

class IHandler;

class Text;
class Image;
class Reaction;
class Typing;
class Multipart;
class Control;
class Generic;

// The class a handler belongs to when the processor selects an encoder for an outbound message.
enum class Priority : std::uint32_t { Composite, Specific, Fallback };

using ContentTypes = std::vector<std::string>;
using OptionalEvent = std::optional<Chat::Event>;
using OptionalEnvelope = std::optional<Message::Envelope>;

using SharedHandler = std::shared_ptr<IHandler>;
using Handlers = std::vector<SharedHandler>;

// Creates one instance of every built-in handler except the generic fallback.
[[nodiscard]] Handlers CreateDefaultHandlers(Peer::Identity const& identity);

//----------------------------------------------------------------------------------------------------------------------
} // Handler namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Handlers are stateless with respect to the envelopes they process, such that a single instance may be
// shared across concurrent inbound and outbound operations.
//----------------------------------------------------------------------------------------------------------------------
class Handler::IHandler
{
public:
    IHandler(Priority priority, Peer::Identity const& identity);
    virtual ~IHandler() = default;

    [[nodiscard]] virtual ContentTypes const& GetContentTypes() const = 0;

    // Interprets an envelope. On failure no event is returned and the result describes the failure.
    [[nodiscard]] virtual OptionalEvent Handle(Message::Envelope const& envelope, Parley::Result& result) const = 0;

    // Returns no envelope when the handler does not apply to the message. This is not an error.
    [[nodiscard]] virtual OptionalEnvelope Encode(Chat::Message const& message) const = 0;

    [[nodiscard]] virtual Priority GetPriority() const final;
    [[nodiscard]] virtual Peer::Identity const& GetLocalIdentity() const final;

protected:
    [[nodiscard]] bool IsLocal(Peer::Identity const& sender) const;
    [[nodiscard]] Chat::Origin GetOrigin(Peer::Identity const& sender) const;

    // Creates the message for an inbound envelope. Messages from the local peer are reported as sent and messages
    // from remote peers as delivered.
    [[nodiscard]] Chat::Message CreateInboundMessage(Message::Envelope const& envelope) const;

    [[nodiscard]] Message::EnvelopeBuilder CreateOutboundBuilder(Chat::Message const& message) const;

    Priority const m_priority;
    Peer::Identity const m_identity;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
