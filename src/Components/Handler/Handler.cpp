//----------------------------------------------------------------------------------------------------------------------
// File: Handler.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Handler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Control.hpp"
#include "Image.hpp"
#include "Multipart.hpp"
#include "Reaction.hpp"
#include "Text.hpp"
#include "Typing.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Handler::Handlers Handler::CreateDefaultHandlers(Peer::Identity const& identity)
{
    return {
        std::make_shared<Text>(identity),
        std::make_shared<Image>(identity),
        std::make_shared<Reaction>(identity),
        std::make_shared<Typing>(identity),
        std::make_shared<Multipart>(identity),
        std::make_shared<Control>(identity)
    };
}

//----------------------------------------------------------------------------------------------------------------------
// IHandler implementation
//----------------------------------------------------------------------------------------------------------------------

Handler::IHandler::IHandler(Priority priority, Peer::Identity const& identity)
    : m_priority(priority)
    , m_identity(identity)
    , m_logger(spdlog::get(Logger::Name::Core.data()))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Handler::Priority Handler::IHandler::GetPriority() const { return m_priority; }

//----------------------------------------------------------------------------------------------------------------------

Peer::Identity const& Handler::IHandler::GetLocalIdentity() const { return m_identity; }

//----------------------------------------------------------------------------------------------------------------------

bool Handler::IHandler::IsLocal(Peer::Identity const& sender) const { return sender == m_identity; }

//----------------------------------------------------------------------------------------------------------------------

Chat::Origin Handler::IHandler::GetOrigin(Peer::Identity const& sender) const
{
    return IsLocal(sender) ? Chat::Origin::Local : Chat::Origin::Remote;
}

//----------------------------------------------------------------------------------------------------------------------

Chat::Message Handler::IHandler::CreateInboundMessage(Message::Envelope const& envelope) const
{
    auto const origin = GetOrigin(envelope.GetSender());
    auto const status = (origin == Chat::Origin::Local) ? Chat::Status::Sent : Chat::Status::Delivered;
    return Chat::Message{ envelope.GetId(), envelope.GetTimestamp(), envelope.GetSender(), origin, status };
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder Handler::IHandler::CreateOutboundBuilder(Chat::Message const& message) const
{
    auto builder = Message::Envelope::GetBuilder();
    builder
        .SetId(message.GetId())
        .SetTimestamp(message.GetTimestamp())
        .SetSender(m_identity);
    return builder;
}

//----------------------------------------------------------------------------------------------------------------------
