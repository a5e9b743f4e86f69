//----------------------------------------------------------------------------------------------------------------------
// File: Processor.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Processor.hpp"
#include "ContentType.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <exception>
#include <iterator>
#include <mutex>
#include <ranges>
//----------------------------------------------------------------------------------------------------------------------

Message::Processor::Processor()
    : m_mutex()
    , m_handlers()
    , m_registrations()
    , m_spFallback()
    , m_logger(spdlog::get(Logger::Name::Core.data()))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

void Message::Processor::Register(Handler::SharedHandler const& spHandler)
{
    if (!spHandler) { return; }
    std::scoped_lock lock{ m_mutex };
    RegisterLocked(spHandler);
    PruneRegistrations();
}

//----------------------------------------------------------------------------------------------------------------------

void Message::Processor::RegisterHandlers(Handler::Handlers const& handlers)
{
    std::scoped_lock lock{ m_mutex };
    for (auto const& spHandler : handlers) {
        if (spHandler) { RegisterLocked(spHandler); }
    }
    PruneRegistrations();
}

//----------------------------------------------------------------------------------------------------------------------

void Message::Processor::SetFallbackHandler(Handler::SharedHandler const& spHandler)
{
    std::scoped_lock lock{ m_mutex };
    m_spFallback = spHandler;
}

//----------------------------------------------------------------------------------------------------------------------

bool Message::Processor::RemoveHandler(std::string_view contentType)
{
    std::scoped_lock lock{ m_mutex };
    if (m_handlers.erase(ContentType::Normalize(contentType)) == 0) { return false; }
    PruneRegistrations();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Message::Processor::ClearHandlers()
{
    std::scoped_lock lock{ m_mutex };
    m_handlers.clear();
    m_registrations.clear();
    m_spFallback.reset();
}

//----------------------------------------------------------------------------------------------------------------------

bool Message::Processor::IsSupported(std::string_view contentType) const
{
    std::shared_lock lock{ m_mutex };
    return m_handlers.contains(ContentType::Normalize(contentType));
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> Message::Processor::GetSupportedContentTypes() const
{
    std::vector<std::string> supported;
    {
        std::shared_lock lock{ m_mutex };
        supported.reserve(m_handlers.size());
        for (auto const& [contentType, spHandler] : m_handlers) { supported.emplace_back(contentType); }
    }
    std::ranges::sort(supported);
    return supported;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Message::Processor::GetHandlerCount() const
{
    std::shared_lock lock{ m_mutex };
    return m_handlers.size();
}

//----------------------------------------------------------------------------------------------------------------------

bool Message::Processor::HasFallbackHandler() const
{
    std::shared_lock lock{ m_mutex };
    return m_spFallback != nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chat::Event> Message::Processor::Process(Envelope const& envelope, Parley::Result& result) const
{
    Handler::SharedHandler spHandler;
    {
        std::shared_lock lock{ m_mutex };
        if (auto const itr = m_handlers.find(ContentType::Normalize(envelope.GetContentType())); itr != m_handlers.end()) {
            spHandler = itr->second;
        } else {
            spHandler = m_spFallback;
        }
    }

    if (!spHandler) {
        m_logger->warn("No handler is available for the {} content type.", envelope.GetContentType());
        result = Parley::ResultCode::UnsupportedContentType;
        return {};
    }

    // The handler is invoked outside of the lock, handlers may take an arbitrary amount of time to interpret a payload.
    try {
        result = Parley::ResultCode::Success;
        auto optEvent = spHandler->Handle(envelope, result);
        if (!optEvent && result.IsSuccess()) { result = Parley::ResultCode::HandlerError; }
        if (!optEvent) {
            m_logger->warn("Failed to process envelope {} ({}). Reason: {}",
                envelope.GetId(), envelope.GetContentType(), result.what());
        }
        return optEvent;
    } catch (std::exception const& exception) {
        m_logger->error("The {} handler raised an error while processing envelope {}: {}",
            envelope.GetContentType(), envelope.GetId(), exception.what());
        result = Parley::ResultCode::HandlerError;
        return {};
    }
}

//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Offers the message to the handlers in priority order. Composite handlers are offered messages with
// more than one facet first, then the specific handlers in registration order, then any remaining composite
// handlers, and finally the fallback handler.
//----------------------------------------------------------------------------------------------------------------------
std::optional<Message::Envelope> Message::Processor::Encode(Chat::Message const& message, Parley::Result& result) const
{
    Handler::Handlers candidates;
    {
        std::shared_lock lock{ m_mutex };
        candidates.reserve(m_registrations.size() + 1);

        auto const appendWithPriority = [&] (Handler::Priority priority) {
            std::ranges::copy_if(m_registrations, std::back_inserter(candidates),
                [priority] (auto const& spHandler) { return spHandler->GetPriority() == priority; });
        };

        bool const isComposite = message.GetFacetCount() > 1;
        if (isComposite) { appendWithPriority(Handler::Priority::Composite); }
        appendWithPriority(Handler::Priority::Specific);
        if (!isComposite) { appendWithPriority(Handler::Priority::Composite); }
        appendWithPriority(Handler::Priority::Fallback);
        if (m_spFallback) { candidates.emplace_back(m_spFallback); }
    }

    for (auto const& spHandler : candidates) {
        if (auto optEnvelope = TryEncode(*spHandler, message); optEnvelope) {
            result = Parley::ResultCode::Success;
            return optEnvelope;
        }
    }

    m_logger->warn("No handler was able to encode message {}.", message.GetId());
    result = Parley::ResultCode::NoEncoderForMessage;
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

void Message::Processor::RegisterLocked(Handler::SharedHandler const& spHandler)
{
    for (auto const& contentType : spHandler->GetContentTypes()) {
        m_handlers.insert_or_assign(ContentType::Normalize(contentType), spHandler);
    }

    if (std::ranges::find(m_registrations, spHandler) == m_registrations.end()) {
        m_registrations.emplace_back(spHandler);
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Message::Processor::PruneRegistrations()
{
    // Drop any handler that no longer has a content type bound to it.
    std::erase_if(m_registrations, [this] (Handler::SharedHandler const& spHandler) {
        return std::ranges::none_of(m_handlers, [&spHandler] (auto const& entry) { return entry.second == spHandler; });
    });
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::Envelope> Message::Processor::TryEncode(
    Handler::IHandler const& handler, Chat::Message const& message) const
{
    try {
        return handler.Encode(message);
    } catch (std::exception const& exception) {
        m_logger->error("A handler raised an error while encoding message {}: {}", message.GetId(), exception.what());
        return {};
    }
}

//----------------------------------------------------------------------------------------------------------------------
