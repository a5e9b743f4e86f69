//----------------------------------------------------------------------------------------------------------------------
// File: EventSink.hpp
// Description: Defines the interface the conversation dispatcher publishes application events through.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chat/Events.hpp"
#include "Components/Core/Result.hpp"
//----------------------------------------------------------------------------------------------------------------------

class IEventSink
{
public:
    virtual ~IEventSink() = default;

    virtual void OnEvent(Chat::Event const& event) = 0;
    virtual void OnError(Parley::Result const& result) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
