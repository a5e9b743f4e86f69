//----------------------------------------------------------------------------------------------------------------------
// File: Control.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Handler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Handles the conversation control records: delivery receipts, edits, deletions, and system notices.
// Control records refer to earlier messages by identifier and are created directly rather than encoded from messages.
//----------------------------------------------------------------------------------------------------------------------
class Handler::Control : public Handler::IHandler
{
public:
    explicit Control(Peer::Identity const& identity);

    // IHandler {
    [[nodiscard]] virtual ContentTypes const& GetContentTypes() const override;
    [[nodiscard]] virtual OptionalEvent Handle(Message::Envelope const& envelope, Parley::Result& result) const override;
    [[nodiscard]] virtual OptionalEnvelope Encode(Chat::Message const& message) const override;
    // } IHandler

    [[nodiscard]] static OptionalEnvelope CreateReceiptEnvelope(
        std::string_view messageId, Chat::Status status, Peer::Identity const& sender);
    [[nodiscard]] static OptionalEnvelope CreateEditEnvelope(
        std::string_view messageId, std::string_view text, Peer::Identity const& sender);
    [[nodiscard]] static OptionalEnvelope CreateDeleteEnvelope(std::string_view messageId, Peer::Identity const& sender);
    [[nodiscard]] static OptionalEnvelope CreateSystemEnvelope(
        Chat::SystemEventKind kind, std::string_view text, Peer::Identity const& sender);

private:
    [[nodiscard]] OptionalEvent HandleReceipt(Message::Envelope const& envelope, Parley::Result& result) const;
    [[nodiscard]] OptionalEvent HandleEdit(Message::Envelope const& envelope, Parley::Result& result) const;
    [[nodiscard]] OptionalEvent HandleDelete(Message::Envelope const& envelope, Parley::Result& result) const;
    [[nodiscard]] OptionalEvent HandleSystem(Message::Envelope const& envelope, Parley::Result& result) const;
};

//----------------------------------------------------------------------------------------------------------------------
