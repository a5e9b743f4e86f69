//----------------------------------------------------------------------------------------------------------------------
// File: Envelope.hpp
// Description: The uniform wire wrapper around every unit of peer to peer content. An envelope is immutable once it
// has been built, the payload is opaque to everything except the handler bound to the envelope's content type.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "MessageTypes.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Peer/Identity.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Message {
//----------------------------------------------------------------------------------------------------------------------

class Envelope;
class EnvelopeBuilder;

constexpr std::uint8_t EnvelopeVersion = 0x01;

// Decodes a packed envelope. On failure the result is set to DecodeError and no envelope is returned.
[[nodiscard]] std::optional<Envelope> Decode(std::span<std::uint8_t const> buffer, Parley::Result& result);

//----------------------------------------------------------------------------------------------------------------------
} // Message namespace
//----------------------------------------------------------------------------------------------------------------------

class Message::Envelope
{
public:
    // Message::EnvelopeBuilder {
    friend class EnvelopeBuilder;
    [[nodiscard]] static EnvelopeBuilder GetBuilder();
    // } Message::EnvelopeBuilder

    [[nodiscard]] bool operator==(Envelope const& other) const;

    [[nodiscard]] std::string const& GetId() const;
    [[nodiscard]] TimeUtils::Timepoint const& GetTimestamp() const;
    [[nodiscard]] Peer::Identity const& GetSender() const;
    [[nodiscard]] std::string const& GetContentType() const;
    [[nodiscard]] Buffer const& GetPayload() const;
    [[nodiscard]] std::optional<Metadata> const& GetMetadata() const;
    [[nodiscard]] std::optional<std::string> GetMetadataValue(std::string_view key) const;
    [[nodiscard]] std::optional<SequenceNumber> const& GetSequenceNumber() const;

    [[nodiscard]] std::size_t GetPackSize() const;
    [[nodiscard]] Buffer GetPack() const;

    [[nodiscard]] ValidationStatus Validate() const;

private:
    Envelope();

    constexpr std::size_t FixedPackSize() const;

    std::string m_id;
    TimeUtils::Timepoint m_timestamp;
    Peer::Identity m_sender;
    std::string m_contentType;
    Buffer m_payload;
    std::optional<Metadata> m_optMetadata;
    std::optional<SequenceNumber> m_optSequenceNumber;
};

//----------------------------------------------------------------------------------------------------------------------

class Message::EnvelopeBuilder
{
public:
    using OptionalEnvelope = std::optional<Envelope>;

    EnvelopeBuilder();

    EnvelopeBuilder& SetId(std::string_view id);
    EnvelopeBuilder& SetTimestamp(TimeUtils::Timepoint const& timestamp);
    EnvelopeBuilder& SetSender(Peer::Identity const& sender);
    EnvelopeBuilder& SetContentType(std::string_view contentType);
    EnvelopeBuilder& SetPayload(std::string_view payload);
    EnvelopeBuilder& SetPayload(std::span<std::uint8_t const> payload);
    EnvelopeBuilder& SetPayload(Buffer&& payload);
    EnvelopeBuilder& SetMetadata(Metadata const& metadata);
    EnvelopeBuilder& SetMetadata(std::optional<Metadata> const& optMetadata);
    EnvelopeBuilder& AddMetadata(std::string_view key, std::string_view value);
    EnvelopeBuilder& SetSequenceNumber(SequenceNumber sequence);

    EnvelopeBuilder& FromPack(std::span<std::uint8_t const> buffer);

    [[nodiscard]] Envelope&& Build();
    [[nodiscard]] OptionalEnvelope ValidatedBuild();

private:
    [[nodiscard]] bool Unpack(std::span<std::uint8_t const> buffer);

    Envelope m_envelope;
    bool m_hasExplicitId;
    bool m_hasExplicitTimestamp;
    bool m_hasStageFailure;
};

//----------------------------------------------------------------------------------------------------------------------
