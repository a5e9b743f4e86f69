//----------------------------------------------------------------------------------------------------------------------
// File: Envelope.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Envelope.hpp"
#include "PackUtils.hpp"
#include "Components/Identifier/Identifier.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <ranges>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using ShortField = std::uint16_t;
using LongField = std::uint32_t;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::Envelope> Message::Decode(std::span<std::uint8_t const> buffer, Parley::Result& result)
{
    auto optEnvelope = Envelope::GetBuilder().FromPack(buffer).ValidatedBuild();
    result = optEnvelope ? Parley::ResultCode::Success : Parley::ResultCode::DecodeError;
    return optEnvelope;
}

//----------------------------------------------------------------------------------------------------------------------

Message::Envelope::Envelope()
    : m_id()
    , m_timestamp()
    , m_sender("", "")
    , m_contentType()
    , m_payload()
    , m_optMetadata()
    , m_optSequenceNumber()
{
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder Message::Envelope::GetBuilder() { return EnvelopeBuilder{}; }

//----------------------------------------------------------------------------------------------------------------------

bool Message::Envelope::operator==(Envelope const& other) const
{
    return m_id == other.m_id &&
           m_timestamp == other.m_timestamp &&
           m_sender.IsEquivalent(other.m_sender) &&
           m_contentType == other.m_contentType &&
           m_payload == other.m_payload &&
           m_optMetadata == other.m_optMetadata &&
           m_optSequenceNumber == other.m_optSequenceNumber;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Message::Envelope::GetId() const { return m_id; }

//----------------------------------------------------------------------------------------------------------------------

TimeUtils::Timepoint const& Message::Envelope::GetTimestamp() const { return m_timestamp; }

//----------------------------------------------------------------------------------------------------------------------

Peer::Identity const& Message::Envelope::GetSender() const { return m_sender; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Message::Envelope::GetContentType() const { return m_contentType; }

//----------------------------------------------------------------------------------------------------------------------

Message::Buffer const& Message::Envelope::GetPayload() const { return m_payload; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::Metadata> const& Message::Envelope::GetMetadata() const { return m_optMetadata; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Message::Envelope::GetMetadataValue(std::string_view key) const
{
    if (!m_optMetadata) { return {}; }
    if (auto const itr = m_optMetadata->find(std::string{ key }); itr != m_optMetadata->end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::SequenceNumber> const& Message::Envelope::GetSequenceNumber() const
{
    return m_optSequenceNumber;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Message::Envelope::GetPackSize() const
{
    std::size_t size = FixedPackSize();
    size += m_id.size();
    size += m_sender.GetPeerId().size();
    size += m_sender.GetDisplayName().size();
    if (auto const& optDeviceInfo = m_sender.GetDeviceInfo(); optDeviceInfo) {
        size += sizeof(local::ShortField) + optDeviceInfo->size();
    }
    if (auto const& optAvatar = m_sender.GetAvatar(); optAvatar) {
        size += sizeof(local::LongField) + optAvatar->size();
    }
    size += m_contentType.size();
    size += m_payload.size();
    if (m_optMetadata) { size += PackUtils::GetPackSize(*m_optMetadata); }
    if (m_optSequenceNumber) { size += sizeof(SequenceNumber); }
    return size;
}

//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Pack the envelope into its wire representation. The envelope must be valid.
//----------------------------------------------------------------------------------------------------------------------
Message::Buffer Message::Envelope::GetPack() const
{
    assert(Validate() == ValidationStatus::Success);

    // Envelope Pack Schema:
    //  - Section 1 (1 byte): Format Version
    //  - Section 2 (2 bytes): Identifier Size
    //  - Section 3 (N bytes): Identifier
    //  - Section 4 (8 bytes): Timestamp (milliseconds since epoch)
    //  - Section 5 (N bytes): Sender
    //      - Section 5.1 (2 bytes): Peer Identifier Size       |   Sender Start
    //      - Section 5.2 (N bytes): Peer Identifier            |
    //      - Section 5.3 (2 bytes): Display Name Size          |
    //      - Section 5.4 (N bytes): Display Name               |
    //      - Section 5.5 (1 byte): Device Info Flag            |
    //      - Section 5.6 (2 + N bytes): Optional Device Info   |
    //      - Section 5.7 (1 byte): Avatar Flag                 |
    //      - Section 5.8 (4 + N bytes): Optional Avatar        |   Sender End
    //  - Section 6 (2 bytes): Content Type Size
    //  - Section 7 (N bytes): Content Type
    //  - Section 8 (4 bytes): Payload Size
    //  - Section 9 (N bytes): Payload
    //  - Section 10 (1 byte): Metadata Flag
    //      - Section 10.1 (2 bytes): Metadata Entry Count      |   Metadata Start
    //      - Section 10.2 (2 + N bytes): Key                   |   (Repeated)
    //      - Section 10.3 (2 + N bytes): Value                 |   Metadata End
    //  - Section 11 (1 byte): Sequence Number Flag
    //  - Section 12 (8 bytes): Optional Sequence Number

    Buffer buffer;
    buffer.reserve(GetPackSize());

    PackUtils::PackChunk(EnvelopeVersion, buffer);
    PackUtils::PackChunk<local::ShortField>(std::string_view{ m_id }, buffer);
    PackUtils::PackChunk(static_cast<std::int64_t>(TimeUtils::TimepointToTimestamp(m_timestamp).count()), buffer);

    PackUtils::PackChunk<local::ShortField>(std::string_view{ m_sender.GetPeerId() }, buffer);
    PackUtils::PackChunk<local::ShortField>(std::string_view{ m_sender.GetDisplayName() }, buffer);
    PackUtils::PackOptionalChunk<local::ShortField>(m_sender.GetDeviceInfo(), buffer);
    PackUtils::PackOptionalChunk<local::LongField>(m_sender.GetAvatar(), buffer);

    PackUtils::PackChunk<local::ShortField>(std::string_view{ m_contentType }, buffer);
    PackUtils::PackChunk<local::LongField>(std::span<std::uint8_t const>{ m_payload }, buffer);

    PackUtils::PackOptionalMetadata(m_optMetadata, buffer);

    PackUtils::PackChunk(static_cast<std::uint8_t>(m_optSequenceNumber.has_value()), buffer);
    if (m_optSequenceNumber) { PackUtils::PackChunk(*m_optSequenceNumber, buffer); }

    assert(buffer.size() == GetPackSize());
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

Message::ValidationStatus Message::Envelope::Validate() const
{
    using enum ValidationStatus;

    // An envelope must be identifiable and must declare who sent it and how the payload should be interpreted.
    if (m_id.empty() || !m_sender.IsValid() || m_contentType.empty()) { return Error; }

    // Every variable length field must be representable by its size field.
    if (!PackUtils::FitsSizeField<local::ShortField>(m_id.size())) { return Error; }
    if (!PackUtils::FitsSizeField<local::ShortField>(m_sender.GetPeerId().size())) { return Error; }
    if (!PackUtils::FitsSizeField<local::ShortField>(m_sender.GetDisplayName().size())) { return Error; }
    if (auto const& optDeviceInfo = m_sender.GetDeviceInfo(); optDeviceInfo) {
        if (!PackUtils::FitsSizeField<local::ShortField>(optDeviceInfo->size())) { return Error; }
    }
    if (auto const& optAvatar = m_sender.GetAvatar(); optAvatar) {
        if (!PackUtils::FitsSizeField<local::LongField>(optAvatar->size())) { return Error; }
    }
    if (!PackUtils::FitsSizeField<local::ShortField>(m_contentType.size())) { return Error; }
    if (!PackUtils::FitsSizeField<local::LongField>(m_payload.size())) { return Error; }
    if (m_optMetadata && !PackUtils::IsPackable(*m_optMetadata)) { return Error; }

    return Success;
}

//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t Message::Envelope::FixedPackSize() const
{
    std::size_t size = 0;
    size += sizeof(EnvelopeVersion); // 1 byte for the format version
    size += sizeof(local::ShortField); // 2 bytes for the identifier size
    size += sizeof(std::uint64_t); // 8 bytes for the timestamp
    size += 2 * sizeof(local::ShortField); // 4 bytes for the peer identifier and display name sizes
    size += 2 * sizeof(std::uint8_t); // 2 bytes for the device info and avatar flags
    size += sizeof(local::ShortField); // 2 bytes for the content type size
    size += sizeof(local::LongField); // 4 bytes for the payload size
    size += 2 * sizeof(std::uint8_t); // 2 bytes for the metadata and sequence number flags
    return size;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder::EnvelopeBuilder()
    : m_envelope()
    , m_hasExplicitId(false)
    , m_hasExplicitTimestamp(false)
    , m_hasStageFailure(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::SetId(std::string_view id)
{
    m_envelope.m_id = id;
    m_hasExplicitId = true;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::SetTimestamp(TimeUtils::Timepoint const& timestamp)
{
    m_envelope.m_timestamp = timestamp;
    m_hasExplicitTimestamp = true;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::SetSender(Peer::Identity const& sender)
{
    m_envelope.m_sender = sender;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::SetContentType(std::string_view contentType)
{
    m_envelope.m_contentType = contentType;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::SetPayload(std::string_view payload)
{
    m_envelope.m_payload.assign(payload.begin(), payload.end());
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::SetPayload(std::span<std::uint8_t const> payload)
{
    m_envelope.m_payload.assign(payload.begin(), payload.end());
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::SetPayload(Buffer&& payload)
{
    m_envelope.m_payload = std::move(payload);
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::SetMetadata(Metadata const& metadata)
{
    m_envelope.m_optMetadata = metadata;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::SetMetadata(std::optional<Metadata> const& optMetadata)
{
    m_envelope.m_optMetadata = optMetadata;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::AddMetadata(std::string_view key, std::string_view value)
{
    if (!m_envelope.m_optMetadata) { m_envelope.m_optMetadata.emplace(); }
    m_envelope.m_optMetadata->insert_or_assign(std::string{ key }, std::string{ value });
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::SetSequenceNumber(SequenceNumber sequence)
{
    m_envelope.m_optSequenceNumber = sequence;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder& Message::EnvelopeBuilder::FromPack(std::span<std::uint8_t const> buffer)
{
    if (buffer.empty() || !Unpack(buffer)) { m_hasStageFailure = true; }
    m_hasExplicitId = true;
    m_hasExplicitTimestamp = true;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Message::Envelope&& Message::EnvelopeBuilder::Build()
{
    if (!m_hasExplicitId) { m_envelope.m_id = Identifier::Generate(); }
    if (!m_hasExplicitTimestamp) { m_envelope.m_timestamp = TimeUtils::GetSystemTimepoint(); }
    return std::move(m_envelope);
}

//----------------------------------------------------------------------------------------------------------------------

Message::EnvelopeBuilder::OptionalEnvelope Message::EnvelopeBuilder::ValidatedBuild()
{
    if (m_hasStageFailure) { return {}; }
    if (!m_hasExplicitId) { m_envelope.m_id = Identifier::Generate(); }
    if (!m_hasExplicitTimestamp) { m_envelope.m_timestamp = TimeUtils::GetSystemTimepoint(); }
    if (m_envelope.Validate() != ValidationStatus::Success) { return {}; }
    return std::move(m_envelope);
}

//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Unpack the wire representation into the envelope's fields. Every byte of the buffer must be consumed.
//----------------------------------------------------------------------------------------------------------------------
bool Message::EnvelopeBuilder::Unpack(std::span<std::uint8_t const> buffer)
{
    auto begin = buffer.begin();
    auto const end = buffer.end();

    std::uint8_t version = 0;
    if (!PackUtils::UnpackChunk(begin, end, version)) { return false; }
    if (version != EnvelopeVersion) { return false; }

    if (!PackUtils::UnpackSizedChunk<local::ShortField>(begin, end, m_envelope.m_id)) { return false; }

    {
        std::int64_t milliseconds = 0; // Timestamps preceding the epoch are negative.
        if (!PackUtils::UnpackChunk(begin, end, milliseconds)) { return false; }
        m_envelope.m_timestamp = TimeUtils::TimestampToTimepoint(
            TimeUtils::Timestamp{ static_cast<TimeUtils::Timestamp::rep>(milliseconds) });
    }

    {
        std::string peerId;
        std::string displayName;
        std::optional<std::string> optDeviceInfo;
        std::optional<Buffer> optAvatar;
        if (!PackUtils::UnpackSizedChunk<local::ShortField>(begin, end, peerId)) { return false; }
        if (!PackUtils::UnpackSizedChunk<local::ShortField>(begin, end, displayName)) { return false; }
        if (!PackUtils::UnpackOptionalChunk<local::ShortField>(begin, end, optDeviceInfo)) { return false; }
        if (!PackUtils::UnpackOptionalChunk<local::LongField>(begin, end, optAvatar)) { return false; }
        m_envelope.m_sender = Peer::Identity{ peerId, displayName, optDeviceInfo, optAvatar };
    }

    if (!PackUtils::UnpackSizedChunk<local::ShortField>(begin, end, m_envelope.m_contentType)) { return false; }
    if (!PackUtils::UnpackSizedChunk<local::LongField>(begin, end, m_envelope.m_payload)) { return false; }

    if (!PackUtils::UnpackOptionalMetadata(begin, end, m_envelope.m_optMetadata)) { return false; }

    {
        std::uint8_t present = 0;
        if (!PackUtils::UnpackChunk(begin, end, present) || present > 1) { return false; }
        if (present == 1) {
            SequenceNumber sequence = 0;
            if (!PackUtils::UnpackChunk(begin, end, sequence)) { return false; }
            m_envelope.m_optSequenceNumber = sequence;
        }
    }

    return begin == end; // Trailing bytes indicate the buffer is not a single envelope.
}

//----------------------------------------------------------------------------------------------------------------------

