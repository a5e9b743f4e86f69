//----------------------------------------------------------------------------------------------------------------------
// File: Result.hpp
// Description: The status type returned by the processor, handlers, and session. Failures are returned to the caller
// and are never thrown across the library's interfaces.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <stdexcept>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Parley {
//----------------------------------------------------------------------------------------------------------------------

class Result;

enum class ResultCode : std::uint32_t {
    Success,
    DecodeError,
    UnsupportedContentType,
    NoEncoderForMessage,
    InvalidPayload,
    SerializationFailed,
    DeserializationFailed,
    HandlerError,
    SessionNotInitialized,
    NoPeersConnected,
    PeerNotFound,
    SendFailed,
    TransportError,
    InvalidArgument
};

[[nodiscard]] std::string_view GetDescription(ResultCode code) noexcept;

//----------------------------------------------------------------------------------------------------------------------
} // Parley namespace
//----------------------------------------------------------------------------------------------------------------------

class Parley::Result : public std::exception
{
public:
    Result() noexcept;
    Result(ResultCode code) noexcept;

    ~Result() = default;
    Result(Result const& other) = default;
    Result(Result&& other) = default;
    Result& operator=(Result const& other) = default;
    Result& operator=(Result&& other) = default;

    [[nodiscard]] bool operator==(Result const& other) const noexcept;
    [[nodiscard]] bool operator==(ResultCode other) const noexcept;

    explicit operator bool() const noexcept;

    [[nodiscard]] virtual char const* what() const noexcept override;
    [[nodiscard]] bool IsSuccess() const noexcept;
    [[nodiscard]] bool IsError() const noexcept;
    [[nodiscard]] ResultCode GetCode() const noexcept;

private:
    ResultCode m_code;
};

//----------------------------------------------------------------------------------------------------------------------

inline Parley::Result::Result() noexcept
    : std::exception()
    , m_code(ResultCode::Success)
{
}

//----------------------------------------------------------------------------------------------------------------------

inline Parley::Result::Result(ResultCode code) noexcept
    : std::exception()
    , m_code(code)
{
}

//----------------------------------------------------------------------------------------------------------------------

inline bool Parley::Result::operator==(Result const& other) const noexcept { return m_code == other.m_code; }

//----------------------------------------------------------------------------------------------------------------------

inline bool Parley::Result::operator==(ResultCode other) const noexcept { return m_code == other; }

//----------------------------------------------------------------------------------------------------------------------

inline Parley::Result::operator bool() const noexcept { return IsSuccess(); }

//----------------------------------------------------------------------------------------------------------------------

inline char const* Parley::Result::what() const noexcept { return GetDescription(m_code).data(); }

//----------------------------------------------------------------------------------------------------------------------

inline bool Parley::Result::IsSuccess() const noexcept { return m_code == ResultCode::Success; }

//----------------------------------------------------------------------------------------------------------------------

inline bool Parley::Result::IsError() const noexcept { return !IsSuccess(); }

//----------------------------------------------------------------------------------------------------------------------

inline Parley::ResultCode Parley::Result::GetCode() const noexcept { return m_code; }

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Parley::GetDescription(ResultCode code) noexcept
{
    // Note: The returned views are null terminated such that they may be provided through what().
    switch (code) {
        case ResultCode::Success: return "Success";
        case ResultCode::DecodeError: return "The envelope could not be decoded";
        case ResultCode::UnsupportedContentType: return "No handler is registered for the content type";
        case ResultCode::NoEncoderForMessage: return "No handler could encode the message";
        case ResultCode::InvalidPayload: return "The payload is inconsistent with the declared content type";
        case ResultCode::SerializationFailed: return "The structured payload could not be serialized";
        case ResultCode::DeserializationFailed: return "The structured payload could not be deserialized";
        case ResultCode::HandlerError: return "The handler failed to process the envelope";
        case ResultCode::SessionNotInitialized: return "The session has no transport";
        case ResultCode::NoPeersConnected: return "There are no connected peers";
        case ResultCode::PeerNotFound: return "The peer could not be found";
        case ResultCode::SendFailed: return "The transport failed to send the data";
        case ResultCode::TransportError: return "The transport reported an error";
        case ResultCode::InvalidArgument: return "An invalid argument was provided";
    }
    return "Unknown result";
}

//----------------------------------------------------------------------------------------------------------------------
