//----------------------------------------------------------------------------------------------------------------------
// File: Records.hpp
// Description: The structured payload records carried by the non-text content types. Each record is packed with the
// big-endian PackUtils helpers and must be consumed completely when unpacked.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chat/Events.hpp"
#include "Components/Message/MessageTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Handler::Records {
//----------------------------------------------------------------------------------------------------------------------

struct Image;
struct Reaction;
struct Typing;
struct Part;
struct Multipart;
struct Receipt;
struct Edit;
struct Delete;
struct System;

using OptionalPack = std::optional<Message::Buffer>;

//----------------------------------------------------------------------------------------------------------------------
} // Handler::Records namespace
//----------------------------------------------------------------------------------------------------------------------

struct Handler::Records::Image
{
    [[nodiscard]] OptionalPack GetPack() const;
    [[nodiscard]] static std::optional<Image> FromPack(std::span<std::uint8_t const> buffer);

    Message::Buffer data;
    std::optional<Message::Buffer> thumbnail;
    std::optional<std::string> caption;
    std::string contentType;
    std::string filename;
};

//----------------------------------------------------------------------------------------------------------------------

struct Handler::Records::Reaction
{
    [[nodiscard]] OptionalPack GetPack() const;
    [[nodiscard]] static std::optional<Reaction> FromPack(std::span<std::uint8_t const> buffer);

    std::string messageId;
    std::string emoji;
    Chat::ReactionAction action;
};

//----------------------------------------------------------------------------------------------------------------------

struct Handler::Records::Typing
{
    [[nodiscard]] OptionalPack GetPack() const;
    [[nodiscard]] static std::optional<Typing> FromPack(std::span<std::uint8_t const> buffer);

    bool isTyping;
    std::optional<std::string> preview;
};

//----------------------------------------------------------------------------------------------------------------------

struct Handler::Records::Part
{
    std::string contentType;
    std::optional<std::string> contentId;
    std::optional<Message::Metadata> headers;
    Message::Buffer data;
};

//----------------------------------------------------------------------------------------------------------------------

struct Handler::Records::Multipart
{
    [[nodiscard]] OptionalPack GetPack() const;
    [[nodiscard]] static std::optional<Multipart> FromPack(std::span<std::uint8_t const> buffer);

    std::string boundary;
    std::vector<Part> parts;
};

//----------------------------------------------------------------------------------------------------------------------

struct Handler::Records::Receipt
{
    [[nodiscard]] OptionalPack GetPack() const;
    [[nodiscard]] static std::optional<Receipt> FromPack(std::span<std::uint8_t const> buffer);

    std::string messageId;
    Chat::Status status;
};

//----------------------------------------------------------------------------------------------------------------------

struct Handler::Records::Edit
{
    [[nodiscard]] OptionalPack GetPack() const;
    [[nodiscard]] static std::optional<Edit> FromPack(std::span<std::uint8_t const> buffer);

    std::string messageId;
    std::string text;
};

//----------------------------------------------------------------------------------------------------------------------

struct Handler::Records::Delete
{
    [[nodiscard]] OptionalPack GetPack() const;
    [[nodiscard]] static std::optional<Delete> FromPack(std::span<std::uint8_t const> buffer);

    std::string messageId;
};

//----------------------------------------------------------------------------------------------------------------------

struct Handler::Records::System
{
    [[nodiscard]] OptionalPack GetPack() const;
    [[nodiscard]] static std::optional<System> FromPack(std::span<std::uint8_t const> buffer);

    Chat::SystemEventKind kind;
    std::string text;
};

//----------------------------------------------------------------------------------------------------------------------
