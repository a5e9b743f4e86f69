//----------------------------------------------------------------------------------------------------------------------
// File: ContentType.hpp
// Description: The catalog of content types understood by the built-in handlers and helpers to classify them. The
// catalog is open, additional types are supported by registering a handler that claims them.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Message::ContentType {
//----------------------------------------------------------------------------------------------------------------------

// Text
constexpr std::string_view TextPlain = "text/plain";
constexpr std::string_view TextMarkdown = "text/markdown";
constexpr std::string_view TextHtml = "text/html";
constexpr std::string_view TextRtf = "text/rtf";

// Images
constexpr std::string_view ImageJpeg = "image/jpeg";
constexpr std::string_view ImagePng = "image/png";
constexpr std::string_view ImageGif = "image/gif";
constexpr std::string_view ImageHeic = "image/heic";
constexpr std::string_view ImageSvg = "image/svg+xml";

// Audio and video
constexpr std::string_view AudioMpeg = "audio/mpeg";
constexpr std::string_view AudioWav = "audio/wav";
constexpr std::string_view AudioAac = "audio/aac";
constexpr std::string_view VideoMp4 = "video/mp4";
constexpr std::string_view VideoQuicktime = "video/quicktime";

// Documents
constexpr std::string_view ApplicationJson = "application/json";
constexpr std::string_view ApplicationPdf = "application/pdf";
constexpr std::string_view ApplicationOctetStream = "application/octet-stream";

// Chat control records
constexpr std::string_view Reaction = "application/x-reaction";
constexpr std::string_view Typing = "application/x-typing";
constexpr std::string_view Receipt = "application/x-receipt";
constexpr std::string_view Edit = "application/x-edit";
constexpr std::string_view Delete = "application/x-delete";
constexpr std::string_view System = "application/x-system";

// Containers
constexpr std::string_view MultipartMixed = "multipart/mixed";
constexpr std::string_view MultipartAlternative = "multipart/alternative";
constexpr std::string_view MultipartRelated = "multipart/related";

[[nodiscard]] std::string Normalize(std::string_view contentType);
[[nodiscard]] std::string_view GetMainType(std::string_view contentType);
[[nodiscard]] std::string_view GetSubType(std::string_view contentType);

[[nodiscard]] bool IsText(std::string_view contentType);
[[nodiscard]] bool IsImage(std::string_view contentType);
[[nodiscard]] bool IsAudio(std::string_view contentType);
[[nodiscard]] bool IsVideo(std::string_view contentType);
[[nodiscard]] bool IsMultipart(std::string_view contentType);

//----------------------------------------------------------------------------------------------------------------------
} // Message::ContentType namespace
//----------------------------------------------------------------------------------------------------------------------
