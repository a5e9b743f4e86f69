//----------------------------------------------------------------------------------------------------------------------
// File: ContentType.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "ContentType.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/string.hpp>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

// Strips any parameters (e.g. "; charset=utf-8") and surrounding whitespace from the content type.
[[nodiscard]] std::string_view StripParameters(std::string_view contentType);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string Message::ContentType::Normalize(std::string_view contentType)
{
    return boost::algorithm::to_lower_copy(std::string{ local::StripParameters(contentType) });
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Message::ContentType::GetMainType(std::string_view contentType)
{
    auto const stripped = local::StripParameters(contentType);
    auto const separator = stripped.find('/');
    if (separator == std::string_view::npos || separator == 0) { return {}; }
    return stripped.substr(0, separator);
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Message::ContentType::GetSubType(std::string_view contentType)
{
    auto const stripped = local::StripParameters(contentType);
    auto const separator = stripped.find('/');
    if (separator == std::string_view::npos || separator + 1 >= stripped.size()) { return {}; }
    return stripped.substr(separator + 1);
}

//----------------------------------------------------------------------------------------------------------------------

bool Message::ContentType::IsText(std::string_view contentType)
{
    return boost::algorithm::iequals(GetMainType(contentType), "text");
}

//----------------------------------------------------------------------------------------------------------------------

bool Message::ContentType::IsImage(std::string_view contentType)
{
    return boost::algorithm::iequals(GetMainType(contentType), "image");
}

//----------------------------------------------------------------------------------------------------------------------

bool Message::ContentType::IsAudio(std::string_view contentType)
{
    return boost::algorithm::iequals(GetMainType(contentType), "audio");
}

//----------------------------------------------------------------------------------------------------------------------

bool Message::ContentType::IsVideo(std::string_view contentType)
{
    return boost::algorithm::iequals(GetMainType(contentType), "video");
}

//----------------------------------------------------------------------------------------------------------------------

bool Message::ContentType::IsMultipart(std::string_view contentType)
{
    return boost::algorithm::iequals(GetMainType(contentType), "multipart");
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view local::StripParameters(std::string_view contentType)
{
    if (auto const parameters = contentType.find(';'); parameters != std::string_view::npos) {
        contentType = contentType.substr(0, parameters);
    }

    constexpr std::string_view Whitespace = " \t\r\n";
    auto const first = contentType.find_first_not_of(Whitespace);
    if (first == std::string_view::npos) { return {}; }
    auto const last = contentType.find_last_not_of(Whitespace);
    return contentType.substr(first, last - first + 1);
}

//----------------------------------------------------------------------------------------------------------------------
