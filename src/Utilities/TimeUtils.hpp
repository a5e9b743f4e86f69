//----------------------------------------------------------------------------------------------------------------------
// File: TimeUtils.hpp
// Description: Millisecond precision time helpers. Envelope timestamps travel as milliseconds since the unix epoch.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace TimeUtils {
//----------------------------------------------------------------------------------------------------------------------

using Timestamp = std::chrono::milliseconds;
using Timepoint = std::chrono::time_point<std::chrono::system_clock, Timestamp>;

Timepoint GetSystemTimepoint();
Timestamp TimepointToTimestamp(Timepoint const& time);
Timepoint TimestampToTimepoint(Timestamp const& timestamp);

//----------------------------------------------------------------------------------------------------------------------
} // TimeUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timepoint TimeUtils::GetSystemTimepoint()
{
    return std::chrono::time_point_cast<Timestamp>(std::chrono::system_clock::now());
}

//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timestamp TimeUtils::TimepointToTimestamp(Timepoint const& timepoint)
{
    return std::chrono::duration_cast<Timestamp>(timepoint.time_since_epoch());
}

//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timepoint TimeUtils::TimestampToTimepoint(Timestamp const& timestamp)
{
    return Timepoint{ timestamp };
}

//----------------------------------------------------------------------------------------------------------------------
