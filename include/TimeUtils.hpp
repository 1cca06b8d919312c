#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

// Formats a wall-clock time in the local time zone using strftime-style Format
inline std::string FormatLocalTime(std::chrono::system_clock::time_point Time, const char* Format)
{
    std::time_t TimeT = std::chrono::system_clock::to_time_t(Time);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &TimeT);
#else
    localtime_r(&TimeT, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, Format);
    return Stream.str();
}

// Parses a time written by FormatLocalTime with the same Format, returns false on mismatch
inline bool ParseLocalTime(const std::string& Text, const char* Format, std::chrono::system_clock::time_point& Out)
{
    std::tm Local{};
    std::istringstream Stream(Text);
    Stream >> std::get_time(&Local, Format);
    if (Stream.fail())
    {
        return false;
    }

    Local.tm_isdst = -1;
    std::time_t TimeT = std::mktime(&Local);
    if (TimeT == static_cast<std::time_t>(-1))
    {
        return false;
    }

    Out = std::chrono::system_clock::from_time_t(TimeT);
    return true;
}
