#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace MAESTRO
{
    /// @brief  The current UTC time formatted as ISO 8601 (2024-01-31T12:00:00Z)
    inline std::string CurrentTimestamp()
    {
        const auto CURRENT_TIME   = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm    CurrentTimeUTC = {};
        gmtime_r(&CURRENT_TIME, &CurrentTimeUTC);

        std::stringstream TimestampStream;
        TimestampStream << std::put_time(&CurrentTimeUTC, "%Y-%m-%dT%H:%M:%SZ");
        return TimestampStream.str();
    }
} // namespace MAESTRO
