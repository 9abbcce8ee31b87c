#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace core {
namespace utils {

    // Timestamp -> "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC)
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 with 'Z' or +HH:MM/-HH:MM offset
    Timestamp stringToTimestamp(const std::string& iso_string);

    std::int64_t toEpochMillis(const Timestamp& ts);
    Timestamp fromEpochMillis(std::int64_t millis);

    // Process-unique client order id, e.g. "sa-1718000000000-17"
    std::string generateClientOrderId(const Timestamp& ts);

    // Clamp helper used by the scoring code
    double clamp01(double value);

} // namespace utils
} // namespace core
