#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/json/value.hpp>

#include "domain/Types.h"

namespace core {

namespace TimeUtils {
constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kSecondsPerMinute = 60;
constexpr std::int64_t kMillisPerMinute = kMillisPerSecond * kSecondsPerMinute;
constexpr std::int64_t kMillisPerHour = kMillisPerMinute * 60;
// Epoch values below this are treated as seconds.
constexpr std::int64_t kSecondsEpochLimit = 100'000'000'000;

// "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]"; naive values are UTC.
std::optional<domain::TimestampMs> parseIso8601Ms(std::string_view text);

// Reads an object's "timestamp" member (ISO-8601 string or epoch seconds/millis).
std::optional<domain::TimestampMs> extractTimestamp(const boost::json::value& payload);
// Same for a dotted member path such as "signal.created_at".
std::optional<domain::TimestampMs> extractTimestamp(const boost::json::value& payload, std::string_view path);

// "YYYY-MM-DD" in UTC.
std::string formatDate(domain::TimestampMs ms);

domain::TimestampMs wallClockMs();
}  // namespace TimeUtils

}  // namespace core
