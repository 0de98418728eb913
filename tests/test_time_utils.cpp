#include <iostream>

#include <boost/json.hpp>

#include "TestSupport.h"
#include "core/TimeUtils.h"

using core::TimeUtils::extractTimestamp;
using core::TimeUtils::parseIso8601Ms;

int main() {
    FXS_CHECK(parseIso8601Ms("1970-01-01T00:00:00Z") == 0, "epoch");
    FXS_CHECK(parseIso8601Ms("2024-03-01T12:00:00Z") == 1709294400000LL, "utc instant");
    FXS_CHECK(parseIso8601Ms("2024-03-01T12:00:00") == 1709294400000LL, "naive values are UTC");
    FXS_CHECK(parseIso8601Ms("2024-03-01T21:00:00+09:00") == 1709294400000LL, "positive offset");
    FXS_CHECK(parseIso8601Ms("2024-03-01T07:00:00-0500") == 1709294400000LL, "compact negative offset");
    FXS_CHECK(parseIso8601Ms("2024-03-01T12:00:00.123456Z") == 1709294400123LL, "fraction truncated to millis");
    FXS_CHECK(parseIso8601Ms("2024-03-01 12:00") == 1709294400000LL, "space separator without seconds");
    FXS_CHECK(parseIso8601Ms("2024-02-29") == 1709164800000LL, "date only");

    FXS_CHECK(!parseIso8601Ms(""), "empty");
    FXS_CHECK(!parseIso8601Ms("2024-13-01T00:00:00Z"), "month out of range");
    FXS_CHECK(!parseIso8601Ms("2024-03-01T25:00:00Z"), "hour out of range");
    FXS_CHECK(!parseIso8601Ms("2024-03-01T12:00:00Zjunk"), "trailing characters");
    FXS_CHECK(!parseIso8601Ms("yesterday"), "not a date");

    FXS_CHECK(extractTimestamp(boost::json::parse(R"({"timestamp":"2024-03-01T12:00:00"})")) == 1709294400000LL,
              "string timestamp");
    FXS_CHECK(extractTimestamp(boost::json::parse(R"({"timestamp":1709294400})")) == 1709294400000LL,
              "epoch seconds");
    FXS_CHECK(extractTimestamp(boost::json::parse(R"({"timestamp":1709294400123})")) == 1709294400123LL,
              "epoch millis");
    FXS_CHECK(extractTimestamp(boost::json::parse(R"({"timestamp":1709294400.5})")) == 1709294400500LL,
              "fractional seconds");
    FXS_CHECK(!extractTimestamp(boost::json::parse(R"({"rate":1})")), "missing timestamp");
    FXS_CHECK(!extractTimestamp(boost::json::parse(R"({"timestamp":true})")), "wrong type");
    FXS_CHECK(!extractTimestamp(boost::json::parse("[1]")), "not an object");

    const auto signal = boost::json::parse(R"({"signal":{"created_at":"2024-03-01T12:00:00"},"last_updated":5})");
    FXS_CHECK(extractTimestamp(signal, "signal.created_at") == 1709294400000LL, "nested member path");
    FXS_CHECK(extractTimestamp(signal, "last_updated") == 5000LL, "top-level member path");
    FXS_CHECK(!extractTimestamp(signal, "signal.missing"), "missing nested member");
    FXS_CHECK(!extractTimestamp(signal, "last_updated.x"), "path through a scalar");
    FXS_CHECK(!extractTimestamp(signal, ""), "empty path");

    FXS_CHECK(core::TimeUtils::formatDate(1709294400000LL) == "2024-03-01", "format date");
    FXS_CHECK(core::TimeUtils::formatDate(0) == "1970-01-01", "format epoch");
    return 0;
}
