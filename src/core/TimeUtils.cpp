#include "core/TimeUtils.h"

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>

namespace core {

namespace {

// Howard Hinnant's days_from_civil.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) noexcept {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

bool readDigits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

}  // namespace

std::optional<domain::TimestampMs> TimeUtils::parseIso8601Ms(std::string_view text) {
    std::size_t pos = 0;
    int year{}, month{}, day{}, hour{}, minute{}, second{};
    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') || !readDigits(text, pos, 2, month) ||
        !expect(text, pos, '-') || !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
        ++pos;
        if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') || !readDigits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!readDigits(text, pos, 2, second)) {
                return std::nullopt;
            }
        }
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    int millis = 0;
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        int scale = 100;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            if (scale > 0) {
                millis += (text[pos] - '0') * scale;
                scale /= 10;
            }
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
    }

    std::int64_t offsetMinutes = 0;
    if (pos < text.size()) {
        const char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        }
        else if (sign == '+' || sign == '-') {
            ++pos;
            int offH{}, offM{};
            if (!readDigits(text, pos, 2, offH)) {
                return std::nullopt;
            }
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            if (!readDigits(text, pos, 2, offM)) {
                return std::nullopt;
            }
            offsetMinutes = static_cast<std::int64_t>(offH) * 60 + offM;
            if (sign == '-') {
                offsetMinutes = -offsetMinutes;
            }
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offsetMinutes * 60;
    return static_cast<domain::TimestampMs>(seconds * kMillisPerSecond + millis);
}

std::optional<domain::TimestampMs> TimeUtils::extractTimestamp(const boost::json::value& payload) {
    return extractTimestamp(payload, "timestamp");
}

std::optional<domain::TimestampMs> TimeUtils::extractTimestamp(const boost::json::value& payload, std::string_view path) {
    const boost::json::value* ts = &payload;
    while (!path.empty()) {
        const auto dot = path.find('.');
        const auto name = path.substr(0, dot);
        const auto* obj = ts->if_object();
        if (!obj || name.empty()) {
            return std::nullopt;
        }
        ts = obj->if_contains(boost::json::string_view(name.data(), name.size()));
        if (!ts) {
            return std::nullopt;
        }
        path = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);
    }
    if (ts == &payload) {
        return std::nullopt;
    }
    if (const auto* str = ts->if_string()) {
        return parseIso8601Ms(std::string_view(str->data(), str->size()));
    }

    double numeric = 0.0;
    if (const auto* i = ts->if_int64()) {
        numeric = static_cast<double>(*i);
    }
    else if (const auto* u = ts->if_uint64()) {
        numeric = static_cast<double>(*u);
    }
    else if (const auto* d = ts->if_double()) {
        numeric = *d;
    }
    else {
        return std::nullopt;
    }
    if (!std::isfinite(numeric) || numeric < 0) {
        return std::nullopt;
    }
    if (numeric < static_cast<double>(kSecondsEpochLimit)) {
        numeric *= static_cast<double>(kMillisPerSecond);
    }
    return static_cast<domain::TimestampMs>(std::llround(numeric));
}

std::string TimeUtils::formatDate(domain::TimestampMs ms) {
    std::int64_t days = ms / (kMillisPerHour * 24);
    if (ms < 0 && ms % (kMillisPerHour * 24) != 0) {
        --days;
    }
    std::int64_t year{};
    unsigned month{}, day{};
    civilFromDays(days, year, month, day);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", static_cast<long long>(year), month, day);
    return buffer;
}

domain::TimestampMs TimeUtils::wallClockMs() {
    return static_cast<domain::TimestampMs>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                std::chrono::system_clock::now().time_since_epoch())
                                                .count());
}

}  // namespace core
