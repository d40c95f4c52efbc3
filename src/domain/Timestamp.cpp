/**
 * @file Timestamp.cpp
 * @brief Implementation of timestamp helpers.
 */

#include "domain/Timestamp.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace storykeep::domain {

namespace {

std::time_t ToUnixTime(std::tm& tm) {
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::string FormatWith(Timestamp timestamp, const char* format) {
    std::time_t tt = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm = ToUtcTime(tt);
    char buf[64];
    std::strftime(buf, sizeof(buf), format, &tm);
    return buf;
}

} // namespace

std::optional<Timestamp> ParseTimestamp(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return Timestamp(std::chrono::seconds(value.get<std::int64_t>()));
    }
    if (value.is_number_float()) {
        auto micros = static_cast<std::int64_t>(std::llround(value.get<double>() * 1e6));
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(micros)));
    }
    if (value.is_string()) {
        return ParseIsoTimestamp(value.get<std::string>());
    }
    return std::nullopt;
}

std::optional<Timestamp> ParseIsoTimestamp(const std::string& text) {
    std::tm tm = {};
    int consumed = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed);
    if (n != 6) return std::nullopt;

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    std::size_t pos = static_cast<std::size_t>(consumed);
    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        while (digits++ < 6) micros *= 10;
    }

    long offsetSeconds = 0;
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            int hours = 0;
            int minutes = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
                return std::nullopt;
            }
            offsetSeconds = (hours * 3600L + minutes * 60L) * (sign == '-' ? -1 : 1);
            pos = text.size();
        } else {
            return std::nullopt;
        }
    }

    std::time_t tt = ToUnixTime(tm) - offsetSeconds;
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(tt) + std::chrono::microseconds(micros)));
}

std::string FormatTimestamp(Timestamp timestamp) {
    return FormatWith(timestamp, "%Y-%m-%dT%H:%M:%S+00:00");
}

std::string FormatDateStamp(Timestamp timestamp) {
    return FormatWith(timestamp, "%Y%m%d");
}

} // namespace storykeep::domain
