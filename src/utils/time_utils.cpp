/**
 * @file time_utils.cpp
 * @brief Implementation of ISO-8601 helpers
 *
 * @date 2025
 */

#include "wasmbox/utils/time_utils.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace wasmbox {
namespace utils {

std::string TimeUtils::ToIso8601(TimePoint tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs);
    if (micros.count() < 0) {
        secs -= std::chrono::seconds(1);
        micros += std::chrono::seconds(1);
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros.count() << 'Z';
    return oss.str();
}

std::string TimeUtils::NowIso8601() {
    return ToIso8601(std::chrono::system_clock::now());
}

std::optional<TimeUtils::TimePoint> TimeUtils::ParseIso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    long long micros = 0;

    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    std::string zone = text.substr(pos);
    if (!zone.empty() && zone != "Z" && zone != "+00:00" && zone != "-00:00") {
        return std::nullopt;
    }

    std::tm tm_utc{};
    tm_utc.tm_year = year - 1900;
    tm_utc.tm_mon = month - 1;
    tm_utc.tm_mday = day;
    tm_utc.tm_hour = hour;
    tm_utc.tm_min = minute;
    tm_utc.tm_sec = second;

    std::time_t t = timegm(&tm_utc);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(t) + std::chrono::microseconds(micros);
}

} // namespace utils
} // namespace wasmbox
