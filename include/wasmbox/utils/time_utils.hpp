/**
 * @file time_utils.hpp
 * @brief ISO-8601 UTC timestamp formatting and parsing
 *
 * Session metadata stores timestamps as text such as
 * `2025-03-01T12:00:00.123456Z`. Parsing also accepts an explicit `+00:00`
 * offset and timestamps without fractional seconds.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace wasmbox {
namespace utils {

class TimeUtils {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Format a time point as UTC with microsecond precision
     */
    static std::string ToIso8601(TimePoint tp);

    /**
     * @brief Current time formatted by ToIso8601
     */
    static std::string NowIso8601();

    /**
     * @brief Parse an ISO-8601 UTC timestamp
     * @return std::nullopt for malformed text or a non-UTC offset
     */
    static std::optional<TimePoint> ParseIso8601(const std::string& text);
};

} // namespace utils
} // namespace wasmbox
