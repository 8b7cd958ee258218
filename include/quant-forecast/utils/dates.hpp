#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace quantforecast::utils {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Parses a date or date-time string as UTC.
 *
 * Accepted layouts: YYYY-MM-DD, YYYY-MM-DD HH:MM:SS, YYYY-MM-DDTHH:MM:SS,
 * YYYY/MM/DD and MM/DD/YYYY. Surrounding whitespace is ignored.
 *
 * @return std::nullopt when the text matches none of the layouts or names an
 *         impossible calendar date, or a date outside the range a TimePoint
 *         can hold (roughly 1677-09-22 to 2262-04-10).
 */
std::optional<TimePoint> parseTimestamp(const std::string &text);

/// Formats the UTC calendar day of @p tp as YYYY-MM-DD.
std::string formatDate(const TimePoint &tp);

/// Builds a UTC time point from calendar fields.
/// @throws std::out_of_range when the date does not fit in a TimePoint.
TimePoint makeTimePoint(int year, unsigned month, unsigned day, int hour = 0, int minute = 0, int second = 0);

/// @throws std::out_of_range when the shifted date does not fit in a TimePoint.
TimePoint addDays(const TimePoint &tp, long long days);

} // namespace quantforecast::utils
