#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace atsa::core::calendar {

using TimePoint = std::chrono::system_clock::time_point;

struct CivilDate {
	int year = 1970;
	unsigned month = 1;
	unsigned day = 1;
};

/// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(int year, unsigned month, unsigned day);

CivilDate civilFromDays(std::int64_t days);

unsigned daysInMonth(int year, unsigned month);

/**
 * @brief Parses a timestamp string.
 *
 * Accepts YYYY-MM-DD, YYYY/MM/DD, YYYY-MM and the ISO forms
 * YYYY-MM-DDTHH:MM[:SS][Z] and "YYYY-MM-DD HH:MM[:SS]". All times are UTC.
 */
std::optional<TimePoint> parseTimestamp(const std::string &text);

TimePoint fromEpochSeconds(double seconds);

/// Formats as %Y-%m-%d.
std::string formatDate(TimePoint tp);

/**
 * @struct TimeStep
 * @brief Regular spacing of a time index.
 *
 * Either a fixed duration or a whole number of calendar months (for monthly,
 * quarterly and yearly data whose fixed duration varies).
 */
struct TimeStep {
	enum class Kind { Fixed, Months };

	Kind kind = Kind::Fixed;
	std::chrono::seconds fixed {0};
	int months = 0;
	bool month_end = false;

	TimePoint advance(TimePoint from, int steps) const;
};

/// Detects a regular step, or std::nullopt when the spacing is irregular.
std::optional<TimeStep> inferStep(const std::vector<TimePoint> &timestamps);

} // namespace atsa::core::calendar
