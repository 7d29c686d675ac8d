#include <catch2/catch_test_macros.hpp>

#include "atsa/core/calendar.hpp"

#include <chrono>
#include <vector>

using namespace atsa::core::calendar;

namespace {

TimePoint date(int year, unsigned month, unsigned day) {
	return fromEpochSeconds(static_cast<double>(daysFromCivil(year, month, day)) * 86400.0);
}

} // namespace

TEST_CASE("Civil date conversion round trips known days", "[core][calendar]") {
	REQUIRE(daysFromCivil(1970, 1, 1) == 0);
	REQUIRE(daysFromCivil(2020, 1, 1) == 18262);
	const auto civil = civilFromDays(18262 + 59);
	REQUIRE(civil.year == 2020);
	REQUIRE(civil.month == 2);
	REQUIRE(civil.day == 29);
	REQUIRE(daysInMonth(2020, 2) == 29);
	REQUIRE(daysInMonth(2021, 2) == 28);
	REQUIRE(daysInMonth(2021, 4) == 30);
}

TEST_CASE("parseTimestamp accepts date and datetime forms", "[core][calendar][parse]") {
	const auto expected = date(2023, 3, 15);
	REQUIRE(parseTimestamp("2023-03-15") == expected);
	REQUIRE(parseTimestamp("2023/03/15") == expected);
	REQUIRE(parseTimestamp("2023-03-15T00:00:00Z") == expected);
	REQUIRE(parseTimestamp("2023-03-15 06:30") == expected + std::chrono::minutes {390});
	REQUIRE(parseTimestamp("2023-03") == date(2023, 3, 1));

	REQUIRE_FALSE(parseTimestamp("").has_value());
	REQUIRE_FALSE(parseTimestamp("not a date").has_value());
	REQUIRE_FALSE(parseTimestamp("2023-13-01").has_value());
}

TEST_CASE("formatDate renders ISO dates", "[core][calendar]") {
	REQUIRE(formatDate(date(2024, 2, 29)) == "2024-02-29");
	REQUIRE(formatDate(fromEpochSeconds(0.0)) == "1970-01-01");
}

TEST_CASE("inferStep detects fixed spacing", "[core][calendar][step]") {
	std::vector<TimePoint> daily {date(2020, 1, 1), date(2020, 1, 2), date(2020, 1, 3)};
	const auto step = inferStep(daily);
	REQUIRE(step.has_value());
	REQUIRE(step->kind == TimeStep::Kind::Fixed);
	REQUIRE(step->fixed == std::chrono::hours {24});
	REQUIRE(formatDate(step->advance(daily.back(), 2)) == "2020-01-05");
}

TEST_CASE("inferStep detects calendar months", "[core][calendar][step]") {
	std::vector<TimePoint> monthly {date(2020, 1, 1), date(2020, 2, 1), date(2020, 3, 1)};
	const auto step = inferStep(monthly);
	REQUIRE(step.has_value());
	REQUIRE(step->kind == TimeStep::Kind::Months);
	REQUIRE(step->months == 1);
	REQUIRE(formatDate(step->advance(monthly.back(), 1)) == "2020-04-01");
	REQUIRE(formatDate(step->advance(monthly.back(), 10)) == "2021-01-01");

	std::vector<TimePoint> month_end {date(2021, 1, 31), date(2021, 2, 28), date(2021, 3, 31)};
	const auto end_step = inferStep(month_end);
	REQUIRE(end_step.has_value());
	REQUIRE(end_step->month_end);
	REQUIRE(formatDate(end_step->advance(month_end.back(), 1)) == "2021-04-30");

	std::vector<TimePoint> quarterly {date(2021, 1, 1), date(2021, 4, 1), date(2021, 7, 1)};
	REQUIRE(inferStep(quarterly)->months == 3);
}

TEST_CASE("inferStep rejects irregular spacing", "[core][calendar][step]") {
	std::vector<TimePoint> irregular {date(2020, 1, 1), date(2020, 1, 2), date(2020, 1, 5)};
	REQUIRE_FALSE(inferStep(irregular).has_value());
	REQUIRE_FALSE(inferStep({date(2020, 1, 1)}).has_value());
}
