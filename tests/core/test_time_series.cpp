#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "atsa/core/time_series.hpp"
#include "common/time_series_helpers.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

using atsa::core::TimeSeries;

TEST_CASE("TimeSeries validates its time index", "[core][time_series]") {
	auto stamps = tests::helpers::makeTimestamps(3);
	REQUIRE_THROWS_AS(TimeSeries(stamps, {1.0, 2.0}), std::invalid_argument);

	std::vector<TimeSeries::TimePoint> reversed {stamps[1], stamps[0]};
	REQUIRE_THROWS_AS(TimeSeries(reversed, {1.0, 2.0}), std::invalid_argument);

	std::vector<TimeSeries::TimePoint> duplicate {stamps[0], stamps[0]};
	REQUIRE_THROWS_AS(TimeSeries(duplicate, {1.0, 2.0}), std::invalid_argument);
}

TEST_CASE("TimeSeries without a time index", "[core][time_series]") {
	const TimeSeries ts({1.0, 2.0, 3.0});
	REQUIRE(ts.size() == 3);
	REQUIRE_FALSE(ts.hasTimeIndex());
	REQUIRE_FALSE(ts.inferStep().has_value());
	REQUIRE_FALSE(ts.medianSpacingDays().has_value());
	REQUIRE(ts[1] == 2.0);
}

TEST_CASE("TimeSeries reports spacing and missing values", "[core][time_series]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	auto ts = tests::helpers::makeUnivariateSeries({1.0, nan, 3.0, nan});
	REQUIRE(ts.countMissing() == 2);
	REQUIRE(ts.medianSpacingDays().value() == Catch::Approx(1.0));
	REQUIRE(ts.inferStep().has_value());
}

TEST_CASE("TimeSeries slices keep timestamps aligned", "[core][time_series][slice]") {
	auto ts = tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0, 4.0});
	const auto part = ts.slice(1, 3);
	REQUIRE(part.size() == 2);
	REQUIRE(part.getValues() == std::vector<double> {2.0, 3.0});
	REQUIRE(part.getTimestamps().front() == ts.getTimestamps()[1]);

	REQUIRE_THROWS_AS(ts.slice(3, 1), std::invalid_argument);
	REQUIRE_THROWS_AS(ts.slice(0, 5), std::out_of_range);
	REQUIRE(ts.slice(2, 2).isEmpty());
}
