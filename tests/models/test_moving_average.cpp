#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "atsa/core/errors.hpp"
#include "atsa/models/moving_average.hpp"
#include "common/time_series_helpers.hpp"

#include <cmath>
#include <vector>

using atsa::models::MovingAverageBuilder;

TEST_CASE("Moving average builder validates window", "[models][moving_average][builder]") {
	REQUIRE(MovingAverageBuilder().build()->window() == 12);
	REQUIRE_THROWS_AS(MovingAverageBuilder().withWindow(0).build(), atsa::core::InvalidParameterError);

	auto model = MovingAverageBuilder().withWindow(3).build();
	REQUIRE(model->getName() == "MovingAverage");
}

TEST_CASE("Moving average requires sufficient history", "[models][moving_average]") {
	auto ts = tests::helpers::makeUnivariateSeries({1.0, 2.0});
	auto model = MovingAverageBuilder().withWindow(3).build();
	REQUIRE_THROWS_AS(model->predict(1), atsa::core::StateError);
	REQUIRE_THROWS_AS(model->fit(ts), atsa::core::FittingError);
	REQUIRE_THROWS_AS(model->fittedValues(), atsa::core::StateError);
}

TEST_CASE("Moving average forecasts the trailing mean", "[models][moving_average][forecast]") {
	auto ts = tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0, 4.0, 5.0});
	auto model = MovingAverageBuilder().withWindow(3).build();
	model->fit(ts);

	const auto forecast = model->predict(4);
	REQUIRE(forecast.horizon() == 4);
	REQUIRE(forecast.lower.size() == 4);
	REQUIRE(forecast.upper.size() == 4);
	for (std::size_t i = 0; i < 4; ++i) {
		REQUIRE(forecast.point[i] == Catch::Approx(4.0));
		// Sample std of {3, 4, 5} is 1.
		REQUIRE(forecast.upper[i] - forecast.point[i] == Catch::Approx(1.959964).margin(1e-4));
		REQUIRE(forecast.lower[i] <= forecast.point[i]);
	}
}

TEST_CASE("Moving average fitted values align with the input", "[models][moving_average][fitted]") {
	auto ts = tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0, 4.0, 5.0});
	auto model = MovingAverageBuilder().withWindow(3).build();
	model->fit(ts);

	const auto fitted = model->fittedValues();
	REQUIRE(fitted.size() == 5);
	REQUIRE(std::isnan(fitted[0]));
	REQUIRE(std::isnan(fitted[1]));
	REQUIRE(fitted[2] == Catch::Approx(2.0));
	REQUIRE(fitted[4] == Catch::Approx(4.0));

	const auto info = model->modelInfo();
	REQUIRE(info["window"] == 3);
}

TEST_CASE("Moving average interval collapses on a constant window", "[models][moving_average][forecast]") {
	auto ts = tests::helpers::makeUnivariateSeries(std::vector<double>(12, 7.0));
	auto model = MovingAverageBuilder().withWindow(12).build();
	model->fit(ts);

	const auto forecast = model->predict(3);
	for (std::size_t i = 0; i < 3; ++i) {
		REQUIRE(forecast.point[i] == Catch::Approx(7.0));
		REQUIRE(forecast.lower[i] == Catch::Approx(7.0));
		REQUIRE(forecast.upper[i] == Catch::Approx(7.0));
	}
	REQUIRE(model->predict(0).empty());
	REQUIRE_THROWS_AS(model->predict(-1), atsa::core::InvalidParameterError);
}
