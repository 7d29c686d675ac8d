#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "atsa/core/errors.hpp"
#include "atsa/models/prophet.hpp"
#include "common/time_series_helpers.hpp"

#include <cmath>
#include <vector>

using atsa::models::Prophet;

TEST_CASE("Prophet validates options", "[models][prophet][validation]") {
	Prophet::Options options;
	options.changepoint_range = 0.0;
	REQUIRE_THROWS_AS(Prophet(options), atsa::core::InvalidParameterError);

	options = {};
	options.changepoint_prior_scale = -1.0;
	REQUIRE_THROWS_AS(Prophet(options), atsa::core::InvalidParameterError);

	Prophet model(Prophet::Options {});
	REQUIRE_THROWS_AS(model.predict(5), atsa::core::StateError);
	REQUIRE_THROWS_AS(model.fit(tests::helpers::makeUnivariateSeries({1.0})), atsa::core::FittingError);
}

TEST_CASE("Prophet captures a linear trend on daily data", "[models][prophet][forecast]") {
	const auto values = tests::helpers::linearValues(90, 20.0, 0.5);
	auto ts = tests::helpers::makeUnivariateSeries(values);

	Prophet::Options options;
	options.uncertainty_samples = 200;
	Prophet model(options);
	model.fit(ts);

	const auto forecast = model.predict(10);
	REQUIRE(forecast.horizon() == 10);
	REQUIRE(forecast.lower.size() == 10);
	REQUIRE(forecast.upper.size() == 10);
	for (std::size_t i = 0; i < 10; ++i) {
		const double expected = 20.0 + 0.5 * static_cast<double>(90 + i);
		REQUIRE(forecast.point[i] == Catch::Approx(expected).margin(2.0));
		REQUIRE(forecast.lower[i] <= forecast.upper[i]);
	}

	REQUIRE(model.futureTimestamps().size() == 10);
	REQUIRE(atsa::core::calendar::formatDate(model.futureTimestamps().front()) == "2020-03-31");

	const auto fitted = model.fittedValues();
	REQUIRE(fitted.size() == values.size());

	const auto info = model.modelInfo();
	REQUIRE(info["growth"] == "linear");
	REQUIRE(info["synthetic_dates"] == false);
	// 90 daily points enable weekly seasonality but not yearly.
	REQUIRE(model.seasonalities().size() == 1);
	REQUIRE(model.seasonalities().front().name == "weekly");
}

TEST_CASE("Prophet recovers a weekly pattern", "[models][prophet][seasonality]") {
	const auto values = tests::helpers::seasonalValues(84, 7, 5.0, 50.0, 0.0);
	Prophet::Options options;
	options.uncertainty_samples = 0;
	Prophet model(options);
	model.fit(tests::helpers::makeUnivariateSeries(values));

	const auto forecast = model.predict(7);
	for (std::size_t i = 0; i < 7; ++i) {
		const double expected = tests::helpers::seasonalValues(84 + i + 1, 7, 5.0, 50.0, 0.0).back();
		REQUIRE(forecast.point[i] == Catch::Approx(expected).margin(1.0));
		REQUIRE(forecast.lower[i] == forecast.point[i]);
	}
}

TEST_CASE("Prophet assigns synthetic dates to undated series", "[models][prophet][dates]") {
	Prophet model(Prophet::Options {});
	model.fit(tests::helpers::makeUndatedSeries(tests::helpers::linearValues(30)));
	model.predict(2);
	REQUIRE(model.modelInfo()["synthetic_dates"] == true);
	REQUIRE(atsa::core::calendar::formatDate(model.futureTimestamps().front()) == "2020-01-31");
}
