#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "atsa/core/errors.hpp"
#include "atsa/models/holt_winters.hpp"
#include "common/time_series_helpers.hpp"

#include <cmath>
#include <vector>

using atsa::models::HoltWinters;
using Component = HoltWinters::Component;

TEST_CASE("Holt-Winters parses component names", "[models][holt_winters][parse]") {
	REQUIRE(HoltWinters::parseComponent("add") == Component::Additive);
	REQUIRE(HoltWinters::parseComponent("additive") == Component::Additive);
	REQUIRE(HoltWinters::parseComponent("mul") == Component::Multiplicative);
	REQUIRE(HoltWinters::parseComponent("multiplicative") == Component::Multiplicative);
	REQUIRE(HoltWinters::parseComponent("none") == Component::None);
	REQUIRE(HoltWinters::parseComponent("") == Component::None);
	REQUIRE_THROWS_AS(HoltWinters::parseComponent("damped"), atsa::core::InvalidParameterError);
	REQUIRE(HoltWinters::toString(Component::Multiplicative) == "multiplicative");
}

TEST_CASE("Holt-Winters validates configuration and length", "[models][holt_winters][validation]") {
	REQUIRE_THROWS_AS(HoltWinters(Component::Additive, Component::Additive, 1), atsa::core::InvalidParameterError);

	HoltWinters model(Component::Additive, Component::Additive, 12);
	REQUIRE_THROWS_AS(model.predict(1), atsa::core::StateError);
	auto short_series = tests::helpers::makeMonthlySeries(tests::helpers::seasonalValues(20, 12));
	REQUIRE_THROWS_AS(model.fit(short_series), atsa::core::FittingError);

	HoltWinters multiplicative(Component::None, Component::Multiplicative, 4);
	std::vector<double> with_zero(16, 5.0);
	with_zero[3] = 0.0;
	REQUIRE_THROWS_AS(multiplicative.fit(tests::helpers::makeUnivariateSeries(with_zero)), atsa::core::FittingError);
}

TEST_CASE("Holt-Winters additive seasonal forecast", "[models][holt_winters][forecast]") {
	const auto values = tests::helpers::seasonalValues(48, 12, 8.0, 100.0, 0.5);
	auto ts = tests::helpers::makeMonthlySeries(values);

	HoltWinters model(Component::Additive, Component::Additive, 12);
	model.fit(ts);

	REQUIRE(model.alpha() > 0.0);
	REQUIRE(model.alpha() < 1.0);

	const auto forecast = model.predict(12);
	REQUIRE(forecast.horizon() == 12);
	REQUIRE(forecast.lower.size() == 12);
	REQUIRE(forecast.upper.size() == 12);
	for (std::size_t h = 0; h < 12; ++h) {
		const double expected = tests::helpers::seasonalValues(48 + h + 1, 12, 8.0, 100.0, 0.5).back();
		REQUIRE(forecast.point[h] == Catch::Approx(expected).margin(2.0));
		REQUIRE(forecast.lower[h] <= forecast.point[h]);
		REQUIRE(forecast.upper[h] >= forecast.point[h]);
	}

	const auto fitted = model.fittedValues();
	REQUIRE(fitted.size() == values.size());
	REQUIRE(model.residuals().size() == values.size());

	const auto info = model.modelInfo();
	REQUIRE(info["trend"] == "additive");
	REQUIRE(info["seasonal"] == "additive");
	REQUIRE(info["seasonal_periods"] == 12);
}

TEST_CASE("Holt-Winters without seasonality tracks a trend", "[models][holt_winters][forecast]") {
	const auto values = tests::helpers::linearValues(20, 10.0, 2.0);
	HoltWinters model(Component::Additive, Component::None, 0);
	model.fit(tests::helpers::makeUnivariateSeries(values));

	const auto forecast = model.predict(3);
	REQUIRE(forecast.point[0] == Catch::Approx(50.0).margin(1.0));
	REQUIRE(forecast.point[2] == Catch::Approx(54.0).margin(1.5));
	REQUIRE(model.modelInfo()["seasonal_periods"].is_null());
}
