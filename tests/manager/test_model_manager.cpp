#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "atsa/core/errors.hpp"
#include "atsa/manager/model_manager.hpp"
#include "common/time_series_helpers.hpp"

#include <atomic>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace atsa::manager;
using atsa::data::DataInput;
using json = nlohmann::json;

namespace {

DataInput dailyInput(const std::vector<double> &values) {
	return {tests::helpers::makeDailyRecords(values), "value", std::string("date")};
}

DataInput undatedInput(const std::vector<double> &values) {
	std::vector<json> records;
	for (double v : values) {
		records.push_back({{"value", v}});
	}
	return {records, "value", std::nullopt};
}

ModelConfiguration configFor(const std::string &type, json parameters = json::object(), int periods = 5) {
	ModelConfiguration config;
	config.model_type = type;
	config.parameters = std::move(parameters);
	config.forecast_periods = periods;
	return config;
}

ForecastResult resultWithRmse(const std::string &type, double rmse) {
	ForecastResult result;
	result.model_type = type;
	result.metrics.rmse = rmse;
	result.metrics.mae = rmse;
	result.metrics.n = std::isnan(rmse) ? 0 : 10;
	if (std::isnan(rmse)) {
		result.metrics.error = "No valid data points for metric calculation";
	}
	return result;
}

} // namespace

TEST_CASE("Auto-selection follows the series length", "[manager][auto_select]") {
	REQUIRE(ModelManager::autoSelect(10).model_type == "arima");
	REQUIRE(ModelManager::autoSelect(23).model_type == "arima");
	REQUIRE(ModelManager::autoSelect(10).reason == "insufficient data for seasonal models");
	REQUIRE(ModelManager::autoSelect(24).model_type == "holt-winters");
	REQUIRE(ModelManager::autoSelect(49).model_type == "holt-winters");
	REQUIRE(ModelManager::autoSelect(49).parameters["seasonal_periods"] == 12);
	REQUIRE(ModelManager::autoSelect(50).model_type == "sarima");
	REQUIRE(ModelManager::autoSelect(50).parameters["seasonal_order"] == json({1, 1, 1, 12}));

	const ModelManager manager;
	auto input = dailyInput(tests::helpers::noise(30));
	input.records[0]["value"] = nullptr;
	input.records[1]["value"] = nullptr;
	// 28 usable observations.
	REQUIRE(manager.autoSelect(input).model_type == "holt-winters");
}

TEST_CASE("Validation rules per model type", "[manager][validate]") {
	const ModelManager manager;
	REQUIRE(manager.validate(configFor("arima")).ok);
	REQUIRE(manager.validate(configFor("arima")).message == "Parameters are valid");

	const auto unknown = manager.validate(configFor("gru"));
	REQUIRE_FALSE(unknown.ok);
	REQUIRE(unknown.message == "Unknown model type: gru");

	REQUIRE_FALSE(manager.validate(configFor("arima", {{"order", {1, 1}}})).ok);
	REQUIRE_FALSE(manager.validate(configFor("arima", {{"order", {1, -1, 1}}})).ok);
	REQUIRE(manager.validate(configFor("arima", {{"order", {1, 1}}})).message ==
	        "ARIMA order must be three non-negative integers (p, d, q)");

	REQUIRE(manager.validate(configFor("sarima", {{"order", {1, 0, 1}}, {"seasonal_order", {1, 1, 1, 4}}})).ok);
	REQUIRE_FALSE(manager.validate(configFor("sarima", {{"seasonal_order", {1, 1, 1}}})).ok);

	REQUIRE(manager.validate(configFor("holt-winters", {{"trend", nullptr}, {"seasonal", "mul"}})).ok);
	REQUIRE(manager.validate(configFor("holt-winters", {{"trend", "none"}, {"seasonal", "additive"}})).ok);
	REQUIRE_FALSE(manager.validate(configFor("holt-winters", {{"seasonal", nullptr}})).ok);
	REQUIRE_FALSE(manager.validate(configFor("holt-winters", {{"trend", "damped"}})).ok);

	REQUIRE(manager.validate(configFor("moving_average", {{"anything", 1}})).ok);
}

TEST_CASE("Forecast requests below the observation floor fail", "[manager][forecast]") {
	const ModelManager manager;
	REQUIRE_THROWS_AS(manager.fitAndForecast(dailyInput({1.0, 2.0, 3.0, 4.0, 5.0}), configFor("arima")),
	                  atsa::core::InsufficientDataError);
	REQUIRE_THROWS_AS(manager.fitAndForecast(dailyInput(tests::helpers::linearValues(20)), configFor("gru")),
	                  atsa::core::UnknownModelError);
	REQUIRE_THROWS_AS(
	    manager.fitAndForecast(dailyInput(tests::helpers::linearValues(20)), configFor("arima", {{"order", {1}}})),
	    atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(manager.fitAndForecast(dailyInput(tests::helpers::linearValues(20)),
	                                         configFor("moving_average", json::object(), 0)),
	                  atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(manager.fitAndForecast(DataInput {{}, "value", std::nullopt}, configFor("arima")),
	                  atsa::core::DataFormatError);
}

TEST_CASE("Moving average forecast through the manager", "[manager][forecast]") {
	const ModelManager manager;
	const auto values = tests::helpers::linearValues(20, 1.0, 1.0);
	const auto result = manager.fitAndForecast(dailyInput(values), configFor("moving_average", {{"window", 4}}, 3));

	REQUIRE(result.model_type == "moving_average");
	REQUIRE(result.forecast.size() == 3);
	REQUIRE(result.lower_bound.size() == 3);
	REQUIRE(result.upper_bound.size() == 3);
	REQUIRE(result.forecast_dates == std::vector<std::string> {"2020-01-21", "2020-01-22", "2020-01-23"});
	REQUIRE(result.fitted_values.size() == values.size());
	REQUIRE(result.forecast[0] == Catch::Approx(18.5));
	REQUIRE(result.confidence_interval == Catch::Approx(0.95));

	// Fitted value at t is the mean of the window ending at t, so the error is 1.5 everywhere it exists.
	REQUIRE(result.metrics.valid());
	REQUIRE(result.metrics.n == 17);
	REQUIRE(result.metrics.mae == Catch::Approx(1.5));
	REQUIRE(result.model_info["window"] == 4);
}

TEST_CASE("Holt-Winters forecast through the manager uses settings", "[manager][forecast]") {
	atsa::utils::Settings settings;
	settings.default_forecast_periods = 6;
	settings.default_confidence_interval = 0.8;
	const ModelManager manager(settings);

	ModelConfiguration config;
	config.model_type = "holt-winters";
	config.parameters = {{"seasonal_periods", 4}};
	const auto result = manager.fitAndForecast(dailyInput(tests::helpers::seasonalValues(32, 4)), config);
	REQUIRE(result.forecast.size() == 6);
	REQUIRE(result.forecast_dates.size() == 6);
	REQUIRE(result.confidence_interval == Catch::Approx(0.8));
	REQUIRE(result.metrics.valid());
}

TEST_CASE("Forecast dates fall back to period labels", "[manager][forecast][dates]") {
	const auto undated = tests::helpers::makeUndatedSeries(tests::helpers::linearValues(12));
	REQUIRE(ModelManager::forecastDates(undated, 2) == std::vector<std::string> {"Period 13", "Period 14"});

	const auto monthly = tests::helpers::makeMonthlySeries(tests::helpers::linearValues(12));
	REQUIRE(ModelManager::forecastDates(monthly, 2) == std::vector<std::string> {"2021-01-01", "2021-02-01"});
}

TEST_CASE("Metric calculation skips missing fitted values", "[manager][metrics]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	const auto metrics = ModelManager::calculateMetrics({1.0, 2.0, 3.0}, {nan, 2.0, 4.0});
	REQUIRE(metrics.n == 2);
	REQUIRE(metrics.mae == Catch::Approx(0.5));
	REQUIRE_FALSE(ModelManager::calculateMetrics({1.0}, {nan}).valid());
}

TEST_CASE("Comparison ranks by RMSE and keeps ties stable", "[manager][compare]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	const auto comparison = ModelManager::compare(
	    {resultWithRmse("sarima", 3.0), resultWithRmse("arima", 1.0), resultWithRmse("lstm", nan),
	     resultWithRmse("holt-winters", 1.0)});
	REQUIRE(comparison.models.size() == 4);
	REQUIRE(comparison.ranking == std::vector<std::string> {"arima", "holt-winters", "sarima"});
	REQUIRE(comparison.best_model.value() == "arima");

	REQUIRE_FALSE(ModelManager::compare({resultWithRmse("lstm", nan)}).best_model.has_value());
}

TEST_CASE("Comparing models records failures without aborting", "[manager][compare]") {
	const ModelManager manager;
	const auto input = undatedInput(tests::helpers::linearValues(20, 5.0, 0.5));
	const auto comparison = manager.compareModels(
	    input, {configFor("moving_average", {{"window", 3}}), configFor("gru"),
	            configFor("moving_average", {{"window", 30}})});

	REQUIRE(comparison.results.size() == 1);
	REQUIRE(comparison.results.front().forecast_dates.front() == "Period 21");
	REQUIRE(comparison.failures.size() == 2);
	REQUIRE(comparison.failures[0].model_type == "gru");
	REQUIRE(comparison.failures[0].error.code == atsa::core::ErrorCode::UnknownModel);
	REQUIRE(comparison.failures[1].error.code == atsa::core::ErrorCode::Fitting);
	REQUIRE(comparison.comparison.best_model.value() == "moving_average");
}

TEST_CASE("Available models mirror the registry", "[manager][catalog]") {
	const ModelManager manager({}, ModelRegistry(std::set<ModelType> {ModelType::Sarima}));
	const auto catalog = manager.availableModels();
	REQUIRE(catalog.size() == 1);
	REQUIRE(catalog.front().name == "SARIMA");
	REQUIRE_FALSE(manager.validate(configFor("arima")).ok);
}

TEST_CASE("Data analysis sections", "[manager][analyze]") {
	const ModelManager manager;

	const auto short_analysis = manager.analyzeData(dailyInput({1.0, 2.0, 3.0, 4.0, 5.0, 100.0}));
	REQUIRE(short_analysis.basic_stats.count == 6);
	REQUIRE(short_analysis.basic_stats.median == Catch::Approx(3.5));
	REQUIRE(short_analysis.outliers.value().indices == std::vector<std::size_t> {5});

	const auto tiny = manager.analyzeData(dailyInput({1.0, 2.0, 3.0, 4.0, 100.0}));
	REQUIRE_FALSE(tiny.stationarity.ok());
	REQUIRE(tiny.stationarity.error().code == atsa::core::ErrorCode::InsufficientData);
	REQUIRE_FALSE(short_analysis.decomposition.has_value());

	auto values = tests::helpers::seasonalValues(36, 12);
	const auto jitter = tests::helpers::noise(36);
	for (std::size_t i = 0; i < values.size(); ++i) {
		values[i] += jitter[i];
	}
	const auto long_analysis = manager.analyzeData(dailyInput(values));
	REQUIRE(long_analysis.outliers.ok());
	REQUIRE(long_analysis.stationarity.ok());
	REQUIRE(long_analysis.parameter_suggestions.ok());
	REQUIRE(long_analysis.decomposition.has_value());
	REQUIRE(long_analysis.decomposition->value().components.period == 12);
}

TEST_CASE("Data analysis screens stationarity with ADF alone", "[manager][analyze]") {
	const ModelManager manager;

	const auto white = manager.analyzeData(dailyInput(tests::helpers::noise(200)));
	const auto &check = white.stationarity.value();
	REQUIRE(check.is_stationary == (check.adf.pvalue < 0.05));
	REQUIRE(check.is_stationary);
	REQUIRE(check.recommendation == "Data is stationary");

	auto walk = tests::helpers::noise(200, 3);
	for (std::size_t i = 1; i < walk.size(); ++i) {
		walk[i] += walk[i - 1] + 0.5;
	}
	const auto trending = manager.analyzeData(dailyInput(walk));
	REQUIRE(trending.stationarity.ok());
	REQUIRE_FALSE(trending.stationarity.value().is_stationary);
	REQUIRE(trending.stationarity.value().recommendation == "Consider differencing the data");
}

TEST_CASE("Fractional integer parameters are rejected", "[manager][validate]") {
	const ModelManager manager;
	const auto input = dailyInput(tests::helpers::linearValues(30));

	REQUIRE_FALSE(manager.validate(configFor("arima", {{"order", {1.0, 1, 1}}})).ok);
	REQUIRE_THROWS_AS(manager.fitAndForecast(input, configFor("moving_average", {{"window", 12.5}})),
	                  atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(manager.fitAndForecast(input, configFor("holt-winters", {{"seasonal_periods", 4.5}})),
	                  atsa::core::InvalidParameterError);
}

TEST_CASE("Concurrent forecasts share one manager", "[manager][forecast][threads]") {
	const ModelManager manager;
	auto values = tests::helpers::linearValues(40, 1.0, 1.0);
	const auto jitter = tests::helpers::noise(40);
	for (std::size_t i = 0; i < values.size(); ++i) {
		values[i] += jitter[i];
	}
	const auto input = dailyInput(values);
	const auto config = configFor("moving_average", {{"window", 4}}, 3);
	const auto expected = manager.fitAndForecast(input, config);

	constexpr int kThreads = 12;
	std::atomic<bool> start {false};
	std::atomic<int> failures {0};
	std::vector<ForecastResult> results(kThreads);
	std::vector<std::thread> workers;
	for (int t = 0; t < kThreads; ++t) {
		workers.emplace_back([&, t] {
			while (!start.load()) {
				std::this_thread::yield();
			}
			const auto type = t % 2 == 0 ? std::string("moving_average") : std::string("arima");
			auto result = atsa::core::capture([&] {
				return manager.fitAndForecast(input, type == "arima" ? configFor("arima", json::object(), 3) : config);
			});
			if (result) {
				results[static_cast<std::size_t>(t)] = std::move(result.value());
			} else {
				++failures;
			}
		});
	}
	start = true;
	for (auto &worker : workers) {
		worker.join();
	}

	REQUIRE(failures.load() == 0);
	for (int t = 0; t < kThreads; t += 2) {
		const auto &result = results[static_cast<std::size_t>(t)];
		REQUIRE(result.forecast == expected.forecast);
		REQUIRE(result.forecast_dates == expected.forecast_dates);
	}
	for (int t = 1; t < kThreads; t += 2) {
		REQUIRE(results[static_cast<std::size_t>(t)].forecast.size() == 3);
	}
}
