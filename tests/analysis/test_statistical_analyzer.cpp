#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "atsa/analysis/statistical_analyzer.hpp"
#include "common/time_series_helpers.hpp"

#include <array>
#include <cmath>
#include <string>
#include <vector>

using namespace atsa::analysis;
using atsa::core::ErrorCode;

TEST_CASE("Stationarity report combines both tests", "[analysis][analyzer][stationarity]") {
	const StatisticalAnalyzer analyzer;
	REQUIRE_THROWS_AS(analyzer.testStationarity(tests::helpers::makeUnivariateSeries(tests::helpers::noise(9))),
	                  atsa::core::InsufficientDataError);

	const auto report = analyzer.testStationarity(tests::helpers::makeUnivariateSeries(tests::helpers::noise(200)));
	REQUIRE(report.adf.is_stationary);
	REQUIRE(report.kpss.is_stationary);
	REQUIRE(report.is_stationary);
	REQUIRE(report.recommendation == "Series appears to be stationary. Proceed with modeling.");
}

TEST_CASE("Seasonality needs enough observations", "[analysis][analyzer][seasonality]") {
	const StatisticalAnalyzer analyzer;
	const auto report = analyzer.testSeasonality(tests::helpers::makeUnivariateSeries(tests::helpers::noise(20)));
	REQUIRE_FALSE(report.has_seasonality);
	REQUIRE(report.reason.value() == "Insufficient data for seasonality testing (minimum 24 observations required)");
	REQUIRE(report.periods.empty());
}

TEST_CASE("Seasonality detects a monthly cycle", "[analysis][analyzer][seasonality]") {
	const StatisticalAnalyzer analyzer;
	auto values = tests::helpers::seasonalValues(48, 12, 10.0, 100.0, 0.2);
	const auto report = analyzer.testSeasonality(tests::helpers::makeMonthlySeries(values));
	REQUIRE(report.has_seasonality);
	REQUIRE(report.seasonal_strength > 0.1);
	REQUIRE(report.seasonal_period.has_value());
	REQUIRE((*report.seasonal_period == 12 || *report.seasonal_period == 24));
	// 48 points admit the periods 4, 12 and 24.
	REQUIRE(report.periods.size() == 3);
	REQUIRE_FALSE(report.reason.has_value());
}

TEST_CASE("Decompose picks a default period", "[analysis][analyzer][decomposition]") {
	const StatisticalAnalyzer analyzer;
	const auto monthly = analyzer.decompose(tests::helpers::makeMonthlySeries(tests::helpers::seasonalValues(30, 12)));
	REQUIRE(monthly.components.period == 12);
	REQUIRE(monthly.dates.size() == 30);
	REQUIRE(monthly.dates.front() == "2020-01-01");
	REQUIRE(monthly.original.size() == 30);

	const auto quarterly = analyzer.decompose(tests::helpers::makeUndatedSeries(tests::helpers::seasonalValues(10, 4)));
	REQUIRE(quarterly.components.period == 4);
	REQUIRE(quarterly.dates.empty());

	REQUIRE_THROWS_AS(analyzer.decompose(tests::helpers::makeUndatedSeries({1.0, 2.0, 3.0, 4.0, 5.0})),
	                  atsa::core::InsufficientDataError);
	REQUIRE_THROWS_AS(analyzer.decompose(tests::helpers::makeUndatedSeries(tests::helpers::noise(30)),
	                                     DecompositionMode::Additive, 20),
	                  atsa::core::InsufficientDataError);
}

TEST_CASE("ACF and PACF lags are capped by the series length", "[analysis][analyzer][correlation]") {
	const StatisticalAnalyzer analyzer;
	const auto report = analyzer.acfPacf(tests::helpers::makeUnivariateSeries(tests::helpers::noise(15)));
	REQUIRE(report.acf.values.size() == 15);
	REQUIRE(report.pacf.values.size() == 15);
	REQUIRE_THROWS_AS(analyzer.acfPacf(tests::helpers::makeUnivariateSeries(tests::helpers::noise(9))),
	                  atsa::core::InsufficientDataError);
}

TEST_CASE("Rolling statistics use a trailing window", "[analysis][analyzer][rolling]") {
	const StatisticalAnalyzer analyzer;
	const auto stats = analyzer.rollingStatistics(tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0, 4.0, 5.0}), 3);
	REQUIRE(stats.window == 3);
	REQUIRE(std::isnan(stats.rolling_mean[1]));
	REQUIRE(std::isnan(stats.rolling_std[1]));
	REQUIRE(stats.rolling_mean[2] == Catch::Approx(2.0));
	REQUIRE(stats.rolling_std[2] == Catch::Approx(1.0));
	REQUIRE(stats.rolling_mean[4] == Catch::Approx(4.0));
	REQUIRE(stats.dates.size() == 5);

	REQUIRE_THROWS_AS(analyzer.rollingStatistics(tests::helpers::makeUnivariateSeries({1.0, 2.0}), 3),
	                  atsa::core::InsufficientDataError);
	REQUIRE_THROWS_AS(analyzer.rollingStatistics(tests::helpers::makeUnivariateSeries({1.0, 2.0}), 0),
	                  atsa::core::InvalidParameterError);
}

TEST_CASE("Outlier detection through the analyzer", "[analysis][analyzer][outliers]") {
	const StatisticalAnalyzer analyzer;
	const auto ts = tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0, 4.0, 5.0, 100.0});

	const auto iqr = analyzer.detectOutliers(ts, parseOutlierMethod("iqr"));
	REQUIRE(iqr.count() == 1);
	REQUIRE(iqr.indices.front() == 5);
	REQUIRE(iqr.upper_bound.value() == Catch::Approx(8.5));
	REQUIRE_FALSE(iqr.threshold.has_value());

	const auto z = analyzer.detectOutliers(ts, parseOutlierMethod("z_score"));
	REQUIRE(z.method == OutlierMethod::ZScore);
	REQUIRE(z.values == std::vector<double> {100.0});
	REQUIRE(z.threshold.value() == Catch::Approx(3.0));

	REQUIRE_THROWS_AS(parseOutlierMethod("dbscan"), atsa::core::InvalidParameterError);
}

TEST_CASE("Parameter suggestions for short and long series", "[analysis][analyzer][suggestions]") {
	const StatisticalAnalyzer analyzer;

	const auto short_series = analyzer.suggestParameters(
	    tests::helpers::makeUnivariateSeries(tests::helpers::linearValues(15, 10.0, 2.0)));
	REQUIRE(short_series.has_trend);
	REQUIRE_FALSE(short_series.has_seasonality.has_value());
	REQUIRE_FALSE(short_series.sarima.has_value());
	REQUIRE(short_series.arima.order[1] == 1);
	REQUIRE(short_series.arima.reasoning == "Basic ARIMA configuration based on stationarity test");
	REQUIRE(short_series.holt_winters.trend.value() == "add");
	REQUIRE_FALSE(short_series.holt_winters.seasonal.has_value());
	REQUIRE(short_series.holt_winters.seasonal_periods == 12);

	const auto flat = analyzer.suggestParameters(tests::helpers::makeUnivariateSeries(tests::helpers::noise(60)));
	REQUIRE(flat.has_seasonality.value());
	REQUIRE(flat.sarima.has_value());
	REQUIRE(flat.sarima->seasonal_order[3] == *flat.seasonal_period);
	REQUIRE(flat.sarima->reasoning == "SARIMA with seasonal period " + std::to_string(*flat.seasonal_period));
	REQUIRE(flat.arima.order == std::array<int, 3> {1, 0, 1});
	REQUIRE(flat.holt_winters.seasonal.value() == "add");
}

TEST_CASE("Summary uses the sample standard deviation", "[analysis][analyzer][summary]") {
	const StatisticalAnalyzer analyzer;
	const auto summary = analyzer.summarize(tests::helpers::makeUnivariateSeries({2.0, 4.0, 6.0}), 2);
	REQUIRE(summary.length == 3);
	REQUIRE(summary.mean == Catch::Approx(4.0));
	REQUIRE(summary.std == Catch::Approx(2.0));
	REQUIRE(summary.min == 2.0);
	REQUIRE(summary.max == 6.0);
	REQUIRE(summary.missing_values == 2);
}

TEST_CASE("Comprehensive analysis isolates failing sections", "[analysis][analyzer][comprehensive]") {
	const StatisticalAnalyzer analyzer;

	const auto full = analyzer.comprehensiveAnalysis(
	    tests::helpers::makeMonthlySeries(tests::helpers::seasonalValues(48, 12)));
	REQUIRE(full.stationarity.ok());
	REQUIRE(full.seasonality.ok());
	REQUIRE(full.acf_pacf.ok());
	REQUIRE(full.acf_pacf.value().acf.lags() == 20);
	REQUIRE(full.rolling_statistics.value().window == 12);

	// A constant series breaks the tests but not the summary or rolling statistics.
	const auto constant = analyzer.comprehensiveAnalysis(tests::helpers::makeUnivariateSeries(std::vector<double>(16, 3.0)));
	REQUIRE(constant.data_summary.length == 16);
	REQUIRE_FALSE(constant.stationarity.ok());
	REQUIRE(constant.stationarity.error().code == ErrorCode::Fitting);
	REQUIRE_FALSE(constant.acf_pacf.ok());
	REQUIRE(constant.seasonality.value().reason.has_value());
	REQUIRE(constant.rolling_statistics.value().window == 4);
}

TEST_CASE("Comprehensive rolling window is a quarter of the series", "[analysis][analyzer][comprehensive]") {
	const StatisticalAnalyzer analyzer;

	const auto six = analyzer.comprehensiveAnalysis(tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0, 4.0, 5.0, 6.0}));
	REQUIRE(six.rolling_statistics.value().window == 1);
	REQUIRE(six.rolling_statistics.value().rolling_mean[0] == Catch::Approx(1.0));
	REQUIRE(std::isnan(six.rolling_statistics.value().rolling_std[0]));

	const auto three = analyzer.comprehensiveAnalysis(tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0}));
	REQUIRE(three.data_summary.length == 3);
	REQUIRE_FALSE(three.rolling_statistics.ok());
	REQUIRE(three.rolling_statistics.error().code == ErrorCode::InvalidParameter);
}

TEST_CASE("Comprehensive analysis from records counts missing cells", "[analysis][analyzer][comprehensive]") {
	const StatisticalAnalyzer analyzer;
	auto records = tests::helpers::makeDailyRecords(tests::helpers::noise(30));
	records[4]["value"] = nullptr;
	records[9].erase("value");

	const auto analysis = analyzer.comprehensiveAnalysis(atsa::data::DataInput {records, "value", std::string("date")});
	REQUIRE(analysis.data_summary.length == 28);
	REQUIRE(analysis.data_summary.missing_values == 2);
	REQUIRE(analysis.stationarity.ok());
}
