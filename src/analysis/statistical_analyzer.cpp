#include "atsa/analysis/statistical_analyzer.hpp"

#include "atsa/core/calendar.hpp"
#include "atsa/detectors/iqr.hpp"
#include "atsa/detectors/zscore.hpp"
#include "atsa/utils/logging.hpp"
#include "atsa/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace atsa::analysis {

namespace {

constexpr double kZScoreThreshold = 3.0;

std::vector<std::string> formatDates(const core::TimeSeries &ts) {
	std::vector<std::string> dates;
	dates.reserve(ts.getTimestamps().size());
	for (const auto &tp : ts.getTimestamps()) {
		dates.push_back(core::calendar::formatDate(tp));
	}
	return dates;
}

double meanOf(std::vector<double>::const_iterator first, std::vector<double>::const_iterator last) {
	return utils::stats::mean(std::vector<double>(first, last));
}

template <typename T>
void warnOnFailure(const core::Result<T> &section, const char *name) {
	if (!section.ok()) {
		ATSA_WARN("Comprehensive analysis section '{}' failed: {}", name, section.error().message);
	}
}

} // namespace

OutlierMethod parseOutlierMethod(const std::string &name) {
	if (name == "iqr" || name == "IQR") {
		return OutlierMethod::IQR;
	}
	if (name == "z_score" || name == "zscore" || name == "z-score") {
		return OutlierMethod::ZScore;
	}
	throw core::InvalidParameterError("Outlier method must be 'iqr' or 'z_score', got '" + name + "'.");
}

StationarityReport StatisticalAnalyzer::testStationarity(const core::TimeSeries &ts) const {
	if (ts.size() < kMinObservations) {
		throw core::InsufficientDataError("Insufficient data points for stationarity testing.");
	}
	StationarityReport report;
	report.adf = adfTest(ts.getValues());
	report.kpss = kpssTest(ts.getValues());
	report.is_stationary = report.adf.is_stationary && report.kpss.is_stationary;
	report.recommendation = stationarityRecommendation(report.adf.is_stationary, report.kpss.is_stationary);
	return report;
}

SeasonalityReport StatisticalAnalyzer::testSeasonality(const core::TimeSeries &ts) const {
	SeasonalityReport report;
	if (ts.size() < kMinSeasonalityObservations) {
		report.reason = "Insufficient data for seasonality testing (minimum 24 observations required)";
		return report;
	}

	for (int period : {4, 12, 24, 52}) {
		if (ts.size() < 2 * static_cast<std::size_t>(period)) {
			continue;
		}
		const auto decomposition = core::capture([&] { return classicalDecompose(ts.getValues(), period); });
		if (!decomposition) {
			ATSA_DEBUG("Skipping seasonal period {}: {}", period, decomposition.error().message);
			continue;
		}
		const double seasonal_var = utils::stats::variance(decomposition.value().seasonal);
		const double residual_var = utils::stats::variance(decomposition.value().residual);
		const double strength = residual_var > 0.0 ? seasonal_var / (seasonal_var + residual_var) : 0.0;
		report.periods.push_back({period, strength, strength > kSeasonalStrengthThreshold});
	}

	for (const auto &candidate : report.periods) {
		if (candidate.strength > report.seasonal_strength) {
			report.seasonal_strength = candidate.strength;
			report.seasonal_period = candidate.period;
		}
	}
	report.has_seasonality = report.seasonal_strength > kSeasonalStrengthThreshold;
	ATSA_DEBUG("Seasonality: strength {:.3f} at period {}", report.seasonal_strength,
	           report.seasonal_period.value_or(0));
	return report;
}

DecompositionReport StatisticalAnalyzer::decompose(const core::TimeSeries &ts, DecompositionMode mode,
                                                   std::optional<int> period) const {
	if (!period) {
		if (ts.size() >= 24) {
			period = 12;
		} else if (ts.size() >= 8) {
			period = 4;
		} else {
			throw core::InsufficientDataError("Insufficient data for decomposition.");
		}
	}
	DecompositionReport report;
	report.components = classicalDecompose(ts.getValues(), *period, mode);
	report.original = ts.getValues();
	report.dates = formatDates(ts);
	return report;
}

AcfPacfReport StatisticalAnalyzer::acfPacf(const core::TimeSeries &ts, std::size_t lags) const {
	if (ts.size() < kMinObservations) {
		throw core::InsufficientDataError("Insufficient data for ACF/PACF calculation.");
	}
	const std::size_t max_lags = std::min(lags, ts.size() - 1);
	return {autocorrelation(ts.getValues(), max_lags), partialAutocorrelation(ts.getValues(), max_lags)};
}

RollingStatistics StatisticalAnalyzer::rollingStatistics(const core::TimeSeries &ts, std::size_t window) const {
	if (window < 1) {
		throw core::InvalidParameterError("Rolling window must be at least 1.");
	}
	if (ts.size() < window) {
		throw core::InsufficientDataError("Insufficient data for window size " + std::to_string(window) + ".");
	}
	const auto &values = ts.getValues();
	const double nan = std::numeric_limits<double>::quiet_NaN();

	RollingStatistics stats;
	stats.window = window;
	stats.original = values;
	stats.dates = formatDates(ts);
	stats.rolling_mean.assign(values.size(), nan);
	stats.rolling_std.assign(values.size(), nan);
	for (std::size_t end = window; end <= values.size(); ++end) {
		const std::vector<double> slice(values.begin() + static_cast<std::ptrdiff_t>(end - window),
		                                values.begin() + static_cast<std::ptrdiff_t>(end));
		stats.rolling_mean[end - 1] = utils::stats::mean(slice);
		stats.rolling_std[end - 1] = utils::stats::stddev(slice, 1);
	}
	return stats;
}

OutlierReport StatisticalAnalyzer::detectOutliers(const core::TimeSeries &ts, OutlierMethod method) const {
	OutlierReport report;
	report.method = method;
	detectors::OutlierResult found;
	if (method == OutlierMethod::IQR) {
		found = detectors::IQRDetectorBuilder().build()->detect(ts);
		report.lower_bound = found.lower_bound;
		report.upper_bound = found.upper_bound;
	} else {
		found = detectors::ZScoreDetectorBuilder().withThreshold(kZScoreThreshold).build()->detect(ts);
		report.threshold = kZScoreThreshold;
	}
	report.indices = std::move(found.outlier_indices);
	report.values = std::move(found.outlier_values);
	return report;
}

ParameterSuggestions StatisticalAnalyzer::suggestParameters(const core::TimeSeries &ts) const {
	const auto &values = ts.getValues();
	const std::size_t n = values.size();
	if (n == 0) {
		throw core::InsufficientDataError("Parameter suggestion requires at least one observation.");
	}

	ParameterSuggestions suggestions;
	const auto edge = static_cast<std::ptrdiff_t>(std::min<std::size_t>(12, n));
	const double head = meanOf(values.begin(), values.begin() + edge);
	const double tail = meanOf(values.end() - edge, values.end());
	suggestions.has_trend = std::abs(tail - head) > 0.5 * utils::stats::stddev(values, 1);

	if (n >= kMinSeasonalityObservations) {
		const std::vector<int> candidates = n >= 52 ? std::vector<int> {7, 12, 24, 52} : std::vector<int> {7, 12};
		double min_variance = std::numeric_limits<double>::infinity();
		for (int period : candidates) {
			const auto p = static_cast<std::size_t>(period);
			if (n < 2 * p) {
				continue;
			}
			std::vector<double> phase_means(p, 0.0);
			std::vector<std::size_t> counts(p, 0);
			for (std::size_t i = 0; i < n; ++i) {
				phase_means[i % p] += values[i];
				++counts[i % p];
			}
			for (std::size_t k = 0; k < p; ++k) {
				phase_means[k] /= static_cast<double>(counts[k]);
			}
			const double variance = utils::stats::variance(phase_means, 1);
			if (variance < min_variance) {
				min_variance = variance;
				suggestions.seasonal_period = period;
			}
		}
		suggestions.has_seasonality = suggestions.seasonal_period.has_value();
	}

	// A degenerate ADF regression (e.g. an exact line) counts as non-stationary.
	const auto adf = core::capture([&] { return adfTest(values); });
	if (!adf) {
		ATSA_DEBUG("ADF test unavailable for parameter suggestion: {}", adf.error().message);
	}
	const bool adf_stationary = adf && adf.value().pvalue < 0.05;
	suggestions.arima.order = {1, adf_stationary ? 0 : 1, 1};
	suggestions.arima.reasoning = "Basic ARIMA configuration based on stationarity test";

	const bool seasonal = suggestions.has_seasonality.value_or(false);
	if (seasonal) {
		const int s = *suggestions.seasonal_period;
		ParameterSuggestions::Sarima sarima;
		sarima.seasonal_order = {1, 1, 1, s};
		sarima.reasoning = "SARIMA with seasonal period " + std::to_string(s);
		suggestions.sarima = sarima;
	}

	if (suggestions.has_trend) {
		suggestions.holt_winters.trend = "add";
	}
	if (seasonal) {
		suggestions.holt_winters.seasonal = "add";
	}
	suggestions.holt_winters.seasonal_periods = suggestions.seasonal_period.value_or(12);
	suggestions.holt_winters.reasoning = "Holt-Winters configuration based on trend and seasonality detection";
	return suggestions;
}

DataSummary StatisticalAnalyzer::summarize(const core::TimeSeries &ts, std::size_t missing_values) const {
	const auto &values = ts.getValues();
	if (values.empty()) {
		throw core::InsufficientDataError("Cannot summarize an empty series.");
	}
	const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
	DataSummary summary;
	summary.length = values.size();
	summary.mean = utils::stats::mean(values);
	summary.std = utils::stats::stddev(values, 1);
	summary.min = *min_it;
	summary.max = *max_it;
	summary.missing_values = missing_values + ts.countMissing();
	return summary;
}

ComprehensiveAnalysis StatisticalAnalyzer::comprehensiveAnalysis(const core::TimeSeries &ts,
                                                                 std::size_t missing_values) const {
	// Below four points the window is zero and the rolling section reports an error.
	const std::size_t window = std::min<std::size_t>(12, ts.size() / 4);
	ComprehensiveAnalysis analysis {summarize(ts, missing_values),
	                                core::capture([&] { return testStationarity(ts); }),
	                                core::capture([&] { return testSeasonality(ts); }),
	                                core::capture([&] { return acfPacf(ts, 20); }),
	                                core::capture([&] { return rollingStatistics(ts, window); })};
	warnOnFailure(analysis.stationarity, "stationarity");
	warnOnFailure(analysis.seasonality, "seasonality");
	warnOnFailure(analysis.acf_pacf, "acf_pacf");
	warnOnFailure(analysis.rolling_statistics, "rolling_statistics");
	return analysis;
}

ComprehensiveAnalysis StatisticalAnalyzer::comprehensiveAnalysis(const data::DataInput &input) const {
	const auto ts = data::TimeSeriesAdapter::build(input);
	return comprehensiveAnalysis(ts, data::TimeSeriesAdapter::countMissing(input));
}

} // namespace atsa::analysis
