#pragma once

#include "atsa/analysis/correlation.hpp"
#include "atsa/analysis/decomposition.hpp"
#include "atsa/analysis/stationarity.hpp"
#include "atsa/core/errors.hpp"
#include "atsa/core/time_series.hpp"
#include "atsa/data/time_series_adapter.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace atsa::analysis {

struct StationarityReport {
	AdfResult adf;
	KpssResult kpss;
	/// Both tests agree on stationarity.
	bool is_stationary = false;
	std::string recommendation;
};

struct PeriodStrength {
	int period = 0;
	double strength = 0.0;
	bool significant = false;
};

struct SeasonalityReport {
	bool has_seasonality = false;
	std::optional<int> seasonal_period;
	double seasonal_strength = 0.0;
	std::vector<PeriodStrength> periods;
	/// Set when the series is too short to test.
	std::optional<std::string> reason;
};

struct DecompositionReport {
	Decomposition components;
	std::vector<double> original;
	/// Formatted dates, empty for a series without a time index.
	std::vector<std::string> dates;
};

struct AcfPacfReport {
	Correlogram acf;
	Correlogram pacf;
};

struct RollingStatistics {
	std::vector<double> original;
	std::vector<double> rolling_mean;
	/// Sample standard deviation; NaN during the warm-up window.
	std::vector<double> rolling_std;
	std::vector<std::string> dates;
	std::size_t window = 0;
};

enum class OutlierMethod { IQR, ZScore };

/// Accepts "iqr" and "z_score"/"zscore". Throws InvalidParameterError otherwise.
OutlierMethod parseOutlierMethod(const std::string &name);

struct OutlierReport {
	OutlierMethod method = OutlierMethod::IQR;
	std::vector<std::size_t> indices;
	std::vector<double> values;
	std::optional<double> lower_bound;
	std::optional<double> upper_bound;
	std::optional<double> threshold;

	std::size_t count() const {
		return indices.size();
	}
};

struct ParameterSuggestions {
	bool has_trend = false;
	/// Present only for series long enough to search for a period.
	std::optional<bool> has_seasonality;
	std::optional<int> seasonal_period;

	struct Arima {
		std::array<int, 3> order {1, 1, 1};
		std::string reasoning;
	} arima;

	struct Sarima {
		std::array<int, 3> order {1, 1, 1};
		std::array<int, 4> seasonal_order {1, 1, 1, 12};
		std::string reasoning;
	};
	std::optional<Sarima> sarima;

	struct HoltWinters {
		std::optional<std::string> trend;
		std::optional<std::string> seasonal;
		int seasonal_periods = 12;
		std::string reasoning;
	} holt_winters;
};

struct DataSummary {
	std::size_t length = 0;
	double mean = 0.0;
	double std = 0.0;
	double min = 0.0;
	double max = 0.0;
	std::size_t missing_values = 0;
};

/**
 * @struct ComprehensiveAnalysis
 * @brief Summary plus independently computed diagnostics; a failed section
 * holds its error instead of a value.
 */
struct ComprehensiveAnalysis {
	DataSummary data_summary;
	core::Result<StationarityReport> stationarity;
	core::Result<SeasonalityReport> seasonality;
	core::Result<AcfPacfReport> acf_pacf;
	core::Result<RollingStatistics> rolling_statistics;
};

/**
 * @class StatisticalAnalyzer
 * @brief Diagnostic routines over a univariate series.
 *
 * Every routine is a pure function of its inputs. Failures are thrown as
 * core::Error subclasses; comprehensiveAnalysis() isolates them per section.
 */
class StatisticalAnalyzer {
public:
	/// Minimum length for the stationarity tests and correlograms.
	static constexpr std::size_t kMinObservations = 10;
	static constexpr std::size_t kMinSeasonalityObservations = 24;
	static constexpr double kSeasonalStrengthThreshold = 0.1;

	/// ADF and KPSS with a combined verdict.
	StationarityReport testStationarity(const core::TimeSeries &ts) const;

	/// Seasonal strength for the candidate periods 4, 12, 24 and 52.
	SeasonalityReport testSeasonality(const core::TimeSeries &ts) const;

	/**
	 * @param period Defaults to 12 for series of 24 or more points, else 4.
	 */
	DecompositionReport decompose(const core::TimeSeries &ts, DecompositionMode mode = DecompositionMode::Additive,
	                              std::optional<int> period = std::nullopt) const;

	/// Lags are capped at length - 1.
	AcfPacfReport acfPacf(const core::TimeSeries &ts, std::size_t lags = 40) const;

	RollingStatistics rollingStatistics(const core::TimeSeries &ts, std::size_t window = 12) const;

	OutlierReport detectOutliers(const core::TimeSeries &ts, OutlierMethod method = OutlierMethod::IQR) const;

	ParameterSuggestions suggestParameters(const core::TimeSeries &ts) const;

	/// Summary statistics with the sample standard deviation.
	DataSummary summarize(const core::TimeSeries &ts, std::size_t missing_values = 0) const;

	ComprehensiveAnalysis comprehensiveAnalysis(const core::TimeSeries &ts, std::size_t missing_values = 0) const;

	/// Adapts @p input first; missing value cells are counted in the summary.
	ComprehensiveAnalysis comprehensiveAnalysis(const data::DataInput &input) const;
};

} // namespace atsa::analysis
