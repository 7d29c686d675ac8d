#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace atsa::analysis {

/// Critical values keyed by significance label ("1%", "5%", ...), in the order reported.
using CriticalValues = std::vector<std::pair<std::string, double>>;

/**
 * @struct AdfResult
 * @brief Augmented Dickey-Fuller test with a constant (null: unit root).
 */
struct AdfResult {
	double statistic = 0.0;
	double pvalue = 1.0;
	std::size_t used_lag = 0;
	std::size_t nobs = 0;
	CriticalValues critical_values;
	/// p-value <= 0.05.
	bool is_stationary = false;
};

/**
 * @struct KpssResult
 * @brief KPSS level-stationarity test (null: stationary).
 */
struct KpssResult {
	double statistic = 0.0;
	/// Interpolated from the critical value table, hence clamped to [0.01, 0.1].
	double pvalue = 0.1;
	std::size_t lags = 0;
	CriticalValues critical_values;
	/// p-value > 0.05.
	bool is_stationary = false;
};

/**
 * @brief Runs the ADF regression of the first difference on the lagged level,
 * a constant and lagged differences.
 *
 * The lag count is chosen by AIC between 0 and ceil(12 (n/100)^(1/4)) (capped
 * at n/2 - 2). p-values and critical values follow MacKinnon (1994, 2010).
 * @throws core::InsufficientDataError If the series is too short for the regression.
 * @throws core::FittingError If the series is constant.
 */
AdfResult adfTest(const std::vector<double> &values);

/**
 * @brief KPSS statistic with Bartlett-weighted long-run variance and the
 * Hobijn et al. (1998) automatic bandwidth.
 * @throws core::FittingError If the series is constant.
 */
KpssResult kpssTest(const std::vector<double> &values);

/// MacKinnon approximate p-value for the constant-only ADF statistic.
double mackinnonPValue(double statistic);

/// Message for the four combinations of ADF and KPSS verdicts.
std::string stationarityRecommendation(bool adf_stationary, bool kpss_stationary);

} // namespace atsa::analysis
