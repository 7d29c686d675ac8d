#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace atsa::utils {

/**
 * @struct AccuracyMetrics
 * @brief In-sample accuracy of fitted values against the observations.
 *
 * When no valid (actual, predicted) pair exists, @c error carries the reason
 * and the numeric fields stay NaN.
 */
struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	/// Percent; absent when every actual value is zero.
	std::optional<double> mape;
	std::size_t n = 0;
	std::optional<std::string> error;

	bool valid() const {
		return !error.has_value() && std::isfinite(rmse);
	}
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief Scores predictions against actuals of possibly different length.
	 *
	 * Both inputs are trimmed to their common prefix and pairs where either side
	 * is NaN are dropped before the individual metrics are computed.
	 */
	static AccuracyMetrics evaluate(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace atsa::utils
