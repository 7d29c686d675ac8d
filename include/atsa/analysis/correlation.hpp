#pragma once

#include <cstddef>
#include <vector>

namespace atsa::analysis {

/**
 * @struct Correlogram
 * @brief Correlation per lag 0..nlags with a 95% confidence band around each value.
 */
struct Correlogram {
	std::vector<double> values;
	std::vector<double> lower;
	std::vector<double> upper;

	std::size_t lags() const {
		return values.empty() ? 0 : values.size() - 1;
	}
};

/**
 * @brief Sample autocorrelation (biased autocovariance) up to @p nlags.
 *
 * The band uses Bartlett's formula: var(r_k) = (1 + 2 sum_{j<k} r_j^2) / n.
 */
Correlogram autocorrelation(const std::vector<double> &values, std::size_t nlags);

/**
 * @brief Partial autocorrelation by the Durbin-Levinson recursion on the
 * unbiased (n - k) autocovariances, with a +/- 1.96 / sqrt(n) band.
 */
Correlogram partialAutocorrelation(const std::vector<double> &values, std::size_t nlags);

} // namespace atsa::analysis
