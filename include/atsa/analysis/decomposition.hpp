#pragma once

#include <string>
#include <vector>

namespace atsa::analysis {

enum class DecompositionMode { Additive, Multiplicative };

/// Accepts "additive"/"add" and "multiplicative"/"mul". Throws InvalidParameterError otherwise.
DecompositionMode parseDecompositionMode(const std::string &name);
std::string toString(DecompositionMode mode);

/**
 * @struct Decomposition
 * @brief Trend, seasonal and residual components aligned with the input.
 */
struct Decomposition {
	std::vector<double> trend;
	std::vector<double> seasonal;
	std::vector<double> residual;
	int period = 0;
	DecompositionMode mode = DecompositionMode::Additive;
};

/**
 * @brief Classical moving-average decomposition.
 *
 * The trend is a centred moving average of length @p period (a 2 x m average
 * for even periods), linearly extrapolated over the half-window at both ends
 * from the nearest @p period trend points. Seasonal indices are the per-phase
 * means of the detrended series, centred to zero (additive) or one
 * (multiplicative).
 *
 * @throws core::InvalidParameterError If @p period < 2.
 * @throws core::InsufficientDataError If the series spans fewer than two full periods.
 * @throws core::FittingError If a multiplicative decomposition sees a non-positive value.
 */
Decomposition classicalDecompose(const std::vector<double> &values, int period,
                                 DecompositionMode mode = DecompositionMode::Additive);

} // namespace atsa::analysis
