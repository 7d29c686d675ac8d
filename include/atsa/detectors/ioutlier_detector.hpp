#pragma once

#include "atsa/core/time_series.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace atsa::detectors {

/**
 * @struct OutlierResult
 * @brief Holds the results of an outlier detection operation.
 */
struct OutlierResult {
	/// A vector of indices corresponding to the positions of outliers in the original series.
	std::vector<std::size_t> outlier_indices;
	/// Values at @c outlier_indices.
	std::vector<double> outlier_values;
	/// Acceptance range, for detectors that define one.
	std::optional<double> lower_bound;
	std::optional<double> upper_bound;
};

/**
 * @class IOutlierDetector
 * @brief An interface for all outlier detection algorithms.
 */
class IOutlierDetector {
public:
	virtual ~IOutlierDetector() = default;

	/**
	 * @brief Detects outliers in the given time series.
	 * @param ts The time series data to analyze.
	 * @return An OutlierResult object containing the indices of detected outliers.
	 */
	virtual OutlierResult detect(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Gets the name of the outlier detector.
	 * @return A string representing the detector's name.
	 */
	virtual std::string getName() const = 0;
};

} // namespace atsa::detectors
