#include "atsa/detectors/iqr.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/logging.hpp"
#include "atsa/utils/statistics.hpp"

#include <cmath>

namespace atsa::detectors {

IQRDetector::IQRDetector(double multiplier) : multiplier_(multiplier) {
	if (!(multiplier_ > 0.0)) {
		throw core::InvalidParameterError("IQR multiplier must be positive.");
	}
}

OutlierResult IQRDetector::detect(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	const auto finite = utils::stats::dropNaN(values);
	if (finite.empty()) {
		ATSA_WARN("IQRDetector received no observations. Returning no outliers.");
		return {};
	}

	const double q1 = utils::stats::quantile(finite, 0.25);
	const double q3 = utils::stats::quantile(finite, 0.75);
	const double iqr = q3 - q1;

	OutlierResult result;
	result.lower_bound = q1 - multiplier_ * iqr;
	result.upper_bound = q3 + multiplier_ * iqr;
	for (std::size_t i = 0; i < values.size(); ++i) {
		const double v = values[i];
		if (std::isnan(v)) {
			continue;
		}
		if (v < *result.lower_bound || v > *result.upper_bound) {
			result.outlier_indices.push_back(i);
			result.outlier_values.push_back(v);
		}
	}

	ATSA_DEBUG("IQRDetector bounds [{}, {}] found {} outliers.", *result.lower_bound, *result.upper_bound,
	           result.outlier_indices.size());
	return result;
}

IQRDetectorBuilder &IQRDetectorBuilder::withMultiplier(double multiplier) {
	multiplier_ = multiplier;
	return *this;
}

std::unique_ptr<IQRDetector> IQRDetectorBuilder::build() {
	return std::unique_ptr<IQRDetector>(new IQRDetector(multiplier_));
}

} // namespace atsa::detectors
