#include "atsa/detectors/zscore.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/logging.hpp"
#include "atsa/utils/statistics.hpp"

#include <cmath>

namespace atsa::detectors {

namespace {
// 75th percentile of the standard normal; makes the MAD consistent with sigma.
constexpr double kMadScale = 0.6745;
} // namespace

ZScoreDetector::ZScoreDetector(double threshold) : threshold_(threshold) {
	if (!(threshold_ > 0.0)) {
		throw core::InvalidParameterError("Z-score threshold must be positive.");
	}
}

OutlierResult ZScoreDetector::detect(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	const auto finite = utils::stats::dropNaN(values);
	if (finite.size() < 2) {
		ATSA_WARN("ZScoreDetector requires at least 2 data points. Returning no outliers.");
		return {};
	}

	const double median = utils::stats::median(finite);
	std::vector<double> deviations;
	deviations.reserve(finite.size());
	for (double v : finite) {
		deviations.push_back(std::abs(v - median));
	}
	const double mad = utils::stats::median(deviations);

	double center = median;
	double scale = mad / kMadScale;
	if (mad == 0.0) {
		center = utils::stats::mean(finite);
		scale = utils::stats::stddev(finite);
		ATSA_DEBUG("Median absolute deviation is zero; using mean/std z-scores.");
	}

	OutlierResult result;
	if (scale == 0.0) {
		ATSA_INFO("Series is constant. No outliers will be detected.");
		return result;
	}
	for (std::size_t i = 0; i < values.size(); ++i) {
		const double v = values[i];
		if (std::isnan(v)) {
			continue;
		}
		if (std::abs(v - center) / scale > threshold_) {
			result.outlier_indices.push_back(i);
			result.outlier_values.push_back(v);
		}
	}

	ATSA_DEBUG("ZScoreDetector found {} outliers.", result.outlier_indices.size());
	return result;
}

ZScoreDetectorBuilder &ZScoreDetectorBuilder::withThreshold(double threshold) {
	threshold_ = threshold;
	return *this;
}

std::unique_ptr<ZScoreDetector> ZScoreDetectorBuilder::build() {
	return std::unique_ptr<ZScoreDetector>(new ZScoreDetector(threshold_));
}

} // namespace atsa::detectors
