#pragma once

#include "atsa/detectors/ioutlier_detector.hpp"

#include <memory>

namespace atsa::detectors {

class IQRDetectorBuilder;

/**
 * @class IQRDetector
 * @brief Flags values outside [Q1 - k * IQR, Q3 + k * IQR].
 *
 * Quartiles use linear interpolation between order statistics.
 */
class IQRDetector final : public IOutlierDetector {
public:
	friend class IQRDetectorBuilder;

	OutlierResult detect(const core::TimeSeries &ts) override;
	std::string getName() const override {
		return "IQRDetector";
	}

	double multiplier() const {
		return multiplier_;
	}

private:
	explicit IQRDetector(double multiplier);

	double multiplier_;
};

class IQRDetectorBuilder {
public:
	/// Fence distance in interquartile ranges (Tukey's 1.5 by default).
	IQRDetectorBuilder &withMultiplier(double multiplier);

	std::unique_ptr<IQRDetector> build();

private:
	double multiplier_ = 1.5;
};

} // namespace atsa::detectors
