#pragma once

#include "atsa/detectors/ioutlier_detector.hpp"

#include <memory>

namespace atsa::detectors {

class ZScoreDetectorBuilder;

/**
 * @class ZScoreDetector
 * @brief Flags values whose robust z-score exceeds a threshold.
 *
 * The score is the modified z-score 0.6745 * |x - median| / MAD, which a
 * single extreme value cannot mask. When the MAD is zero (more than half the
 * values are identical) the classic |x - mean| / std score is used instead.
 */
class ZScoreDetector final : public IOutlierDetector {
public:
	friend class ZScoreDetectorBuilder;

	OutlierResult detect(const core::TimeSeries &ts) override;
	std::string getName() const override {
		return "ZScoreDetector";
	}

	double threshold() const {
		return threshold_;
	}

private:
	explicit ZScoreDetector(double threshold);

	double threshold_;
};

class ZScoreDetectorBuilder {
public:
	ZScoreDetectorBuilder &withThreshold(double threshold);

	std::unique_ptr<ZScoreDetector> build();

private:
	double threshold_ = 3.0;
};

} // namespace atsa::detectors
