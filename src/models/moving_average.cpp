#include "atsa/models/moving_average.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/statistics.hpp"

#include <cmath>
#include <limits>
#include <numeric>

namespace atsa::models {

MovingAverage::MovingAverage(int window) : window_(window) {
	if (window_ < 1) {
		throw core::InvalidParameterError("Moving average window must be at least 1.");
	}
}

void MovingAverage::fit(const core::TimeSeries &ts) {
	if (ts.isEmpty()) {
		throw core::FittingError("Cannot fit on empty time series.");
	}
	if (ts.size() < static_cast<std::size_t>(window_)) {
		throw core::FittingError("Time series size (" + std::to_string(ts.size()) +
		                         ") must be at least equal to the window size (" + std::to_string(window_) + ").");
	}
	history_ = ts.getValues();

	const std::vector<double> tail(history_.end() - window_, history_.end());
	last_mean_ = utils::stats::mean(tail);
	last_std_ = window_ > 1 ? utils::stats::stddev(tail, 1) : 0.0;
	is_fitted_ = true;
	ATSA_DEBUG("Moving average fitted with {} data points (window={}).", history_.size(), window_);
}

void MovingAverage::requireFitted(const char *operation) const {
	if (!is_fitted_) {
		throw core::StateError(std::string(operation) + " called before fit.");
	}
}

core::Forecast MovingAverage::predict(int horizon, double confidence) {
	requireFitted("predict");
	if (horizon < 0) {
		throw core::InvalidParameterError("Forecast horizon must be non-negative.");
	}
	const double margin = utils::stats::zForConfidence(confidence) * last_std_;
	core::Forecast forecast;
	forecast.confidence = confidence;
	forecast.reserve(static_cast<std::size_t>(horizon));
	for (int i = 0; i < horizon; ++i) {
		forecast.push(last_mean_, margin);
	}
	return forecast;
}

std::vector<double> MovingAverage::fittedValues() const {
	requireFitted("fittedValues");
	std::vector<double> fitted(history_.size(), std::numeric_limits<double>::quiet_NaN());
	double sum = std::accumulate(history_.begin(), history_.begin() + window_ - 1, 0.0);
	for (std::size_t t = static_cast<std::size_t>(window_ - 1); t < history_.size(); ++t) {
		sum += history_[t];
		fitted[t] = sum / window_;
		sum -= history_[t + 1 - static_cast<std::size_t>(window_)];
	}
	return fitted;
}

nlohmann::json MovingAverage::modelInfo() const {
	requireFitted("modelInfo");
	return {{"window", window_}, {"last_mean", last_mean_}, {"last_std", last_std_}};
}

MovingAverageBuilder &MovingAverageBuilder::withWindow(int window) {
	window_ = window;
	return *this;
}

std::unique_ptr<MovingAverage> MovingAverageBuilder::build() {
	ATSA_DEBUG("Building moving average model with window size {}.", window_);
	return std::unique_ptr<MovingAverage>(new MovingAverage(window_));
}

} // namespace atsa::models
