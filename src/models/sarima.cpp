#include "atsa/models/sarima.hpp"

#include "atsa/core/errors.hpp"

namespace atsa::models {

SARIMA::SARIMA(std::array<int, 3> order, std::array<int, 4> seasonal_order)
    : order_(order), seasonal_order_(seasonal_order) {
	if (seasonal_order_[3] < 2) {
		throw core::InvalidParameterError("SARIMA seasonal period must be at least 2.");
	}
	model_ = ARIMABuilder()
	             .withAR(order_[0])
	             .withDifferencing(order_[1])
	             .withMA(order_[2])
	             .withSeasonalAR(seasonal_order_[0])
	             .withSeasonalDifferencing(seasonal_order_[1])
	             .withSeasonalMA(seasonal_order_[2])
	             .withSeasonalPeriod(seasonal_order_[3])
	             .build();
}

void SARIMA::fit(const core::TimeSeries &ts) {
	const auto s = static_cast<std::size_t>(seasonal_order_[3]);
	if (ts.size() < 2 * s) {
		throw core::FittingError("SARIMA with seasonal period " + std::to_string(s) + " needs at least " +
		                         std::to_string(2 * s) + " observations, got " + std::to_string(ts.size()) + ".");
	}
	model_->fit(ts);
}

core::Forecast SARIMA::predict(int horizon, double confidence) {
	return model_->predict(horizon, confidence);
}

std::vector<double> SARIMA::fittedValues() const {
	return model_->fittedValues();
}

nlohmann::json SARIMA::modelInfo() const {
	auto info = model_->modelInfo();
	info["model"] = getName();
	return info;
}

} // namespace atsa::models
