#pragma once

#include "atsa/models/arima.hpp"

#include <array>
#include <memory>

namespace atsa::models {

/**
 * @class SARIMA
 * @brief Seasonal ARIMA configured from (p,d,q) and (P,D,Q,s) order tuples.
 *
 * A thin facade over ARIMA that reports the seasonal configuration.
 */
class SARIMA final : public IForecaster {
public:
	SARIMA(std::array<int, 3> order, std::array<int, 4> seasonal_order);

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon, double confidence = 0.95) override;
	std::vector<double> fittedValues() const override;
	nlohmann::json modelInfo() const override;

	std::string getName() const override {
		return "SARIMA";
	}

	const ARIMA &model() const {
		return *model_;
	}

private:
	std::array<int, 3> order_;
	std::array<int, 4> seasonal_order_;
	std::unique_ptr<ARIMA> model_;
};

} // namespace atsa::models
