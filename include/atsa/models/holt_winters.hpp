#pragma once

#include "atsa/models/iforecaster.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace atsa::models {

/**
 * @brief Holt-Winters exponential smoothing.
 *
 * Level, trend and seasonal components, each of which may be absent (trend,
 * seasonal), additive or multiplicative. Smoothing constants minimise the
 * one-step-ahead sum of squared errors.
 *
 * The method has no forecast-error variance, so intervals are
 * point +/- z * sigma with sigma the standard deviation of in-sample residuals.
 */
class HoltWinters final : public IForecaster {
public:
	enum class Component { None, Additive, Multiplicative };

	/// Accepts "additive"/"add", "multiplicative"/"mul" and "none".
	static Component parseComponent(const std::string &name);
	static std::string toString(Component component);

	/**
	 * @param trend Trend component.
	 * @param seasonal Seasonal component.
	 * @param seasonal_periods Observations per season (ignored without seasonality).
	 */
	HoltWinters(Component trend, Component seasonal, int seasonal_periods);

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon, double confidence = 0.95) override;
	std::vector<double> fittedValues() const override;
	nlohmann::json modelInfo() const override;

	std::string getName() const override {
		return "HoltWinters";
	}

	double alpha() const {
		return alpha_;
	}
	double beta() const {
		return beta_;
	}
	double gamma() const {
		return gamma_;
	}
	const std::vector<double> &residuals() const;

private:
	struct State {
		double level = 0.0;
		double trend = 0.0;
		std::vector<double> seasonals; // indexed by phase (t mod m)
	};

	State initialState(const std::vector<double> &values) const;
	double filter(const std::vector<double> &values, double alpha, double beta, double gamma, State &state,
	              std::vector<double> *fitted) const;
	double combineTrend(double level, double trend, double steps) const;
	void requireFitted(const char *operation) const;

	Component trend_;
	Component seasonal_;
	int seasonal_periods_;

	double alpha_ = 0.0;
	double beta_ = 0.0;
	double gamma_ = 0.0;
	State initial_;
	State final_;
	std::size_t n_ = 0;
	std::vector<double> fitted_;
	std::vector<double> residuals_;
	double sse_ = 0.0;
	double sigma_ = 0.0;
	std::optional<double> aic_;
	std::optional<double> bic_;
	bool is_fitted_ = false;
};

} // namespace atsa::models
