#pragma once

#include "atsa/models/iforecaster.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace atsa::models {

/**
 * @class Prophet
 * @brief Additive regression of a piecewise-linear trend and Fourier seasonalities.
 *
 * y(t) = g(t) + s(t) + e_t (or g(t) * (1 + s(t)) in multiplicative mode), with
 * g a linear trend whose rate changes at evenly spaced changepoints. The fit is
 * the MAP estimate under Gaussian shrinkage priors; uncertainty intervals are
 * simulated from future trend changes and observation noise.
 *
 * The model needs dates. A series without a time index is given a synthetic
 * daily calendar starting at 2020-01-01.
 */
class Prophet final : public IForecaster {
public:
	enum class SeasonalityMode { Additive, Multiplicative };

	/// "auto" enables a seasonality when the data span supports it.
	enum class Toggle { Auto, On, Off };

	struct Options {
		SeasonalityMode mode = SeasonalityMode::Additive;
		int n_changepoints = 25;
		double changepoint_range = 0.8;
		double changepoint_prior_scale = 0.05;
		double seasonality_prior_scale = 10.0;
		Toggle yearly = Toggle::Auto;
		Toggle weekly = Toggle::Auto;
		Toggle daily = Toggle::Auto;
		int uncertainty_samples = 1000;
		std::uint32_t seed = 0;
	};

	struct Seasonality {
		std::string name;
		double period_days;
		int fourier_order;
	};

	explicit Prophet(Options options);

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon, double confidence = 0.95) override;
	std::vector<double> fittedValues() const override;
	nlohmann::json modelInfo() const override;

	std::string getName() const override {
		return "Prophet";
	}

	const std::vector<Seasonality> &seasonalities() const {
		return seasonalities_;
	}

	/// Timestamps of the last forecast horizon.
	const std::vector<core::TimeSeries::TimePoint> &futureTimestamps() const {
		return future_;
	}

	static const core::TimeSeries::TimePoint &syntheticEpoch();

private:
	double scaleTime(double days) const;
	double trendAt(double t_scaled) const;
	double seasonalAt(double days) const;
	Eigen::RowVectorXd fourierRow(double days) const;
	void chooseSeasonalities(double span_days, double min_spacing_days);
	Eigen::VectorXd solvePenalized(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                               const Eigen::VectorXd &prior_scales) const;
	void requireFitted(const char *operation) const;

	Options options_;
	std::vector<Seasonality> seasonalities_;
	std::vector<core::TimeSeries::TimePoint> timestamps_;
	std::vector<core::TimeSeries::TimePoint> future_;
	std::vector<double> days_;
	std::vector<double> values_;
	std::optional<core::calendar::TimeStep> step_;
	bool synthetic_dates_ = false;

	double t0_ = 0.0;
	double t_span_ = 1.0;
	double y_scale_ = 1.0;
	double k_ = 0.0;
	double m_ = 0.0;
	std::vector<double> changepoints_; // scaled time
	Eigen::VectorXd delta_;
	Eigen::VectorXd beta_; // Fourier coefficients
	double sigma_ = 0.0;   // scaled residual std
	std::vector<double> fitted_;
	bool is_fitted_ = false;
};

} // namespace atsa::models
