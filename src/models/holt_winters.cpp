#include "atsa/models/holt_winters.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/logging.hpp"
#include "atsa/utils/nelder_mead.hpp"
#include "atsa/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace atsa::models {

namespace {

constexpr double kBoundLow = 1e-4;
constexpr double kBoundHigh = 0.9999;
constexpr double kSeasonalFloor = 0.01;

} // namespace

HoltWinters::Component HoltWinters::parseComponent(const std::string &name) {
	if (name == "add" || name == "additive") {
		return Component::Additive;
	}
	if (name == "mul" || name == "multiplicative") {
		return Component::Multiplicative;
	}
	if (name == "none" || name.empty()) {
		return Component::None;
	}
	throw core::InvalidParameterError("Unknown Holt-Winters component: '" + name + "'.");
}

std::string HoltWinters::toString(Component component) {
	switch (component) {
	case Component::Additive:
		return "additive";
	case Component::Multiplicative:
		return "multiplicative";
	case Component::None:
		break;
	}
	return "none";
}

HoltWinters::HoltWinters(Component trend, Component seasonal, int seasonal_periods)
    : trend_(trend), seasonal_(seasonal), seasonal_periods_(seasonal_periods) {
	if (seasonal_ != Component::None && seasonal_periods_ < 2) {
		throw core::InvalidParameterError("Holt-Winters seasonal_periods must be at least 2.");
	}
	if (seasonal_ == Component::None) {
		seasonal_periods_ = 1;
	}
}

HoltWinters::State HoltWinters::initialState(const std::vector<double> &values) const {
	const std::size_t n = values.size();
	const int m = seasonal_periods_;
	const bool additive = seasonal_ == Component::Additive;
	State state;
	std::vector<double> adjusted = values;

	if (seasonal_ != Component::None) {
		std::vector<double> season_avg(static_cast<std::size_t>(m), additive ? 0.0 : 1.0);
		if (n < 3 * static_cast<std::size_t>(m)) {
			// Short series: average each phase after removing the overall mean.
			const double overall = utils::stats::mean(values);
			std::vector<double> sums(static_cast<std::size_t>(m), 0.0);
			std::vector<int> counts(static_cast<std::size_t>(m), 0);
			for (std::size_t i = 0; i < n; ++i) {
				sums[i % m] += additive ? values[i] - overall : values[i] / overall;
				counts[i % m]++;
			}
			for (int j = 0; j < m; ++j) {
				if (counts[j] > 0) {
					season_avg[j] = sums[j] / counts[j];
				}
			}
		} else {
			// Centered moving average detrending over the interior.
			const int half = m / 2;
			std::vector<std::vector<double>> phase_obs(static_cast<std::size_t>(m));
			for (std::size_t i = static_cast<std::size_t>(half); i + half < n; ++i) {
				double sum = 0.0;
				if (m % 2 == 0) {
					sum = 0.5 * values[i - half] + 0.5 * values[i + half];
					for (int j = 1 - half; j < half; ++j) {
						sum += values[i + j];
					}
				} else {
					for (int j = -half; j <= half; ++j) {
						sum += values[i + j];
					}
				}
				const double trend = sum / m;
				if (!additive && std::abs(trend) < 1e-10) {
					continue;
				}
				phase_obs[i % m].push_back(additive ? values[i] - trend : values[i] / trend);
			}
			for (int j = 0; j < m; ++j) {
				if (!phase_obs[j].empty()) {
					season_avg[j] = utils::stats::mean(phase_obs[j]);
				}
			}
		}

		// Normalise: additive seasonals sum to zero, multiplicative average one.
		const double avg = utils::stats::mean(season_avg);
		for (double &s : season_avg) {
			s = additive ? s - avg : std::max(s / avg, kSeasonalFloor);
		}
		for (std::size_t i = 0; i < n; ++i) {
			adjusted[i] = additive ? values[i] - season_avg[i % m] : values[i] / season_avg[i % m];
		}
		state.seasonals = season_avg;
	}

	// Level and trend from a regression over the first seasonally adjusted points.
	const std::size_t maxn = std::min(static_cast<std::size_t>(std::max(10, 2 * m)), n);
	double sum_x = 0.0, sum_y = 0.0, sum_xy = 0.0, sum_x2 = 0.0;
	for (std::size_t i = 0; i < maxn; ++i) {
		const double x = static_cast<double>(i + 1);
		sum_x += x;
		sum_y += adjusted[i];
		sum_xy += x * adjusted[i];
		sum_x2 += x * x;
	}
	const double count = static_cast<double>(maxn);
	const double denom = count * sum_x2 - sum_x * sum_x;
	const double slope = std::abs(denom) > 1e-10 ? (count * sum_xy - sum_x * sum_y) / denom : 0.0;
	const double intercept = (sum_y - slope * sum_x) / count;

	switch (trend_) {
	case Component::None:
		state.level = sum_y / count;
		break;
	case Component::Additive:
		state.level = intercept;
		state.trend = slope;
		break;
	case Component::Multiplicative:
		state.level = std::max(intercept, 1e-8);
		state.trend = std::clamp((intercept + slope) / state.level, 0.5, 2.0);
		break;
	}
	return state;
}

double HoltWinters::combineTrend(double level, double trend, double steps) const {
	switch (trend_) {
	case Component::Additive:
		return level + steps * trend;
	case Component::Multiplicative:
		return level * std::pow(trend, steps);
	case Component::None:
		break;
	}
	return level;
}

double HoltWinters::filter(const std::vector<double> &values, double alpha, double beta, double gamma, State &state,
                           std::vector<double> *fitted) const {
	const int m = seasonal_periods_;
	double sse = 0.0;
	for (std::size_t t = 0; t < values.size(); ++t) {
		const double y = values[t];
		const double base = combineTrend(state.level, state.trend, 1.0);
		double season = 0.0;
		double prediction = base;
		if (seasonal_ == Component::Additive) {
			season = state.seasonals[t % m];
			prediction = base + season;
		} else if (seasonal_ == Component::Multiplicative) {
			season = state.seasonals[t % m];
			prediction = base * season;
		}
		if (fitted != nullptr) {
			fitted->push_back(prediction);
		}
		const double error = y - prediction;
		sse += error * error;

		const double deseasonalized = seasonal_ == Component::Additive        ? y - season
		                              : seasonal_ == Component::Multiplicative ? y / season
		                                                                       : y;
		const double previous_level = state.level;
		state.level = alpha * deseasonalized + (1.0 - alpha) * base;
		if (trend_ == Component::Additive) {
			state.trend = beta * (state.level - previous_level) + (1.0 - beta) * state.trend;
		} else if (trend_ == Component::Multiplicative) {
			state.trend = beta * (state.level / previous_level) + (1.0 - beta) * state.trend;
		}
		if (seasonal_ == Component::Additive) {
			state.seasonals[t % m] = gamma * (y - state.level) + (1.0 - gamma) * season;
		} else if (seasonal_ == Component::Multiplicative) {
			state.seasonals[t % m] = gamma * (y / state.level) + (1.0 - gamma) * season;
		}
		if (!std::isfinite(sse)) {
			return std::numeric_limits<double>::infinity();
		}
	}
	return sse;
}

void HoltWinters::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	n_ = values.size();
	if (n_ < 3) {
		throw core::FittingError("Holt-Winters requires at least 3 observations.");
	}
	if (seasonal_ != Component::None && n_ < 2 * static_cast<std::size_t>(seasonal_periods_)) {
		throw core::FittingError("Holt-Winters with seasonal_periods=" + std::to_string(seasonal_periods_) +
		                         " requires at least " + std::to_string(2 * seasonal_periods_) + " observations.");
	}
	const bool multiplicative = trend_ == Component::Multiplicative || seasonal_ == Component::Multiplicative;
	for (double v : values) {
		if (!std::isfinite(v)) {
			throw core::FittingError("Holt-Winters requires finite observations.");
		}
		if (multiplicative && v <= 0.0) {
			throw core::FittingError("Multiplicative Holt-Winters requires strictly positive data.");
		}
	}

	initial_ = initialState(values);

	std::vector<double> start {0.3};
	if (trend_ != Component::None) {
		start.push_back(0.05);
	}
	if (seasonal_ != Component::None) {
		start.push_back(0.1);
	}
	const auto unpack = [&](const std::vector<double> &x, double &a, double &b, double &g) {
		std::size_t idx = 0;
		a = x[idx++];
		b = trend_ != Component::None ? x[idx++] : 0.0;
		g = seasonal_ != Component::None ? x[idx++] : 0.0;
	};
	const auto objective = [&](const std::vector<double> &x) {
		double a, b, g;
		unpack(x, a, b, g);
		State state = initial_;
		return filter(values, a, b, g, state, nullptr);
	};

	utils::NelderMeadOptimizer optimizer;
	utils::NelderMeadOptimizer::Options options;
	options.step = 0.1;
	options.max_iterations = 500;
	options.tolerance = 1e-10;
	const std::vector<double> lower(start.size(), kBoundLow);
	const std::vector<double> upper(start.size(), kBoundHigh);
	const auto result = optimizer.minimize(objective, start, options, lower, upper);
	if (!std::isfinite(result.value)) {
		throw core::FittingError("Holt-Winters optimisation failed to find finite parameters.");
	}
	unpack(result.best, alpha_, beta_, gamma_);

	final_ = initial_;
	fitted_.clear();
	fitted_.reserve(n_);
	sse_ = filter(values, alpha_, beta_, gamma_, final_, &fitted_);
	residuals_.resize(n_);
	for (std::size_t i = 0; i < n_; ++i) {
		residuals_[i] = values[i] - fitted_[i];
	}
	sigma_ = utils::stats::stddev(residuals_);

	const double n = static_cast<double>(n_);
	const double k = static_cast<double>(start.size() + 1 + (trend_ != Component::None ? 1 : 0) +
	                                     (seasonal_ != Component::None ? seasonal_periods_ : 0));
	if (sse_ > 0.0) {
		aic_ = n * std::log(sse_ / n) + 2.0 * k;
		bic_ = n * std::log(sse_ / n) + k * std::log(n);
	} else {
		aic_.reset();
		bic_.reset();
	}

	is_fitted_ = true;
	ATSA_DEBUG("Holt-Winters fitted: alpha={:.4f} beta={:.4f} gamma={:.4f} sse={}", alpha_, beta_, gamma_, sse_);
}

void HoltWinters::requireFitted(const char *operation) const {
	if (!is_fitted_) {
		throw core::StateError(std::string(operation) + " called before fit.");
	}
}

core::Forecast HoltWinters::predict(int horizon, double confidence) {
	requireFitted("predict");
	if (horizon < 0) {
		throw core::InvalidParameterError("Forecast horizon must be non-negative.");
	}
	const double margin = utils::stats::zForConfidence(confidence) * sigma_;
	core::Forecast forecast;
	forecast.confidence = confidence;
	forecast.reserve(static_cast<std::size_t>(horizon));
	for (int h = 1; h <= horizon; ++h) {
		double value = combineTrend(final_.level, final_.trend, static_cast<double>(h));
		if (seasonal_ != Component::None) {
			const double season = final_.seasonals[(n_ + static_cast<std::size_t>(h) - 1) % seasonal_periods_];
			value = seasonal_ == Component::Additive ? value + season : value * season;
		}
		forecast.push(value, margin);
	}
	return forecast;
}

std::vector<double> HoltWinters::fittedValues() const {
	requireFitted("fittedValues");
	return fitted_;
}

const std::vector<double> &HoltWinters::residuals() const {
	requireFitted("residuals");
	return residuals_;
}

nlohmann::json HoltWinters::modelInfo() const {
	requireFitted("modelInfo");
	nlohmann::json info;
	info["trend"] = toString(trend_);
	info["seasonal"] = toString(seasonal_);
	info["seasonal_periods"] = seasonal_ == Component::None ? nlohmann::json(nullptr) : nlohmann::json(seasonal_periods_);
	info["smoothing_level"] = alpha_;
	info["smoothing_trend"] = trend_ == Component::None ? nlohmann::json(nullptr) : nlohmann::json(beta_);
	info["smoothing_seasonal"] = seasonal_ == Component::None ? nlohmann::json(nullptr) : nlohmann::json(gamma_);
	info["sse"] = sse_;
	info["aic"] = aic_ ? nlohmann::json(*aic_) : nlohmann::json(nullptr);
	info["bic"] = bic_ ? nlohmann::json(*bic_) : nlohmann::json(nullptr);
	info["residual_std"] = sigma_;
	return info;
}

} // namespace atsa::models
