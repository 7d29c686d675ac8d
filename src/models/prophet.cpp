#include "atsa/models/prophet.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/logging.hpp"
#include "atsa/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace atsa::models {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kSecondsPerDay = 86400.0;
constexpr double kTrendPriorScale = 5.0;

double toDays(const core::TimeSeries::TimePoint &tp) {
	const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	return static_cast<double>(seconds) / kSecondsPerDay;
}

core::TimeSeries::TimePoint fromDays(double days) {
	return core::TimeSeries::TimePoint {std::chrono::seconds {static_cast<long long>(std::llround(days * kSecondsPerDay))}};
}

} // namespace

const core::TimeSeries::TimePoint &Prophet::syntheticEpoch() {
	static const auto epoch = *core::calendar::parseTimestamp("2020-01-01");
	return epoch;
}

Prophet::Prophet(Options options) : options_(options) {
	if (options_.n_changepoints < 0) {
		throw core::InvalidParameterError("n_changepoints must be non-negative.");
	}
	if (!(options_.changepoint_range > 0.0 && options_.changepoint_range <= 1.0)) {
		throw core::InvalidParameterError("changepoint_range must lie in (0, 1].");
	}
	if (options_.changepoint_prior_scale <= 0.0 || options_.seasonality_prior_scale <= 0.0) {
		throw core::InvalidParameterError("Prior scales must be positive.");
	}
	if (options_.uncertainty_samples < 0) {
		throw core::InvalidParameterError("uncertainty_samples must be non-negative.");
	}
}

double Prophet::scaleTime(double days) const {
	return (days - t0_) / t_span_;
}

double Prophet::trendAt(double t) const {
	double value = k_ * t + m_;
	for (std::size_t j = 0; j < changepoints_.size(); ++j) {
		if (t >= changepoints_[j]) {
			value += delta_[static_cast<Eigen::Index>(j)] * (t - changepoints_[j]);
		}
	}
	return value;
}

Eigen::RowVectorXd Prophet::fourierRow(double days) const {
	Eigen::Index width = 0;
	for (const auto &s : seasonalities_) {
		width += 2 * s.fourier_order;
	}
	Eigen::RowVectorXd row(width);
	Eigen::Index col = 0;
	for (const auto &s : seasonalities_) {
		for (int k = 1; k <= s.fourier_order; ++k) {
			const double angle = 2.0 * kPi * k * days / s.period_days;
			row[col++] = std::sin(angle);
			row[col++] = std::cos(angle);
		}
	}
	return row;
}

double Prophet::seasonalAt(double days) const {
	if (beta_.size() == 0) {
		return 0.0;
	}
	return fourierRow(days).dot(beta_);
}

void Prophet::chooseSeasonalities(double span_days, double min_spacing_days) {
	seasonalities_.clear();
	const auto enabled = [](Toggle toggle, bool automatic) {
		return toggle == Toggle::On || (toggle == Toggle::Auto && automatic);
	};
	if (enabled(options_.yearly, span_days >= 730.0)) {
		seasonalities_.push_back({"yearly", 365.25, 10});
	}
	if (enabled(options_.weekly, span_days >= 14.0 && min_spacing_days < 7.0)) {
		seasonalities_.push_back({"weekly", 7.0, 3});
	}
	if (enabled(options_.daily, span_days >= 2.0 && min_spacing_days < 1.0)) {
		seasonalities_.push_back({"daily", 1.0, 4});
	}
}

Eigen::VectorXd Prophet::solvePenalized(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                        const Eigen::VectorXd &prior_scales) const {
	// MAP estimate with independent Gaussian priors: two passes so the
	// penalty reflects the estimated noise level.
	double noise = 0.01;
	Eigen::VectorXd beta;
	for (int pass = 0; pass < 2; ++pass) {
		Eigen::MatrixXd A = X.transpose() * X;
		for (Eigen::Index j = 0; j < prior_scales.size(); ++j) {
			A(j, j) += noise / (prior_scales[j] * prior_scales[j]);
		}
		beta = A.ldlt().solve(X.transpose() * y);
		if (!beta.allFinite()) {
			throw core::FittingError("Prophet trend/seasonality regression failed.");
		}
		const Eigen::VectorXd residual = y - X * beta;
		noise = std::max(residual.squaredNorm() / static_cast<double>(y.size()), 1e-8);
	}
	return beta;
}

void Prophet::fit(const core::TimeSeries &ts) {
	const std::size_t n = ts.size();
	if (n < 2) {
		throw core::FittingError("Prophet requires at least 2 observations.");
	}
	values_ = ts.getValues();
	for (double v : values_) {
		if (!std::isfinite(v)) {
			throw core::FittingError("Prophet requires finite observations.");
		}
	}

	synthetic_dates_ = !ts.hasTimeIndex();
	timestamps_.clear();
	if (synthetic_dates_) {
		core::calendar::TimeStep daily;
		daily.fixed = std::chrono::hours(24);
		for (std::size_t i = 0; i < n; ++i) {
			timestamps_.push_back(daily.advance(syntheticEpoch(), static_cast<int>(i)));
		}
		step_ = daily;
	} else {
		timestamps_ = ts.getTimestamps();
		step_ = ts.inferStep();
	}

	days_.resize(n);
	double min_spacing = std::numeric_limits<double>::infinity();
	for (std::size_t i = 0; i < n; ++i) {
		days_[i] = toDays(timestamps_[i]);
		if (i > 0) {
			min_spacing = std::min(min_spacing, days_[i] - days_[i - 1]);
		}
	}
	t0_ = days_.front();
	t_span_ = days_.back() - days_.front();
	if (t_span_ <= 0.0) {
		throw core::FittingError("Prophet requires timestamps spanning a positive interval.");
	}
	chooseSeasonalities(t_span_, min_spacing);

	y_scale_ = 0.0;
	for (double v : values_) {
		y_scale_ = std::max(y_scale_, std::abs(v));
	}
	if (y_scale_ == 0.0) {
		y_scale_ = 1.0;
	}

	// Changepoints evenly spread over the first changepoint_range of history.
	changepoints_.clear();
	const auto hist_size = static_cast<std::size_t>(std::floor(static_cast<double>(n) * options_.changepoint_range));
	const int n_cp = std::min<int>(options_.n_changepoints, static_cast<int>(hist_size) - 1);
	for (int j = 1; j <= n_cp; ++j) {
		const double position = static_cast<double>(j) * static_cast<double>(hist_size - 1) / n_cp;
		const auto idx = static_cast<std::size_t>(std::llround(position));
		changepoints_.push_back(scaleTime(days_[idx]));
	}
	changepoints_.erase(std::unique(changepoints_.begin(), changepoints_.end()), changepoints_.end());

	const auto n_rows = static_cast<Eigen::Index>(n);
	const auto n_cps = static_cast<Eigen::Index>(changepoints_.size());
	Eigen::VectorXd y(n_rows);
	Eigen::MatrixXd trend_X(n_rows, 2 + n_cps);
	Eigen::MatrixXd season_X(n_rows, fourierRow(0.0).size());
	for (Eigen::Index i = 0; i < n_rows; ++i) {
		const double t = scaleTime(days_[static_cast<std::size_t>(i)]);
		y[i] = values_[static_cast<std::size_t>(i)] / y_scale_;
		trend_X(i, 0) = 1.0;
		trend_X(i, 1) = t;
		for (Eigen::Index j = 0; j < n_cps; ++j) {
			trend_X(i, 2 + j) = std::max(0.0, t - changepoints_[static_cast<std::size_t>(j)]);
		}
		if (season_X.cols() > 0) {
			season_X.row(i) = fourierRow(days_[static_cast<std::size_t>(i)]);
		}
	}

	Eigen::VectorXd trend_scales(2 + n_cps);
	trend_scales.setConstant(options_.changepoint_prior_scale);
	trend_scales[0] = kTrendPriorScale;
	trend_scales[1] = kTrendPriorScale;
	const Eigen::VectorXd season_scales =
	    Eigen::VectorXd::Constant(season_X.cols(), options_.seasonality_prior_scale);

	if (options_.mode == SeasonalityMode::Additive) {
		Eigen::MatrixXd X(n_rows, trend_X.cols() + season_X.cols());
		Eigen::VectorXd scales(X.cols());
		X.leftCols(trend_X.cols()) = trend_X;
		scales.head(trend_scales.size()) = trend_scales;
		if (season_X.cols() > 0) {
			X.rightCols(season_X.cols()) = season_X;
			scales.tail(season_scales.size()) = season_scales;
		}
		const Eigen::VectorXd beta = solvePenalized(X, y, scales);
		m_ = beta[0];
		k_ = beta[1];
		delta_ = beta.segment(2, n_cps);
		beta_ = beta.tail(season_X.cols());
	} else {
		const Eigen::VectorXd trend_beta = solvePenalized(trend_X, y, trend_scales);
		m_ = trend_beta[0];
		k_ = trend_beta[1];
		delta_ = trend_beta.tail(n_cps);
		const Eigen::VectorXd trend = trend_X * trend_beta;
		if ((trend.array() <= 0.0).any()) {
			throw core::FittingError("Multiplicative seasonality requires a strictly positive trend.");
		}
		beta_.resize(season_X.cols());
		if (season_X.cols() > 0) {
			const Eigen::VectorXd ratio = (y.array() / trend.array() - 1.0).matrix();
			const Eigen::MatrixXd weighted = season_X.array().colwise() * trend.array();
			// Seasonal factor regression weighted by the trend so errors stay on the y scale.
			beta_ = solvePenalized(weighted, (ratio.array() * trend.array()).matrix(), season_scales);
		}
	}

	fitted_.resize(n);
	double sum_sq = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		const double trend = trendAt(scaleTime(days_[i]));
		const double seasonal = seasonalAt(days_[i]);
		const double yhat = options_.mode == SeasonalityMode::Additive ? trend + seasonal : trend * (1.0 + seasonal);
		fitted_[i] = yhat * y_scale_;
		const double r = values_[i] / y_scale_ - yhat;
		sum_sq += r * r;
	}
	sigma_ = std::sqrt(sum_sq / static_cast<double>(n));
	is_fitted_ = true;
	ATSA_DEBUG("Prophet fitted on {} points with {} changepoints and {} seasonalities{}.", n, changepoints_.size(),
	           seasonalities_.size(), synthetic_dates_ ? " (synthetic daily dates)" : "");
}

void Prophet::requireFitted(const char *operation) const {
	if (!is_fitted_) {
		throw core::StateError(std::string(operation) + " called before fit.");
	}
}

core::Forecast Prophet::predict(int horizon, double confidence) {
	requireFitted("predict");
	if (horizon < 0) {
		throw core::InvalidParameterError("Forecast horizon must be non-negative.");
	}
	if (!(confidence > 0.0 && confidence < 1.0)) {
		throw core::InvalidParameterError("Confidence level must lie strictly between 0 and 1.");
	}

	const auto h = static_cast<std::size_t>(horizon);
	future_.clear();
	std::vector<double> future_days(h);
	const double fallback_step = t_span_ / static_cast<double>(days_.size() - 1);
	for (std::size_t i = 0; i < h; ++i) {
		if (step_) {
			future_.push_back(step_->advance(timestamps_.back(), static_cast<int>(i + 1)));
			future_days[i] = toDays(future_.back());
		} else {
			future_days[i] = days_.back() + fallback_step * static_cast<double>(i + 1);
			future_.push_back(fromDays(future_days[i]));
		}
	}

	std::vector<double> trend(h);
	std::vector<double> seasonal(h);
	core::Forecast forecast;
	forecast.confidence = confidence;
	forecast.reserve(h);
	for (std::size_t i = 0; i < h; ++i) {
		trend[i] = trendAt(scaleTime(future_days[i]));
		seasonal[i] = seasonalAt(future_days[i]);
		const double yhat = options_.mode == SeasonalityMode::Additive ? trend[i] + seasonal[i]
		                                                               : trend[i] * (1.0 + seasonal[i]);
		forecast.point.push_back(yhat * y_scale_);
	}
	if (h == 0) {
		return forecast;
	}

	const int samples = options_.uncertainty_samples;
	if (samples == 0) {
		forecast.lower = forecast.point;
		forecast.upper = forecast.point;
		return forecast;
	}

	// Simulate future rate changes at the historical changepoint frequency.
	std::mt19937 rng(options_.seed);
	std::normal_distribution<double> noise(0.0, std::max(sigma_, 1e-12));
	std::uniform_real_distribution<double> uniform(0.0, 1.0);
	double mean_abs_delta = 0.0;
	for (Eigen::Index j = 0; j < delta_.size(); ++j) {
		mean_abs_delta += std::abs(delta_[j]);
	}
	mean_abs_delta = delta_.size() > 0 ? mean_abs_delta / static_cast<double>(delta_.size()) : 0.0;
	const double laplace_scale = mean_abs_delta + 1e-8;
	const double t_end = scaleTime(future_days.back());
	const double expected_changes = static_cast<double>(changepoints_.size()) * std::max(t_end - 1.0, 0.0);

	std::vector<std::vector<double>> draws(h, std::vector<double>(static_cast<std::size_t>(samples)));
	for (int s = 0; s < samples; ++s) {
		std::vector<std::pair<double, double>> changes;
		if (expected_changes > 0.0) {
			std::poisson_distribution<int> count(expected_changes);
			std::exponential_distribution<double> magnitude(1.0 / laplace_scale);
			const int n_changes = count(rng);
			for (int c = 0; c < n_changes; ++c) {
				const double when = 1.0 + uniform(rng) * (t_end - 1.0);
				const double sign = uniform(rng) < 0.5 ? -1.0 : 1.0;
				changes.emplace_back(when, sign * magnitude(rng));
			}
		}
		for (std::size_t i = 0; i < h; ++i) {
			const double t = scaleTime(future_days[i]);
			double sampled_trend = trend[i];
			for (const auto &change : changes) {
				if (t >= change.first) {
					sampled_trend += change.second * (t - change.first);
				}
			}
			const double yhat = options_.mode == SeasonalityMode::Additive ? sampled_trend + seasonal[i]
			                                                               : sampled_trend * (1.0 + seasonal[i]);
			draws[i][static_cast<std::size_t>(s)] = (yhat + noise(rng)) * y_scale_;
		}
	}

	const double alpha = (1.0 - confidence) / 2.0;
	for (std::size_t i = 0; i < h; ++i) {
		forecast.lower.push_back(utils::stats::quantile(draws[i], alpha));
		forecast.upper.push_back(utils::stats::quantile(draws[i], 1.0 - alpha));
	}
	return forecast;
}

std::vector<double> Prophet::fittedValues() const {
	requireFitted("fittedValues");
	return fitted_;
}

nlohmann::json Prophet::modelInfo() const {
	requireFitted("modelInfo");
	nlohmann::json seasonalities = nlohmann::json::array();
	for (const auto &s : seasonalities_) {
		seasonalities.push_back({{"name", s.name}, {"period", s.period_days}, {"fourier_order", s.fourier_order}});
	}
	nlohmann::json changepoints = nlohmann::json::array();
	for (double cp : changepoints_) {
		changepoints.push_back(core::calendar::formatDate(fromDays(t0_ + cp * t_span_)));
	}
	nlohmann::json info;
	info["growth"] = "linear";
	info["seasonality_mode"] = options_.mode == SeasonalityMode::Additive ? "additive" : "multiplicative";
	info["seasonalities"] = seasonalities;
	info["changepoints"] = changepoints;
	info["changepoint_prior_scale"] = options_.changepoint_prior_scale;
	info["seasonality_prior_scale"] = options_.seasonality_prior_scale;
	info["growth_rate"] = k_ * y_scale_ / t_span_;
	info["offset"] = m_ * y_scale_;
	info["residual_std"] = sigma_ * y_scale_;
	info["synthetic_dates"] = synthetic_dates_;
	return info;
}

} // namespace atsa::models
