#include "atsa/models/arima.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/nelder_mead.hpp"
#include "atsa/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace atsa::models {

namespace {

constexpr double kLog2Pi = 1.8378770664093453;

Eigen::VectorXd autocorr(const std::vector<double> &data, int max_lag) {
	const int n = static_cast<int>(data.size());
	Eigen::VectorXd acf = Eigen::VectorXd::Zero(max_lag + 1);
	if (n == 0) {
		return acf;
	}

	const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(n);
	double variance = 0.0;
	for (double val : data) {
		variance += (val - mean) * (val - mean);
	}
	if (variance == 0.0) {
		return acf;
	}

	acf[0] = 1.0;
	for (int lag = 1; lag <= max_lag && lag < n; ++lag) {
		double covariance = 0.0;
		for (int i = lag; i < n; ++i) {
			covariance += (data[i] - mean) * (data[i - lag] - mean);
		}
		acf[lag] = covariance / variance;
	}
	return acf;
}

// Yule-Walker estimate of AR coefficients at lags step, 2*step, ..., order*step.
Eigen::VectorXd yuleWalker(const std::vector<double> &data, int order, int step) {
	if (order == 0) {
		return {};
	}
	const Eigen::VectorXd acf = autocorr(data, order * step);
	Eigen::MatrixXd R(order, order);
	Eigen::VectorXd r(order);
	for (int i = 0; i < order; ++i) {
		for (int j = 0; j < order; ++j) {
			R(i, j) = acf[std::abs(i - j) * step];
		}
		r[i] = acf[(i + 1) * step];
	}
	Eigen::VectorXd phi = R.colPivHouseholderQr().solve(r);
	// Keep the start inside the stationary region.
	for (Eigen::Index i = 0; i < phi.size(); ++i) {
		if (!std::isfinite(phi[i])) {
			phi[i] = 0.0;
		}
		phi[i] = std::clamp(phi[i], -0.9, 0.9);
	}
	return phi;
}

// Product of two lag polynomials given as full coefficient vectors (index = lag).
std::vector<double> multiply(const std::vector<double> &lhs, const std::vector<double> &rhs) {
	std::vector<double> out(lhs.size() + rhs.size() - 1, 0.0);
	for (std::size_t i = 0; i < lhs.size(); ++i) {
		for (std::size_t j = 0; j < rhs.size(); ++j) {
			out[i + j] += lhs[i] * rhs[j];
		}
	}
	return out;
}

// 1 + sign * sum coeffs_k B^(k*step)
std::vector<double> lagPolynomial(const Eigen::VectorXd &coeffs, int step, double sign) {
	std::vector<double> poly(static_cast<std::size_t>(coeffs.size() * step + 1), 0.0);
	poly[0] = 1.0;
	for (Eigen::Index k = 0; k < coeffs.size(); ++k) {
		poly[static_cast<std::size_t>((k + 1) * step)] = sign * coeffs[k];
	}
	return poly;
}

} // namespace

ARIMA::ARIMA(int p, int d, int q, int P, int D, int Q, int s, std::optional<bool> include_intercept)
    : p_(p), d_(d), q_(q), P_(P), D_(D), Q_(Q), seasonal_period_(s) {
	if (p_ < 0 || d_ < 0 || q_ < 0 || P_ < 0 || D_ < 0 || Q_ < 0) {
		throw core::InvalidParameterError("ARIMA orders must be non-negative.");
	}
	const bool seasonal = P_ > 0 || D_ > 0 || Q_ > 0;
	if (seasonal && seasonal_period_ < 2) {
		throw core::InvalidParameterError("Seasonal ARIMA terms require a seasonal period of at least 2.");
	}
	if (!seasonal) {
		seasonal_period_ = std::max(seasonal_period_, 0);
	}
	include_intercept_ = include_intercept.value_or(d_ + D_ == 0);
}

std::vector<double> ARIMA::differencingPolynomial(int d, int D, int s) {
	std::vector<double> poly {1.0};
	for (int i = 0; i < d; ++i) {
		poly = multiply(poly, {1.0, -1.0});
	}
	if (D > 0) {
		std::vector<double> seasonal(static_cast<std::size_t>(s) + 1, 0.0);
		seasonal.front() = 1.0;
		seasonal.back() = -1.0;
		for (int i = 0; i < D; ++i) {
			poly = multiply(poly, seasonal);
		}
	}
	return poly;
}

std::vector<double> ARIMA::applyDifferencing(const std::vector<double> &data, const std::vector<double> &poly) {
	const std::size_t degree = poly.size() - 1;
	if (data.size() <= degree) {
		return {};
	}
	std::vector<double> out;
	out.reserve(data.size() - degree);
	for (std::size_t t = degree; t < data.size(); ++t) {
		double value = 0.0;
		for (std::size_t k = 0; k <= degree; ++k) {
			value += poly[k] * data[t - k];
		}
		out.push_back(value);
	}
	return out;
}

ARIMA::Expanded ARIMA::expand(const Eigen::VectorXd &phi, const Eigen::VectorXd &theta,
                              const Eigen::VectorXd &seasonal_phi, const Eigen::VectorXd &seasonal_theta) const {
	const int s = std::max(seasonal_period_, 1);
	const auto ar_poly = multiply(lagPolynomial(phi, 1, -1.0), lagPolynomial(seasonal_phi, s, -1.0));
	const auto ma_poly = multiply(lagPolynomial(theta, 1, 1.0), lagPolynomial(seasonal_theta, s, 1.0));

	Expanded out;
	out.ar.reserve(ar_poly.size() - 1);
	for (std::size_t k = 1; k < ar_poly.size(); ++k) {
		out.ar.push_back(-ar_poly[k]);
	}
	out.ma.assign(ma_poly.begin() + 1, ma_poly.end());
	return out;
}

std::vector<double> ARIMA::residualsFor(const Expanded &poly, double mu) const {
	const std::size_t n = differenced_.size();
	const std::size_t start = poly.ar.size();
	std::vector<double> e(n, 0.0);
	for (std::size_t t = start; t < n; ++t) {
		double prediction = mu;
		for (std::size_t k = 0; k < poly.ar.size(); ++k) {
			prediction += poly.ar[k] * (differenced_[t - k - 1] - mu);
		}
		for (std::size_t k = 0; k < poly.ma.size() && k < t; ++k) {
			prediction += poly.ma[k] * e[t - k - 1];
		}
		e[t] = differenced_[t] - prediction;
	}
	return e;
}

void ARIMA::unpack(const std::vector<double> &params, Eigen::VectorXd &phi, Eigen::VectorXd &theta,
                   Eigen::VectorXd &seasonal_phi, Eigen::VectorXd &seasonal_theta, double &mu) const {
	std::size_t idx = 0;
	const auto take = [&](int count, Eigen::VectorXd &target) {
		target.resize(count);
		for (int i = 0; i < count; ++i) {
			target[i] = params[idx++];
		}
	};
	take(p_, phi);
	take(q_, theta);
	take(P_, seasonal_phi);
	take(Q_, seasonal_theta);
	mu = include_intercept_ ? params[idx] : 0.0;
}

std::vector<double> ARIMA::initialGuess() const {
	std::vector<double> guess;
	const Eigen::VectorXd phi = yuleWalker(differenced_, p_, 1);
	const Eigen::VectorXd seasonal_phi =
	    (P_ > 0 && static_cast<int>(differenced_.size()) > P_ * seasonal_period_)
	        ? yuleWalker(differenced_, P_, seasonal_period_)
	        : Eigen::VectorXd(Eigen::VectorXd::Zero(P_));
	guess.insert(guess.end(), phi.data(), phi.data() + phi.size());
	guess.insert(guess.end(), static_cast<std::size_t>(q_), 0.0);
	guess.insert(guess.end(), seasonal_phi.data(), seasonal_phi.data() + seasonal_phi.size());
	guess.insert(guess.end(), static_cast<std::size_t>(Q_), 0.0);
	if (include_intercept_) {
		guess.push_back(utils::stats::mean(differenced_));
	}
	return guess;
}

bool ARIMA::rootsOutsideUnitCircle(const std::vector<double> &coefficients) {
	// Roots of 1 - sum c_k z^k lie outside the unit circle iff the companion
	// matrix of c has spectral radius below one.
	std::size_t order = coefficients.size();
	while (order > 0 && coefficients[order - 1] == 0.0) {
		--order;
	}
	if (order == 0) {
		return true;
	}
	Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(order),
	                                                  static_cast<Eigen::Index>(order));
	for (std::size_t k = 0; k < order; ++k) {
		companion(0, static_cast<Eigen::Index>(k)) = coefficients[k];
	}
	for (std::size_t k = 1; k < order; ++k) {
		companion(static_cast<Eigen::Index>(k), static_cast<Eigen::Index>(k - 1)) = 1.0;
	}
	Eigen::EigenSolver<Eigen::MatrixXd> solver(companion, false);
	if (solver.info() != Eigen::Success) {
		return false;
	}
	return solver.eigenvalues().cwiseAbs().maxCoeff() < 1.0 - 1e-6;
}

void ARIMA::fit(const core::TimeSeries &ts) {
	history_ = ts.getValues();
	for (double v : history_) {
		if (!std::isfinite(v)) {
			throw core::FittingError("ARIMA requires finite observations.");
		}
	}

	diff_poly_ = differencingPolynomial(d_, D_, seasonal_period_);
	differenced_ = applyDifferencing(history_, diff_poly_);
	conditioning_ = static_cast<std::size_t>(p_ + P_ * std::max(seasonal_period_, 1));
	const std::size_t n_params = static_cast<std::size_t>(p_ + q_ + P_ + Q_ + (include_intercept_ ? 1 : 0));
	if (differenced_.size() <= conditioning_ + n_params + 1) {
		throw core::FittingError("Insufficient data for the given ARIMA order: " + std::to_string(history_.size()) +
		                         " observations.");
	}
	const double n_eff = static_cast<double>(differenced_.size() - conditioning_);

	const auto css = [&](const std::vector<double> &params) {
		Eigen::VectorXd phi, theta, sphi, stheta;
		double mu = 0.0;
		unpack(params, phi, theta, sphi, stheta, mu);
		const Expanded poly = expand(phi, theta, sphi, stheta);
		const std::vector<double> negated_ma = [&] {
			std::vector<double> out(poly.ma.size());
			std::transform(poly.ma.begin(), poly.ma.end(), out.begin(), [](double m) { return -m; });
			return out;
		}();
		if (!rootsOutsideUnitCircle(poly.ar) || !rootsOutsideUnitCircle(negated_ma)) {
			return std::numeric_limits<double>::infinity();
		}
		const auto e = residualsFor(poly, mu);
		double sum = 0.0;
		for (std::size_t t = conditioning_; t < e.size(); ++t) {
			sum += e[t] * e[t];
		}
		return sum;
	};

	std::vector<double> params = initialGuess();
	if (!params.empty()) {
		utils::NelderMeadOptimizer optimizer;
		utils::NelderMeadOptimizer::Options options;
		options.step = 0.1;
		options.max_iterations = 400 * static_cast<int>(params.size());
		options.tolerance = 1e-10;
		options.restarts = 2;
		const double scale = utils::stats::stddev(differenced_);
		const auto objective = [&](const std::vector<double> &x) { return css(x); };
		if (include_intercept_) {
			// The mean lives on the data scale, the coefficients on the unit scale.
			params.back() /= std::max(scale, 1e-12);
			const auto scaled = [&](const std::vector<double> &x) {
				std::vector<double> unscaled = x;
				unscaled.back() *= std::max(scale, 1e-12);
				return css(unscaled);
			};
			auto result = optimizer.minimize(scaled, params, options);
			params = result.best;
			params.back() *= std::max(scale, 1e-12);
			converged_ = result.converged;
		} else {
			auto result = optimizer.minimize(objective, params, options);
			params = result.best;
			converged_ = result.converged;
		}
		if (!converged_) {
			ATSA_WARN("ARIMA optimizer stopped before convergence; using best estimate.");
		}
	} else {
		converged_ = true;
	}

	unpack(params, ar_coeffs_, ma_coeffs_, seasonal_ar_coeffs_, seasonal_ma_coeffs_, intercept_);
	expanded_ = expand(ar_coeffs_, ma_coeffs_, seasonal_ar_coeffs_, seasonal_ma_coeffs_);
	residuals_ = residualsFor(expanded_, intercept_);

	double sum_sq = 0.0;
	for (std::size_t t = conditioning_; t < residuals_.size(); ++t) {
		sum_sq += residuals_[t] * residuals_[t];
	}
	if (!std::isfinite(sum_sq)) {
		throw core::FittingError("ARIMA estimation failed: non-finite residuals.");
	}
	sigma2_ = sum_sq / n_eff;
	const double k = static_cast<double>(n_params + 1);
	if (sigma2_ > 0.0) {
		log_likelihood_ = -0.5 * n_eff * (kLog2Pi + std::log(sigma2_) + 1.0);
		aic_ = -2.0 * log_likelihood_ + 2.0 * k;
		bic_ = -2.0 * log_likelihood_ + k * std::log(n_eff);
	} else {
		log_likelihood_ = std::numeric_limits<double>::infinity();
		aic_.reset();
		bic_.reset();
	}

	is_fitted_ = true;
	ATSA_DEBUG("ARIMA({},{},{})({},{},{},{}) fitted on {} points, sigma2={}", p_, d_, q_, P_, D_, Q_,
	           seasonal_period_, history_.size(), sigma2_);
}

void ARIMA::requireFitted(const char *operation) const {
	if (!is_fitted_) {
		throw core::StateError(std::string(operation) + " called before fit.");
	}
}

core::Forecast ARIMA::predict(int horizon, double confidence) {
	requireFitted("predict");
	if (horizon < 0) {
		throw core::InvalidParameterError("Forecast horizon must be non-negative.");
	}
	const double z = utils::stats::zForConfidence(confidence);

	const std::size_t h = static_cast<std::size_t>(horizon);
	std::vector<double> w = differenced_;
	std::vector<double> e = residuals_;
	std::vector<double> y = history_;
	const std::size_t degree = diff_poly_.size() - 1;

	core::Forecast forecast;
	forecast.confidence = confidence;
	forecast.reserve(h);

	// Psi-weights of the integrated process: phi(B) delta(B) psi(B) = theta(B).
	std::vector<double> ar_poly {1.0};
	for (double a : expanded_.ar) {
		ar_poly.push_back(-a);
	}
	const auto full_ar = multiply(ar_poly, diff_poly_);
	std::vector<double> psi(h, 0.0);
	double cumulative = 0.0;

	for (std::size_t step = 0; step < h; ++step) {
		double next_w = intercept_;
		const std::size_t t = w.size();
		for (std::size_t k = 0; k < expanded_.ar.size(); ++k) {
			next_w += expanded_.ar[k] * (w[t - k - 1] - intercept_);
		}
		for (std::size_t k = 0; k < expanded_.ma.size() && k < t; ++k) {
			next_w += expanded_.ma[k] * e[t - k - 1];
		}
		w.push_back(next_w);
		e.push_back(0.0);

		double next_y = next_w;
		for (std::size_t k = 1; k <= degree; ++k) {
			next_y -= diff_poly_[k] * y[y.size() - k];
		}
		y.push_back(next_y);

		double value = 1.0;
		if (step > 0) {
			value = (step - 1) < expanded_.ma.size() ? expanded_.ma[step - 1] : 0.0;
			for (std::size_t k = 1; k <= step && k < full_ar.size(); ++k) {
				value -= full_ar[k] * psi[step - k];
			}
		}
		psi[step] = value;
		cumulative += value * value;
		forecast.push(next_y, z * std::sqrt(sigma2_ * cumulative));
	}
	return forecast;
}

std::vector<double> ARIMA::fittedValues() const {
	requireFitted("fittedValues");
	const std::size_t offset = diff_poly_.size() - 1;
	std::vector<double> fitted(history_.size(), std::numeric_limits<double>::quiet_NaN());
	for (std::size_t t = conditioning_; t < residuals_.size(); ++t) {
		fitted[t + offset] = history_[t + offset] - residuals_[t];
	}
	return fitted;
}

nlohmann::json ARIMA::modelInfo() const {
	requireFitted("modelInfo");
	nlohmann::json coefficients = nlohmann::json::object();
	for (Eigen::Index i = 0; i < ar_coeffs_.size(); ++i) {
		coefficients["ar.L" + std::to_string(i + 1)] = ar_coeffs_[i];
	}
	for (Eigen::Index i = 0; i < ma_coeffs_.size(); ++i) {
		coefficients["ma.L" + std::to_string(i + 1)] = ma_coeffs_[i];
	}
	for (Eigen::Index i = 0; i < seasonal_ar_coeffs_.size(); ++i) {
		coefficients["ar.S.L" + std::to_string((i + 1) * seasonal_period_)] = seasonal_ar_coeffs_[i];
	}
	for (Eigen::Index i = 0; i < seasonal_ma_coeffs_.size(); ++i) {
		coefficients["ma.S.L" + std::to_string((i + 1) * seasonal_period_)] = seasonal_ma_coeffs_[i];
	}
	if (include_intercept_) {
		coefficients["const"] = intercept_;
	}
	coefficients["sigma2"] = sigma2_;

	nlohmann::json info;
	info["order"] = {p_, d_, q_};
	info["seasonal_order"] = {P_, D_, Q_, seasonal_period_};
	info["aic"] = aic_ ? nlohmann::json(*aic_) : nlohmann::json(nullptr);
	info["bic"] = bic_ ? nlohmann::json(*bic_) : nlohmann::json(nullptr);
	info["log_likelihood"] = std::isfinite(log_likelihood_) ? nlohmann::json(log_likelihood_) : nlohmann::json(nullptr);
	info["coefficients"] = coefficients;
	info["converged"] = converged_;
	info["nobs"] = history_.size();
	return info;
}

ARIMABuilder &ARIMABuilder::withAR(int p) {
	p_ = p;
	return *this;
}

ARIMABuilder &ARIMABuilder::withDifferencing(int d) {
	d_ = d;
	return *this;
}

ARIMABuilder &ARIMABuilder::withMA(int q) {
	q_ = q;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalAR(int P) {
	P_ = P;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalDifferencing(int D) {
	D_ = D;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalMA(int Q) {
	Q_ = Q;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalPeriod(int s) {
	s_ = s;
	return *this;
}

ARIMABuilder &ARIMABuilder::withIntercept(bool include_intercept) {
	include_intercept_ = include_intercept;
	return *this;
}

std::unique_ptr<ARIMA> ARIMABuilder::build() {
	ATSA_DEBUG("Building ARIMA({},{},{})({},{},{},{}).", p_, d_, q_, P_, D_, Q_, s_);
	return std::unique_ptr<ARIMA>(new ARIMA(p_, d_, q_, P_, D_, Q_, s_, include_intercept_));
}

} // namespace atsa::models
