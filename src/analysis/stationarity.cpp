#include "atsa/analysis/stationarity.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/logging.hpp"
#include "atsa/utils/statistics.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace atsa::analysis {

namespace {

constexpr double kSignificance = 0.05;
constexpr double kLog2Pi = 1.8378770664093453;

struct OlsFit {
	Eigen::VectorXd beta;
	double ssr = 0.0;
	double aic = 0.0;
	double tvalue0 = 0.0;
};

// Ordinary least squares with Gaussian log-likelihood AIC and the t-statistic of column 0.
OlsFit ols(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	OlsFit fit;
	const auto nobs = static_cast<double>(X.rows());
	const auto k = static_cast<double>(X.cols());
	fit.beta = X.colPivHouseholderQr().solve(y);
	const Eigen::VectorXd residuals = y - X * fit.beta;
	fit.ssr = residuals.squaredNorm();
	const double llf = -0.5 * nobs * (kLog2Pi + std::log(fit.ssr / nobs) + 1.0);
	fit.aic = -2.0 * llf + 2.0 * k;

	const double sigma2 = fit.ssr / (nobs - k);
	const Eigen::MatrixXd xtx = X.transpose() * X;
	const Eigen::VectorXd unit = Eigen::VectorXd::Unit(X.cols(), 0);
	const double var0 = sigma2 * xtx.ldlt().solve(unit)(0);
	fit.tvalue0 = fit.beta(0) / std::sqrt(var0);
	return fit;
}

// Design for the ADF regression with `lags` lagged differences over the last `rows` differences.
// Column 0 is the lagged level, the last column the constant.
void adfDesign(const std::vector<double> &x, const std::vector<double> &diff, std::size_t lags, std::size_t rows,
               Eigen::MatrixXd &X, Eigen::VectorXd &y) {
	const std::size_t offset = diff.size() - rows;
	X.resize(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(lags + 2));
	y.resize(static_cast<Eigen::Index>(rows));
	for (std::size_t r = 0; r < rows; ++r) {
		const std::size_t t = offset + r;
		const auto row = static_cast<Eigen::Index>(r);
		y(row) = diff[t];
		X(row, 0) = x[t];
		for (std::size_t j = 1; j <= lags; ++j) {
			X(row, static_cast<Eigen::Index>(j)) = diff[t - j];
		}
		X(row, static_cast<Eigen::Index>(lags + 1)) = 1.0;
	}
}

} // namespace

double mackinnonPValue(double statistic) {
	// MacKinnon (1994) response surface, one variable, constant only.
	constexpr double kTauMax = 2.74;
	constexpr double kTauMin = -18.83;
	constexpr double kTauStar = -1.61;
	constexpr std::array<double, 3> kSmallP {2.1659, 1.4412, 0.038269};
	constexpr std::array<double, 4> kLargeP {1.7339, 0.93202 * 1e-1, -0.12745 * 1e-1, -0.010368 * 1e-2};

	if (statistic > kTauMax) {
		return 1.0;
	}
	if (statistic < kTauMin) {
		return 0.0;
	}
	double z = 0.0;
	if (statistic <= kTauStar) {
		z = kSmallP[0] + statistic * (kSmallP[1] + statistic * kSmallP[2]);
	} else {
		z = kLargeP[0] + statistic * (kLargeP[1] + statistic * (kLargeP[2] + statistic * kLargeP[3]));
	}
	return utils::stats::normalCdf(z);
}

AdfResult adfTest(const std::vector<double> &values) {
	const std::size_t n = values.size();
	const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
	if (n > 0 && *min_it == *max_it) {
		throw core::FittingError("Invalid input, x is constant.");
	}
	if (n < 6) {
		throw core::InsufficientDataError("ADF test requires at least 6 observations.");
	}

	std::vector<double> diff(n - 1);
	for (std::size_t i = 1; i < n; ++i) {
		diff[i - 1] = values[i] - values[i - 1];
	}

	const auto schwert = static_cast<std::size_t>(std::ceil(12.0 * std::pow(static_cast<double>(n) / 100.0, 0.25)));
	const std::size_t max_lag = std::min(n / 2 - 2, schwert);

	// All candidate lag orders are compared on the sample of the largest one.
	const std::size_t common_rows = diff.size() - max_lag;
	Eigen::MatrixXd full_X;
	Eigen::VectorXd full_y;
	adfDesign(values, diff, max_lag, common_rows, full_X, full_y);

	std::size_t best_lag = 0;
	double best_aic = std::numeric_limits<double>::infinity();
	for (std::size_t lags = 0; lags <= max_lag; ++lags) {
		Eigen::MatrixXd X(full_X.rows(), static_cast<Eigen::Index>(lags + 2));
		X.leftCols(static_cast<Eigen::Index>(lags + 1)) = full_X.leftCols(static_cast<Eigen::Index>(lags + 1));
		X.col(static_cast<Eigen::Index>(lags + 1)) = full_X.col(full_X.cols() - 1);
		const double aic = ols(X, full_y).aic;
		if (aic < best_aic) {
			best_aic = aic;
			best_lag = lags;
		}
	}

	AdfResult result;
	result.used_lag = best_lag;
	result.nobs = diff.size() - best_lag;
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	adfDesign(values, diff, best_lag, result.nobs, X, y);
	result.statistic = ols(X, y).tvalue0;
	if (!std::isfinite(result.statistic)) {
		throw core::FittingError("ADF regression is degenerate.");
	}
	result.pvalue = mackinnonPValue(result.statistic);
	result.is_stationary = result.pvalue <= kSignificance;

	// MacKinnon (2010) finite-sample critical values.
	const double inv = 1.0 / static_cast<double>(result.nobs);
	const auto crit = [inv](double b0, double b1, double b2, double b3) {
		return b0 + inv * (b1 + inv * (b2 + inv * b3));
	};
	result.critical_values = {{"1%", crit(-3.43035, -6.5393, -16.786, -79.433)},
	                          {"5%", crit(-2.86154, -2.8903, -4.234, -40.04)},
	                          {"10%", crit(-2.56677, -1.5384, -2.809, 0.0)}};

	ATSA_DEBUG("ADF statistic={:.4f} p={:.4f} lag={} nobs={}", result.statistic, result.pvalue, result.used_lag,
	           result.nobs);
	return result;
}

KpssResult kpssTest(const std::vector<double> &values) {
	const std::size_t n = values.size();
	if (n < 3) {
		throw core::InsufficientDataError("KPSS test requires at least 3 observations.");
	}
	const double mean = utils::stats::mean(values);
	std::vector<double> resid(n);
	for (std::size_t i = 0; i < n; ++i) {
		resid[i] = values[i] - mean;
	}
	const auto dn = static_cast<double>(n);
	const auto autocov = [&](std::size_t lag) {
		double sum = 0.0;
		for (std::size_t t = lag; t < n; ++t) {
			sum += resid[t] * resid[t - lag];
		}
		return sum;
	};

	const double gamma0 = autocov(0);
	if (gamma0 == 0.0) {
		throw core::FittingError("KPSS test is undefined for a constant series.");
	}

	// Hobijn, Franses and Ooms (1998) bandwidth.
	const auto cov_lags = static_cast<std::size_t>(std::pow(dn, 2.0 / 9.0));
	double s0 = gamma0 / dn;
	double s1 = 0.0;
	for (std::size_t i = 1; i <= cov_lags && i < n; ++i) {
		const double prod = autocov(i) / (dn / 2.0);
		s0 += prod;
		s1 += static_cast<double>(i) * prod;
	}
	const double s_hat = s1 / s0;
	const double gamma_hat = 1.1447 * std::pow(s_hat * s_hat, 1.0 / 3.0);
	const auto auto_lags = static_cast<std::size_t>(std::max(0.0, gamma_hat * std::pow(dn, 1.0 / 3.0)));

	KpssResult result;
	result.lags = std::min(auto_lags, n - 1);

	double partial = 0.0;
	double eta = 0.0;
	for (double r : resid) {
		partial += r;
		eta += partial * partial;
	}
	eta /= dn * dn;

	double long_run = gamma0;
	for (std::size_t i = 1; i <= result.lags; ++i) {
		long_run += 2.0 * autocov(i) * (1.0 - static_cast<double>(i) / (static_cast<double>(result.lags) + 1.0));
	}
	long_run /= dn;
	if (!(long_run > 0.0)) {
		throw core::FittingError("KPSS long-run variance estimate is not positive.");
	}
	result.statistic = eta / long_run;

	// Kwiatkowski et al. (1992) table, level stationarity.
	constexpr std::array<double, 4> kCrit {0.347, 0.463, 0.574, 0.739};
	constexpr std::array<double, 4> kPValues {0.10, 0.05, 0.025, 0.01};
	if (result.statistic <= kCrit.front()) {
		result.pvalue = kPValues.front();
	} else if (result.statistic >= kCrit.back()) {
		result.pvalue = kPValues.back();
	} else {
		for (std::size_t i = 1; i < kCrit.size(); ++i) {
			if (result.statistic <= kCrit[i]) {
				const double w = (result.statistic - kCrit[i - 1]) / (kCrit[i] - kCrit[i - 1]);
				result.pvalue = kPValues[i - 1] + w * (kPValues[i] - kPValues[i - 1]);
				break;
			}
		}
	}
	result.critical_values = {{"10%", kCrit[0]}, {"5%", kCrit[1]}, {"2.5%", kCrit[2]}, {"1%", kCrit[3]}};
	result.is_stationary = result.pvalue > kSignificance;

	ATSA_DEBUG("KPSS statistic={:.4f} p={:.4f} lags={}", result.statistic, result.pvalue, result.lags);
	return result;
}

std::string stationarityRecommendation(bool adf_stationary, bool kpss_stationary) {
	if (adf_stationary && kpss_stationary) {
		return "Series appears to be stationary. Proceed with modeling.";
	}
	if (!adf_stationary && !kpss_stationary) {
		return "Series is non-stationary. Consider differencing or detrending.";
	}
	if (adf_stationary) {
		return "Mixed results. ADF suggests stationary, KPSS suggests non-stationary. Investigate further.";
	}
	return "Mixed results. Consider additional testing or visual inspection.";
}

} // namespace atsa::analysis
