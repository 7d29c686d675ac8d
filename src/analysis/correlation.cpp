#include "atsa/analysis/correlation.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/statistics.hpp"

#include <cmath>

namespace atsa::analysis {

namespace {

// Autocovariances of the demeaned series, divided by n (biased) or n - k (unbiased).
std::vector<double> autocovariances(const std::vector<double> &values, std::size_t nlags, bool unbiased) {
	const std::size_t n = values.size();
	const double mean = utils::stats::mean(values);
	std::vector<double> acov(nlags + 1, 0.0);
	for (std::size_t k = 0; k <= nlags; ++k) {
		double sum = 0.0;
		for (std::size_t t = k; t < n; ++t) {
			sum += (values[t] - mean) * (values[t - k] - mean);
		}
		acov[k] = sum / static_cast<double>(unbiased ? n - k : n);
	}
	return acov;
}

void requireLags(const std::vector<double> &values, std::size_t nlags) {
	if (values.size() < 2) {
		throw core::InsufficientDataError("Correlation analysis requires at least 2 observations.");
	}
	if (nlags >= values.size()) {
		throw core::InvalidParameterError("Number of lags must be smaller than the series length.");
	}
}

} // namespace

Correlogram autocorrelation(const std::vector<double> &values, std::size_t nlags) {
	requireLags(values, nlags);
	const auto acov = autocovariances(values, nlags, false);
	if (acov[0] == 0.0) {
		throw core::FittingError("Autocorrelation is undefined for a constant series.");
	}
	const double z = utils::stats::zForConfidence(0.95);
	const auto n = static_cast<double>(values.size());

	Correlogram result;
	result.values.resize(nlags + 1);
	for (std::size_t k = 0; k <= nlags; ++k) {
		result.values[k] = acov[k] / acov[0];
	}
	double cumulative = 0.0;
	for (std::size_t k = 0; k <= nlags; ++k) {
		double variance = 0.0;
		if (k >= 1) {
			variance = (1.0 + 2.0 * cumulative) / n;
			cumulative += result.values[k] * result.values[k];
		}
		const double margin = z * std::sqrt(variance);
		result.lower.push_back(result.values[k] - margin);
		result.upper.push_back(result.values[k] + margin);
	}
	return result;
}

Correlogram partialAutocorrelation(const std::vector<double> &values, std::size_t nlags) {
	requireLags(values, nlags);
	const auto acov = autocovariances(values, nlags, true);
	if (acov[0] == 0.0) {
		throw core::FittingError("Partial autocorrelation is undefined for a constant series.");
	}
	std::vector<double> r(nlags + 1);
	for (std::size_t k = 0; k <= nlags; ++k) {
		r[k] = acov[k] / acov[0];
	}

	Correlogram result;
	result.values.assign(nlags + 1, 0.0);
	result.values[0] = 1.0;
	std::vector<double> phi;
	std::vector<double> previous;
	double sigma = 1.0;
	for (std::size_t k = 1; k <= nlags; ++k) {
		double num = r[k];
		for (std::size_t j = 1; j < k; ++j) {
			num -= previous[j - 1] * r[k - j];
		}
		const double reflection = sigma == 0.0 ? 0.0 : num / sigma;
		phi.assign(k, 0.0);
		phi[k - 1] = reflection;
		for (std::size_t j = 1; j < k; ++j) {
			phi[j - 1] = previous[j - 1] - reflection * previous[k - j - 1];
		}
		sigma *= 1.0 - reflection * reflection;
		result.values[k] = reflection;
		previous = phi;
	}

	const double margin = utils::stats::zForConfidence(0.95) / std::sqrt(static_cast<double>(values.size()));
	for (std::size_t k = 0; k <= nlags; ++k) {
		const double width = k == 0 ? 0.0 : margin;
		result.lower.push_back(result.values[k] - width);
		result.upper.push_back(result.values[k] + width);
	}
	return result;
}

} // namespace atsa::analysis
