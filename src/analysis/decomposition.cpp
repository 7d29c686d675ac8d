#include "atsa/analysis/decomposition.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace atsa::analysis {

namespace {

// Least-squares line through (x, trend[x]) for x in [first, last), evaluated at `at`.
double lineAt(const std::vector<double> &trend, std::size_t first, std::size_t last, double at) {
	const auto count = static_cast<double>(last - first);
	double sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0;
	for (std::size_t i = first; i < last; ++i) {
		const auto x = static_cast<double>(i);
		sx += x;
		sy += trend[i];
		sxx += x * x;
		sxy += x * trend[i];
	}
	const double denom = count * sxx - sx * sx;
	const double slope = denom == 0.0 ? 0.0 : (count * sxy - sx * sy) / denom;
	const double intercept = (sy - slope * sx) / count;
	return intercept + slope * at;
}

} // namespace

DecompositionMode parseDecompositionMode(const std::string &name) {
	if (name == "additive" || name == "add") {
		return DecompositionMode::Additive;
	}
	if (name == "multiplicative" || name == "mul") {
		return DecompositionMode::Multiplicative;
	}
	throw core::InvalidParameterError("Decomposition method must be 'additive' or 'multiplicative', got '" + name +
	                                  "'.");
}

std::string toString(DecompositionMode mode) {
	return mode == DecompositionMode::Additive ? "additive" : "multiplicative";
}

Decomposition classicalDecompose(const std::vector<double> &values, int period, DecompositionMode mode) {
	if (period < 2) {
		throw core::InvalidParameterError("Decomposition period must be at least 2.");
	}
	const std::size_t n = values.size();
	const auto m = static_cast<std::size_t>(period);
	if (n < 2 * m) {
		throw core::InsufficientDataError("Need at least " + std::to_string(2 * m) + " observations for period " +
		                                  std::to_string(period) + ".");
	}
	const bool multiplicative = mode == DecompositionMode::Multiplicative;
	if (multiplicative && std::any_of(values.begin(), values.end(), [](double v) { return v <= 0.0; })) {
		throw core::FittingError("Multiplicative decomposition is not appropriate for zero and negative values.");
	}

	// Centred moving average; even periods use weights 1/2m at both ends.
	std::vector<double> weights;
	if (m % 2 == 0) {
		weights.assign(m + 1, 1.0 / static_cast<double>(m));
		weights.front() = weights.back() = 0.5 / static_cast<double>(m);
	} else {
		weights.assign(m, 1.0 / static_cast<double>(m));
	}
	const std::size_t half = weights.size() / 2;
	std::vector<double> trend(n, 0.0);
	for (std::size_t i = half; i + half < n; ++i) {
		double sum = 0.0;
		for (std::size_t j = 0; j < weights.size(); ++j) {
			sum += weights[j] * values[i - half + j];
		}
		trend[i] = sum;
	}

	const std::size_t front = half;
	const std::size_t back = n - 1 - half;
	const std::size_t front_last = std::min(front + m, back);
	for (std::size_t i = 0; i < front; ++i) {
		trend[i] = lineAt(trend, front, front_last, static_cast<double>(i));
	}
	const std::size_t back_first = back > m ? std::max(front, back - m) : front;
	for (std::size_t i = back + 1; i < n; ++i) {
		trend[i] = lineAt(trend, back_first, back, static_cast<double>(i));
	}

	std::vector<double> detrended(n);
	for (std::size_t i = 0; i < n; ++i) {
		detrended[i] = multiplicative ? values[i] / trend[i] : values[i] - trend[i];
	}

	std::vector<double> indices(m, 0.0);
	for (std::size_t phase = 0; phase < m; ++phase) {
		double sum = 0.0;
		std::size_t count = 0;
		for (std::size_t i = phase; i < n; i += m) {
			if (std::isfinite(detrended[i])) {
				sum += detrended[i];
				++count;
			}
		}
		indices[phase] = count > 0 ? sum / static_cast<double>(count) : 0.0;
	}
	double center = 0.0;
	for (double v : indices) {
		center += v;
	}
	center /= static_cast<double>(m);
	for (double &v : indices) {
		v = multiplicative ? v / center : v - center;
	}

	Decomposition result;
	result.period = period;
	result.mode = mode;
	result.trend = std::move(trend);
	result.seasonal.resize(n);
	result.residual.resize(n);
	for (std::size_t i = 0; i < n; ++i) {
		result.seasonal[i] = indices[i % m];
		result.residual[i] = multiplicative ? detrended[i] / result.seasonal[i] : detrended[i] - result.seasonal[i];
	}

	ATSA_DEBUG("Decomposed {} points with period {} ({}).", n, period, toString(mode));
	return result;
}

} // namespace atsa::analysis
