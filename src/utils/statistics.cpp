#include "atsa/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace atsa::utils::stats {

namespace {
constexpr double kPi = 3.14159265358979323846;
} // namespace

double mean(const std::vector<double> &values) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double variance(const std::vector<double> &values, int ddof) {
	const auto n = static_cast<double>(values.size());
	if (n - ddof <= 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double mu = mean(values);
	double accum = 0.0;
	for (double v : values) {
		accum += (v - mu) * (v - mu);
	}
	return accum / (n - ddof);
}

double stddev(const std::vector<double> &values, int ddof) {
	return std::sqrt(variance(values, ddof));
}

double median(std::vector<double> values) {
	return quantile(std::move(values), 0.5);
}

double quantile(std::vector<double> values, double q) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (q < 0.0 || q > 1.0) {
		throw std::invalid_argument("Quantile probability must lie in [0, 1].");
	}
	std::sort(values.begin(), values.end());
	const double position = q * static_cast<double>(values.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(position));
	const auto upper = std::min(lower + 1, values.size() - 1);
	const double fraction = position - static_cast<double>(lower);
	return values[lower] + fraction * (values[upper] - values[lower]);
}

std::vector<double> dropNaN(const std::vector<double> &values) {
	std::vector<double> out;
	out.reserve(values.size());
	std::copy_if(values.begin(), values.end(), std::back_inserter(out), [](double v) { return !std::isnan(v); });
	return out;
}

double normalCdf(double x) {
	return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double normalQuantile(double p) {
	if (p <= 0.0) {
		return -std::numeric_limits<double>::infinity();
	}
	if (p >= 1.0) {
		return std::numeric_limits<double>::infinity();
	}

	static const double a[] = {-3.969683028665376e1, 2.209460984245205e2,  -2.759285104469687e2,
	                           1.38357751867269e2,   -3.066479806614716e1, 2.506628277459239};
	static const double b[] = {-5.447609879822406e1, 1.615858368580409e2, -1.556989798598866e2, 6.680131188771972e1,
	                           -1.328068155288572e1};
	static const double c[] = {-7.784894002430293e-3, -3.223964580411365e-1, -2.400758277161838,
	                           -2.549732539343734,    4.374664141464968,     2.938163982698783};
	static const double d[] = {7.784695709041462e-3, 3.224671290700398e-1, 2.445134137142996, 3.754408661907416};
	constexpr double p_low = 0.02425;

	if (p < p_low) {
		const double q = std::sqrt(-2.0 * std::log(p));
		return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	}
	if (p > 1.0 - p_low) {
		return -normalQuantile(1.0 - p);
	}
	const double q = p - 0.5;
	const double r = q * q;
	double x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
	           (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);

	// One Halley step brings the approximation to full double precision.
	const double e = normalCdf(x) - p;
	const double u = e * std::sqrt(2.0 * kPi) * std::exp(x * x / 2.0);
	x = x - u / (1.0 + x * u / 2.0);
	return x;
}

double zForConfidence(double confidence) {
	if (!(confidence > 0.0 && confidence < 1.0)) {
		throw std::invalid_argument("Confidence level must lie strictly between 0 and 1.");
	}
	return normalQuantile(0.5 + confidence / 2.0);
}

} // namespace atsa::utils::stats
