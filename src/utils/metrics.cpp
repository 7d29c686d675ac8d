#include "atsa/utils/metrics.hpp"

#include <algorithm>
#include <stdexcept>

namespace atsa::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::mape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	std::size_t count = 0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		if (actual[i] != 0.0) {
			sum += std::abs((actual[i] - predicted[i]) / actual[i]);
			++count;
		}
	}
	if (count == 0) {
		return std::nullopt;
	}
	return (sum / static_cast<double>(count)) * 100.0;
}

AccuracyMetrics Metrics::evaluate(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const std::size_t common = std::min(actual.size(), predicted.size());
	std::vector<double> a;
	std::vector<double> p;
	a.reserve(common);
	p.reserve(common);
	for (std::size_t i = 0; i < common; ++i) {
		if (std::isnan(actual[i]) || std::isnan(predicted[i])) {
			continue;
		}
		a.push_back(actual[i]);
		p.push_back(predicted[i]);
	}

	AccuracyMetrics metrics;
	metrics.n = a.size();
	if (a.empty()) {
		metrics.error = "No valid data points for metric calculation";
		return metrics;
	}
	metrics.mae = mae(a, p);
	metrics.mse = mse(a, p);
	metrics.rmse = std::sqrt(metrics.mse);
	metrics.mape = mape(a, p);
	return metrics;
}

} // namespace atsa::utils
