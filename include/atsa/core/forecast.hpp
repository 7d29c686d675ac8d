#pragma once

#include <cstddef>
#include <vector>

namespace atsa::core {

/**
 * @struct Forecast
 * @brief Point predictions with a prediction interval of the same length.
 */
struct Forecast {
	using Series = std::vector<double>;

	Series point;
	Series lower;
	Series upper;

	/// Confidence level the interval was computed for.
	double confidence = 0.95;

	bool empty() const {
		return point.empty();
	}

	std::size_t horizon() const {
		return point.size();
	}

	void reserve(std::size_t horizon) {
		point.reserve(horizon);
		lower.reserve(horizon);
		upper.reserve(horizon);
	}

	/// Appends one step with a symmetric interval of half-width @p margin.
	void push(double value, double margin) {
		point.push_back(value);
		lower.push_back(value - margin);
		upper.push_back(value + margin);
	}
};

} // namespace atsa::core
