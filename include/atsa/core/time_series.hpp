#pragma once

#include "atsa/core/calendar.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace atsa::core {

/**
 * @class TimeSeries
 * @brief An ordered univariate series with an optional time index.
 *
 * Values are stored contiguously for numerical processing. When a time index
 * is present it has one strictly increasing timestamp per value.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;

	/**
	 * @brief Constructs a series without a time index.
	 * @param values The observations in order.
	 */
	explicit TimeSeries(std::vector<Value> values) : values_(std::move(values)) {
	}

	/**
	 * @brief Constructs a dated series.
	 * @throws std::invalid_argument If the sizes differ or timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values)
	    : timestamps_(std::move(timestamps)), values_(std::move(values)) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (timestamps_[i] <= timestamps_[i - 1]) {
				throw std::invalid_argument("Timestamps must be strictly increasing.");
			}
		}
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	/// Empty when the series carries no time index.
	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	bool hasTimeIndex() const {
		return !timestamps_.empty();
	}

	std::size_t size() const {
		return values_.size();
	}

	bool isEmpty() const {
		return values_.empty();
	}

	Value operator[](std::size_t index) const {
		return values_[index];
	}

	/// Regular spacing of the time index, if any.
	std::optional<calendar::TimeStep> inferStep() const {
		if (!hasTimeIndex()) {
			return std::nullopt;
		}
		return calendar::inferStep(timestamps_);
	}

	/// Median spacing between consecutive timestamps, in days.
	std::optional<double> medianSpacingDays() const {
		if (timestamps_.size() < 2) {
			return std::nullopt;
		}
		std::vector<double> diffs;
		diffs.reserve(timestamps_.size() - 1);
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			const auto delta = std::chrono::duration_cast<std::chrono::seconds>(timestamps_[i] - timestamps_[i - 1]);
			diffs.push_back(static_cast<double>(delta.count()) / 86400.0);
		}
		std::nth_element(diffs.begin(), diffs.begin() + static_cast<std::ptrdiff_t>(diffs.size() / 2), diffs.end());
		return diffs[diffs.size() / 2];
	}

	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the time series.");
		}
		std::vector<Value> values(values_.begin() + static_cast<std::ptrdiff_t>(start),
		                          values_.begin() + static_cast<std::ptrdiff_t>(end));
		if (!hasTimeIndex()) {
			return TimeSeries(std::move(values));
		}
		std::vector<TimePoint> stamps(timestamps_.begin() + static_cast<std::ptrdiff_t>(start),
		                              timestamps_.begin() + static_cast<std::ptrdiff_t>(end));
		return TimeSeries(std::move(stamps), std::move(values));
	}

	/// Number of NaN entries.
	std::size_t countMissing() const {
		std::size_t count = 0;
		for (double v : values_) {
			if (std::isnan(v)) {
				++count;
			}
		}
		return count;
	}

private:
	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
};

} // namespace atsa::core
