#include "atsa/data/time_series_adapter.hpp"

#include "atsa/core/calendar.hpp"
#include "atsa/core/errors.hpp"
#include "atsa/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace atsa::data {

namespace {

std::string trim(const std::string &text) {
	auto begin = text.begin();
	auto end = text.end();
	while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
		++begin;
	}
	while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
		--end;
	}
	return std::string(begin, end);
}

const nlohmann::json *findCell(const nlohmann::json &record, const std::string &column) {
	auto it = record.find(column);
	return it == record.end() ? nullptr : &*it;
}

} // namespace

std::optional<double> TimeSeriesAdapter::parseValue(const nlohmann::json &cell, const std::string &column) {
	if (cell.is_null()) {
		return std::nullopt;
	}
	std::optional<double> value;
	if (cell.is_number()) {
		value = cell.get<double>();
	} else if (cell.is_string()) {
		const std::string text = trim(cell.get<std::string>());
		if (text.empty()) {
			return std::nullopt;
		}
		char *end = nullptr;
		const double parsed = std::strtod(text.c_str(), &end);
		if (end == text.c_str() + text.size()) {
			value = parsed;
		}
	}
	if (!value) {
		throw core::DataFormatError("Column '" + column + "' contains a non-numeric value: " + cell.dump());
	}
	if (!std::isfinite(*value)) {
		throw core::DataFormatError("Column '" + column + "' contains a non-finite value: " + cell.dump());
	}
	return value;
}

std::size_t TimeSeriesAdapter::countMissing(const DataInput &input) {
	std::size_t missing = 0;
	for (const auto &record : input.records) {
		const nlohmann::json *cell = record.is_object() ? findCell(record, input.value_column) : nullptr;
		if (!cell || cell->is_null() || (cell->is_string() && trim(cell->get<std::string>()).empty())) {
			++missing;
		}
	}
	return missing;
}

core::TimeSeries::TimePoint TimeSeriesAdapter::parseTime(const nlohmann::json &cell, const std::string &column) {
	if (cell.is_number()) {
		return core::calendar::fromEpochSeconds(cell.get<double>());
	}
	if (cell.is_string()) {
		if (auto tp = core::calendar::parseTimestamp(trim(cell.get<std::string>()))) {
			return *tp;
		}
	}
	throw core::DataFormatError("Column '" + column + "' contains an unparseable timestamp: " + cell.dump());
}

core::TimeSeries TimeSeriesAdapter::build(const DataInput &input) {
	if (input.records.empty() || input.value_column.empty()) {
		throw core::DataFormatError("Invalid data format: records and value_column are required.");
	}

	bool value_seen = false;
	bool time_seen = false;
	for (const auto &record : input.records) {
		if (!record.is_object()) {
			throw core::DataFormatError("Invalid data format: every record must be an object.");
		}
		value_seen = value_seen || findCell(record, input.value_column) != nullptr;
		if (input.time_column) {
			time_seen = time_seen || findCell(record, *input.time_column) != nullptr;
		}
	}
	if (!value_seen) {
		throw core::DataFormatError("Value column '" + input.value_column + "' not found in data.");
	}
	if (input.time_column && !time_seen) {
		throw core::DataFormatError("Time column '" + *input.time_column + "' not found in data.");
	}

	std::vector<std::pair<core::TimeSeries::TimePoint, double>> rows;
	std::vector<double> values;
	std::size_t dropped = 0;
	for (const auto &record : input.records) {
		const nlohmann::json *cell = findCell(record, input.value_column);
		const auto value = cell ? parseValue(*cell, input.value_column) : std::nullopt;
		if (!value) {
			++dropped;
			continue;
		}
		if (!input.time_column) {
			values.push_back(*value);
			continue;
		}
		const nlohmann::json *time_cell = findCell(record, *input.time_column);
		if (!time_cell || time_cell->is_null()) {
			throw core::DataFormatError("Record is missing a timestamp in column '" + *input.time_column + "'.");
		}
		rows.emplace_back(parseTime(*time_cell, *input.time_column), *value);
	}
	if (dropped > 0) {
		ATSA_DEBUG("Dropped {} records with missing '{}' values.", dropped, input.value_column);
	}

	if (!input.time_column) {
		if (values.empty()) {
			throw core::InsufficientDataError("No valid observations in column '" + input.value_column + "'.");
		}
		return core::TimeSeries(std::move(values));
	}

	std::stable_sort(rows.begin(), rows.end(),
	                 [](const auto &lhs, const auto &rhs) { return lhs.first < rhs.first; });
	std::vector<core::TimeSeries::TimePoint> timestamps;
	timestamps.reserve(rows.size());
	values.reserve(rows.size());
	for (const auto &row : rows) {
		if (!timestamps.empty() && timestamps.back() == row.first) {
			values.back() = row.second;
			continue;
		}
		timestamps.push_back(row.first);
		values.push_back(row.second);
	}
	if (timestamps.size() < rows.size()) {
		ATSA_DEBUG("Collapsed {} duplicate timestamps.", rows.size() - timestamps.size());
	}
	if (values.empty()) {
		throw core::InsufficientDataError("No valid observations in column '" + input.value_column + "'.");
	}
	return core::TimeSeries(std::move(timestamps), std::move(values));
}

} // namespace atsa::data
