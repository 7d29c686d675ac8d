#pragma once

#include "atsa/core/time_series.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace atsa::data {

/**
 * @struct DataInput
 * @brief Tabular records plus the designation of the value and time columns.
 */
struct DataInput {
	std::vector<nlohmann::json> records;
	std::string value_column;
	std::optional<std::string> time_column;
};

/**
 * @class TimeSeriesAdapter
 * @brief Converts DataInput records into an ordered numeric TimeSeries.
 *
 * Value cells may be numbers or finite numeric strings; null, missing and
 * empty string cells are dropped. With a time column the records are stably
 * sorted by time and, for duplicate timestamps, the last record wins.
 */
class TimeSeriesAdapter final {
public:
	/**
	 * @throws core::DataFormatError When records or the value column are missing, or a cell is malformed.
	 * @throws core::InsufficientDataError When no observation survives the missing-value filter.
	 */
	static core::TimeSeries build(const DataInput &input);

	/// Number of records whose value cell is absent, null or blank.
	static std::size_t countMissing(const DataInput &input);

	/**
	 * @brief Parses a value cell; std::nullopt for a missing value.
	 * @throws core::DataFormatError For text that is not a number, or parses to NaN or infinity.
	 */
	static std::optional<double> parseValue(const nlohmann::json &cell, const std::string &column);

	/// Parses a time cell (date string or epoch seconds).
	static core::TimeSeries::TimePoint parseTime(const nlohmann::json &cell, const std::string &column);
};

} // namespace atsa::data
