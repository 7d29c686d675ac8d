#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace atsa::utils {

/**
 * @struct Settings
 * @brief Service limits and defaults applied to forecast requests.
 *
 * Values come from the built-in defaults, then an optional JSON file, then
 * ATSA_* environment variables.
 */
struct Settings {
	Settings();

	int max_forecast_periods = 365;
	int default_forecast_periods = 30;
	double default_confidence_interval = 0.95;
	int min_observations = 10;
	std::string log_level = "info";

	/// Overrides the fields present in @p config. Throws DataFormatError on wrong types.
	static Settings fromJson(const nlohmann::json &config, Settings base = {});

	/// Reads a JSON file. A missing file yields defaults; a malformed one throws DataFormatError.
	static Settings load(const std::string &path);

	/// Applies ATSA_MAX_FORECAST_PERIODS and friends on top of the current values.
	void applyEnvironment();

	nlohmann::json toJson() const;
};

} // namespace atsa::utils
