#include "atsa/utils/settings.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <type_traits>

namespace atsa::utils {

using json = nlohmann::json;

namespace {

template <typename T>
void readField(const json &config, const char *key, T &target) {
	auto it = config.find(key);
	if (it == config.end() || it->is_null()) {
		return;
	}
	if constexpr (std::is_integral_v<T>) {
		if (!it->is_number_integer()) {
			throw core::DataFormatError(std::string("Setting '") + key + "' must be an integer, got " + it->dump());
		}
	}
	try {
		target = it->get<T>();
	} catch (const json::exception &e) {
		throw core::DataFormatError(std::string("Invalid value for setting '") + key + "': " + e.what());
	}
}

const char *environment(const char *name) {
	const char *value = std::getenv(name);
	return (value != nullptr && *value != '\0') ? value : nullptr;
}

int parseInt(const char *name, const char *raw) {
	const std::string text(raw);
	std::size_t used = 0;
	int value = 0;
	try {
		value = std::stoi(text, &used);
	} catch (const std::exception &) {
		used = 0;
	}
	if (used == 0 || used != text.size()) {
		throw core::DataFormatError(std::string("Environment variable ") + name + " is not an integer: " + raw);
	}
	return value;
}

double parseDouble(const char *name, const char *raw) {
	try {
		return std::stod(raw);
	} catch (const std::exception &) {
		throw core::DataFormatError(std::string("Environment variable ") + name + " is not a number: " + raw);
	}
}

} // namespace

Settings::Settings() = default;

Settings Settings::fromJson(const json &config, Settings base) {
	if (!config.is_object()) {
		throw core::DataFormatError("Settings must be a JSON object.");
	}
	readField(config, "max_forecast_periods", base.max_forecast_periods);
	readField(config, "default_forecast_periods", base.default_forecast_periods);
	readField(config, "default_confidence_interval", base.default_confidence_interval);
	readField(config, "min_observations", base.min_observations);
	readField(config, "log_level", base.log_level);
	return base;
}

Settings Settings::load(const std::string &path) {
	if (!std::filesystem::exists(path)) {
		ATSA_WARN("Settings file {} not found, using defaults.", path);
		return {};
	}
	std::ifstream file(path);
	if (!file.is_open()) {
		throw core::DataFormatError("Cannot open settings file: " + path);
	}
	json config;
	try {
		file >> config;
	} catch (const json::parse_error &e) {
		throw core::DataFormatError("Failed to parse settings file " + path + ": " + e.what());
	}
	ATSA_DEBUG("Loaded settings from {}", path);
	return fromJson(config);
}

void Settings::applyEnvironment() {
	if (const char *raw = environment("ATSA_MAX_FORECAST_PERIODS")) {
		max_forecast_periods = parseInt("ATSA_MAX_FORECAST_PERIODS", raw);
	}
	if (const char *raw = environment("ATSA_DEFAULT_FORECAST_PERIODS")) {
		default_forecast_periods = parseInt("ATSA_DEFAULT_FORECAST_PERIODS", raw);
	}
	if (const char *raw = environment("ATSA_DEFAULT_CONFIDENCE_INTERVAL")) {
		default_confidence_interval = parseDouble("ATSA_DEFAULT_CONFIDENCE_INTERVAL", raw);
	}
	if (const char *raw = environment("ATSA_MIN_OBSERVATIONS")) {
		min_observations = parseInt("ATSA_MIN_OBSERVATIONS", raw);
	}
	if (const char *raw = environment("ATSA_LOG_LEVEL")) {
		log_level = raw;
	}
}

json Settings::toJson() const {
	return json {{"max_forecast_periods", max_forecast_periods},
	             {"default_forecast_periods", default_forecast_periods},
	             {"default_confidence_interval", default_confidence_interval},
	             {"min_observations", min_observations},
	             {"log_level", log_level}};
}

} // namespace atsa::utils
