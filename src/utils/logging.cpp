#include "atsa/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>

namespace atsa::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {

std::once_flag logger_once;

} // namespace

void Logging::ensureCreated() {
	std::call_once(logger_once, [] {
		auto logger = spdlog::get("atsa");
		if (!logger) {
			// Diagnostics go to stderr so JSON written to stdout stays clean.
			logger = spdlog::stderr_color_mt("atsa");
			logger->set_level(spdlog::level::info);
			logger->flush_on(spdlog::level::info);
		}
		logger_ = std::move(logger);
	});
}

void Logging::init(spdlog::level::level_enum level) {
	ensureCreated();
	logger_->set_level(level);
	logger_->flush_on(level);
}

void Logging::init(const std::string &level_name) {
	auto level = spdlog::level::from_str(level_name);
	if (level == spdlog::level::off && level_name != "off") {
		level = spdlog::level::info;
	}
	init(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	ensureCreated();
	return logger_;
}

} // namespace atsa::utils
