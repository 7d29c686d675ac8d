#include "atsa/io/request_dispatcher.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/data/time_series_adapter.hpp"
#include "atsa/io/json_codec.hpp"
#include "atsa/models/parameters.hpp"
#include "atsa/utils/logging.hpp"

#include <sstream>

namespace atsa::io {

namespace {

core::TimeSeries series(const json &request) {
	return data::TimeSeriesAdapter::build(dataFromRequest(request));
}

int boundedOption(const json &request, const char *key, int fallback, int minimum) {
	const int value = models::getParam<int>(request, key, fallback);
	if (value < minimum) {
		throw core::InvalidParameterError(std::string(key) + " must be at least " + std::to_string(minimum) + ".");
	}
	return value;
}

} // namespace

CommandLine parseCommandLine(const std::vector<std::string> &args) {
	CommandLine command;
	for (std::size_t i = 0; i < args.size(); ++i) {
		const auto &arg = args[i];
		if (arg == "--help" || arg == "-h") {
			command.help = true;
			return command;
		}
		if (arg == "--config") {
			if (i + 1 >= args.size()) {
				throw core::InvalidParameterError("--config needs a settings file.");
			}
			command.config_path = args[++i];
		} else if (!command.operation) {
			command.operation = arg;
		} else if (!command.request_path) {
			command.request_path = arg;
		} else {
			throw core::InvalidParameterError("Unexpected argument: " + arg);
		}
	}
	if (!command.operation) {
		throw core::InvalidParameterError("Missing operation.");
	}
	return command;
}

std::string usage() {
	std::ostringstream out;
	out << "Usage: atsa_cli <operation> [request.json] [--config settings.json]\n"
	    << "Operations:";
	for (const auto &name : RequestDispatcher::operations()) {
		out << ' ' << name;
	}
	out << "\nThe request is read from stdin when no file is given.\n";
	return out.str();
}

json parseRequestText(const std::string &text) {
	if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
		return json::object();
	}
	try {
		return json::parse(text);
	} catch (const json::parse_error &e) {
		throw core::DataFormatError(std::string("Request is not valid JSON: ") + e.what());
	}
}

const std::vector<std::string> &RequestDispatcher::operations() {
	static const std::vector<std::string> names {
	    "models",   "forecast",      "compare",  "auto-select",  "analyze", "stationarity",
	    "seasonality", "decompose", "acf-pacf", "rolling-stats", "outliers", "comprehensive"};
	return names;
}

RequestDispatcher::RequestDispatcher(const manager::ModelManager &manager,
                                     const analysis::StatisticalAnalyzer &analyzer) {
	handlers_ = {
	    {"models", [&manager](const json &) { return toJson(manager.availableModels()); }},
	    {"forecast",
	     [&manager](const json &request) {
		     const auto config = parseModelConfiguration(request.value("model_configuration", json::object()));
		     return toJson(manager.fitAndForecast(dataFromRequest(request), config));
	     }},
	    {"compare",
	     [&manager](const json &request) {
		     std::vector<manager::ModelConfiguration> configs;
		     for (const auto &entry : request.value("model_configurations", json::array())) {
			     configs.push_back(parseModelConfiguration(entry));
		     }
		     if (configs.empty()) {
			     throw core::InvalidParameterError("compare needs a non-empty model_configurations list.");
		     }
		     return toJson(manager.compareModels(dataFromRequest(request), configs));
	     }},
	    {"auto-select", [&manager](const json &request) { return toJson(manager.autoSelect(dataFromRequest(request))); }},
	    {"analyze", [&manager](const json &request) { return toJson(manager.analyzeData(dataFromRequest(request))); }},
	    {"stationarity", [&analyzer](const json &request) { return toJson(analyzer.testStationarity(series(request))); }},
	    {"seasonality", [&analyzer](const json &request) { return toJson(analyzer.testSeasonality(series(request))); }},
	    {"decompose",
	     [&analyzer](const json &request) {
		     const auto mode =
		         analysis::parseDecompositionMode(models::getParam<std::string>(request, "method", "additive"));
		     std::optional<int> period;
		     if (request.contains("period") && !request["period"].is_null()) {
			     period = boundedOption(request, "period", 12, 2);
		     }
		     return toJson(analyzer.decompose(series(request), mode, period));
	     }},
	    {"acf-pacf",
	     [&analyzer](const json &request) {
		     const int lags = boundedOption(request, "lags", 40, 0);
		     return toJson(analyzer.acfPacf(series(request), static_cast<std::size_t>(lags)));
	     }},
	    {"rolling-stats",
	     [&analyzer](const json &request) {
		     const int window = boundedOption(request, "window", 12, 1);
		     return toJson(analyzer.rollingStatistics(series(request), static_cast<std::size_t>(window)));
	     }},
	    {"outliers",
	     [&analyzer](const json &request) {
		     const auto method = analysis::parseOutlierMethod(models::getParam<std::string>(request, "method", "iqr"));
		     return toJson(analyzer.detectOutliers(series(request), method));
	     }},
	    {"comprehensive",
	     [&analyzer](const json &request) { return toJson(analyzer.comprehensiveAnalysis(dataFromRequest(request))); }},
	};
}

bool RequestDispatcher::handles(const std::string &operation) const {
	return handlers_.count(operation) != 0;
}

json RequestDispatcher::dispatch(const std::string &operation, const json &request) const {
	auto it = handlers_.find(operation);
	if (it == handlers_.end()) {
		throw core::InvalidParameterError("Unknown operation: " + operation);
	}
	return it->second(request);
}

Response RequestDispatcher::respond(const std::string &operation, const json &request) const {
	try {
		return {dispatch(operation, request), 0};
	} catch (const core::Error &e) {
		ATSA_DEBUG("{} failed: {}", operation, e.what());
		return {toJson(core::ErrorInfo {e.code(), e.what()}), 1};
	} catch (const std::exception &e) {
		ATSA_ERROR("{} failed unexpectedly: {}", operation, e.what());
		return {json {{"error", e.what()}, {"code", "internal"}}, 1};
	}
}

} // namespace atsa::io
