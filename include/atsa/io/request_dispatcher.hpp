#pragma once

#include "atsa/analysis/statistical_analyzer.hpp"
#include "atsa/manager/model_manager.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace atsa::io {

/**
 * @struct CommandLine
 * @brief Parsed `atsa_cli <operation> [request.json] [--config settings.json]` arguments.
 */
struct CommandLine {
	std::optional<std::string> operation;
	std::optional<std::string> request_path;
	std::optional<std::string> config_path;
	bool help = false;
};

/**
 * @brief Parses the arguments after the program name.
 * @throws core::InvalidParameterError For a missing operation, a dangling --config or surplus arguments.
 */
CommandLine parseCommandLine(const std::vector<std::string> &args);

std::string usage();

/// Parses a request body; blank text is an empty request.
/// @throws core::DataFormatError When the text is not valid JSON.
nlohmann::json parseRequestText(const std::string &text);

struct Response {
	nlohmann::json body;
	int exit_code = 0;
};

/**
 * @class RequestDispatcher
 * @brief Routes a named operation and its JSON request to the manager or analyzer.
 *
 * The dispatcher only borrows @p manager and @p analyzer; both must outlive it.
 */
class RequestDispatcher {
public:
	RequestDispatcher(const manager::ModelManager &manager, const analysis::StatisticalAnalyzer &analyzer);

	/// Operation names in help order.
	static const std::vector<std::string> &operations();

	bool handles(const std::string &operation) const;

	/**
	 * @brief Runs one operation and returns its JSON result.
	 * @throws core::Error Whatever the operation raises; core::InvalidParameterError for an unknown name.
	 */
	nlohmann::json dispatch(const std::string &operation, const nlohmann::json &request) const;

	/// Like dispatch(), but failures become an `{error, code}` body with exit status 1.
	Response respond(const std::string &operation, const nlohmann::json &request) const;

private:
	using Handler = std::function<nlohmann::json(const nlohmann::json &)>;

	std::map<std::string, Handler> handlers_;
};

} // namespace atsa::io
