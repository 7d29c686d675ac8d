#include "atsa/analysis/statistical_analyzer.hpp"
#include "atsa/core/errors.hpp"
#include "atsa/io/json_codec.hpp"
#include "atsa/io/request_dispatcher.hpp"
#include "atsa/manager/model_manager.hpp"
#include "atsa/utils/logging.hpp"
#include "atsa/utils/settings.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace atsa;
using nlohmann::json;

namespace {

json readRequest(const std::optional<std::string> &path) {
	std::string text;
	if (path) {
		std::ifstream in(*path);
		if (!in) {
			throw core::DataFormatError("Cannot open request file: " + *path);
		}
		text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	} else {
		text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
	}
	return io::parseRequestText(text);
}

} // namespace

int main(int argc, char **argv) {
	io::CommandLine command;
	try {
		command = io::parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
	} catch (const core::InvalidParameterError &e) {
		std::cerr << e.what() << "\n" << io::usage();
		return 2;
	}
	if (command.help) {
		std::cout << io::usage();
		return 0;
	}

	try {
		auto settings = command.config_path ? utils::Settings::load(*command.config_path) : utils::Settings {};
		settings.applyEnvironment();
		utils::Logging::init(settings.log_level);

		const manager::ModelManager manager(settings);
		const analysis::StatisticalAnalyzer analyzer;
		const io::RequestDispatcher dispatcher(manager, analyzer);
		if (!dispatcher.handles(*command.operation)) {
			std::cerr << "Unknown operation: " << *command.operation << "\n" << io::usage();
			return 2;
		}

		const json request = *command.operation == "models" ? json::object() : readRequest(command.request_path);
		const auto response = dispatcher.respond(*command.operation, request);
		std::cout << response.body.dump(2) << std::endl;
		return response.exit_code;
	} catch (const core::Error &e) {
		std::cout << io::toJson(core::ErrorInfo {e.code(), e.what()}).dump(2) << std::endl;
		return 1;
	}
}
