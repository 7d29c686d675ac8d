#include <catch2/catch_test_macros.hpp>

#include "atsa/utils/logging.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <thread>
#include <vector>

using atsa::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "atsa");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Logging accepts level names", "[utils][logging]") {
	const auto first_level = Logging::getLogger()->level();

	Logging::init("warn");
	REQUIRE(Logging::getLogger()->level() == spdlog::level::warn);
	Logging::init("bogus");
	REQUIRE(Logging::getLogger()->level() == spdlog::level::info);
	Logging::init(spdlog::level::err);
	REQUIRE(Logging::getLogger()->level() == spdlog::level::err);

	Logging::init(first_level);
}

TEST_CASE("Logger is shared by concurrent callers", "[utils][logging][threads]") {
	constexpr int kThreads = 16;
	std::atomic<bool> start {false};
	std::vector<spdlog::logger *> seen(kThreads, nullptr);
	std::vector<std::thread> workers;
	for (int i = 0; i < kThreads; ++i) {
		workers.emplace_back([&, i] {
			while (!start.load()) {
				std::this_thread::yield();
			}
			ATSA_TRACE("worker {} started", i);
			seen[static_cast<std::size_t>(i)] = Logging::getLogger().get();
		});
	}
	start = true;
	for (auto &worker : workers) {
		worker.join();
	}

	REQUIRE(seen.front() != nullptr);
	for (auto *logger : seen) {
		REQUIRE(logger == seen.front());
	}
	REQUIRE(spdlog::get("atsa").get() == seen.front());
}
