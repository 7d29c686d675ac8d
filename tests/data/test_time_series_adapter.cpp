#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "atsa/core/calendar.hpp"
#include "atsa/core/errors.hpp"
#include "atsa/data/time_series_adapter.hpp"

#include <limits>
#include <vector>

using atsa::data::DataInput;
using atsa::data::TimeSeriesAdapter;
using json = nlohmann::json;

TEST_CASE("Adapter rejects malformed input", "[data][adapter][validation]") {
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build({{}, "value", std::nullopt}), atsa::core::DataFormatError);
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build({{json {{"value", 1}}}, "", std::nullopt}),
	                  atsa::core::DataFormatError);
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build({{json::array({1, 2})}, "value", std::nullopt}),
	                  atsa::core::DataFormatError);
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build({{json {{"amount", 1}}}, "value", std::nullopt}),
	                  atsa::core::DataFormatError);
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build({{json {{"value", 1}}}, "value", std::string("date")}),
	                  atsa::core::DataFormatError);
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build({{json {{"value", "abc"}}}, "value", std::nullopt}),
	                  atsa::core::DataFormatError);
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build({{json {{"value", true}}}, "value", std::nullopt}),
	                  atsa::core::DataFormatError);
}

TEST_CASE("Adapter drops missing values and parses numeric strings", "[data][adapter]") {
	DataInput input {{json {{"value", 1.5}}, json {{"value", nullptr}}, json {{"value", " 2.5 "}}, json {{"other", 1}},
	                  json {{"value", ""}}, json {{"value", 4}}},
	                 "value",
	                 std::nullopt};
	const auto ts = TimeSeriesAdapter::build(input);
	REQUIRE_FALSE(ts.hasTimeIndex());
	REQUIRE(ts.getValues() == std::vector<double> {1.5, 2.5, 4.0});
	REQUIRE(TimeSeriesAdapter::countMissing(input) == 3);
}

TEST_CASE("Adapter reports when nothing survives", "[data][adapter]") {
	DataInput input {{json {{"value", nullptr}}, json {{"value", ""}}}, "value", std::nullopt};
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build(input), atsa::core::InsufficientDataError);
}

TEST_CASE("Adapter sorts by time and keeps the last duplicate", "[data][adapter][time]") {
	DataInput input {{json {{"date", "2023-01-03"}, {"sales", 30}}, json {{"date", "2023-01-01"}, {"sales", 10}},
	                  json {{"date", "2023-01-02"}, {"sales", 20}}, json {{"date", "2023-01-01"}, {"sales", 11}}},
	                 "sales",
	                 std::string("date")};
	const auto ts = TimeSeriesAdapter::build(input);
	REQUIRE(ts.hasTimeIndex());
	REQUIRE(ts.getValues() == std::vector<double> {11.0, 20.0, 30.0});
	REQUIRE(atsa::core::calendar::formatDate(ts.getTimestamps().front()) == "2023-01-01");
	REQUIRE(ts.inferStep().has_value());
}

TEST_CASE("Adapter parses epoch and rejects bad timestamps", "[data][adapter][time]") {
	DataInput epoch {{json {{"t", 86400}, {"v", 2}}, json {{"t", 0}, {"v", 1}}}, "v", std::string("t")};
	const auto ts = TimeSeriesAdapter::build(epoch);
	REQUIRE(ts.getValues() == std::vector<double> {1.0, 2.0});
	REQUIRE(atsa::core::calendar::formatDate(ts.getTimestamps().back()) == "1970-01-02");

	DataInput garbled {{json {{"t", "yesterday"}, {"v", 1}}}, "v", std::string("t")};
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build(garbled), atsa::core::DataFormatError);

	DataInput missing_time {{json {{"t", "2023-01-01"}, {"v", 1}}, json {{"v", 2}}}, "v", std::string("t")};
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build(missing_time), atsa::core::DataFormatError);
}

TEST_CASE("Adapter value parsing", "[data][adapter][value]") {
	REQUIRE_FALSE(TimeSeriesAdapter::parseValue(nullptr, "v").has_value());
	REQUIRE(TimeSeriesAdapter::parseValue(json(3), "v").value() == Catch::Approx(3.0));
	REQUIRE(TimeSeriesAdapter::parseValue(json("1e3"), "v").value() == Catch::Approx(1000.0));
	REQUIRE_THROWS_AS(TimeSeriesAdapter::parseValue(json("12abc"), "v"), atsa::core::DataFormatError);
}

TEST_CASE("Adapter rejects non-finite values", "[data][adapter][value]") {
	REQUIRE_THROWS_AS(TimeSeriesAdapter::parseValue(json("inf"), "v"), atsa::core::DataFormatError);
	REQUIRE_THROWS_AS(TimeSeriesAdapter::parseValue(json("-Infinity"), "v"), atsa::core::DataFormatError);
	REQUIRE_THROWS_AS(TimeSeriesAdapter::parseValue(json("nan"), "v"), atsa::core::DataFormatError);
	REQUIRE_THROWS_AS(TimeSeriesAdapter::parseValue(json(std::numeric_limits<double>::infinity()), "v"),
	                  atsa::core::DataFormatError);

	DataInput input {{json {{"v", 1}}, json {{"v", "NaN"}}, json {{"v", 3}}}, "v", std::nullopt};
	REQUIRE_THROWS_AS(TimeSeriesAdapter::build(input), atsa::core::DataFormatError);
}
