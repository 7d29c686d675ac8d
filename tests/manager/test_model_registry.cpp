#include <catch2/catch_test_macros.hpp>

#include "atsa/core/errors.hpp"
#include "atsa/manager/model_registry.hpp"
#include "atsa/models/moving_average.hpp"

#include <set>

using namespace atsa::manager;
using json = nlohmann::json;

TEST_CASE("Model type names round trip", "[manager][registry]") {
	for (auto type : {ModelType::Arima, ModelType::Sarima, ModelType::HoltWinters, ModelType::Prophet,
	                  ModelType::MovingAverage, ModelType::Lstm}) {
		REQUIRE(parseModelType(toString(type)) == type);
	}
	REQUIRE(toString(ModelType::HoltWinters) == "holt-winters");
	REQUIRE_FALSE(parseModelType("xgboost").has_value());
}

TEST_CASE("Registry reflects the compiled capabilities", "[manager][registry]") {
	const ModelRegistry registry;
	REQUIRE(registry.contains(ModelType::Arima));
	REQUIRE(registry.contains(ModelType::Sarima));
	REQUIRE(registry.contains(ModelType::HoltWinters));
	REQUIRE(registry.contains(ModelType::MovingAverage));
#ifdef ATSA_HAVE_PROPHET
	REQUIRE(registry.contains(ModelType::Prophet));
#else
	REQUIRE_FALSE(registry.contains(ModelType::Prophet));
#endif
#ifdef ATSA_HAVE_LSTM
	REQUIRE(registry.contains(ModelType::Lstm));
#else
	REQUIRE_FALSE(registry.contains(ModelType::Lstm));
	REQUIRE_THROWS_AS(registry.create("lstm", json::object()), atsa::core::UnknownModelError);
#endif
	REQUIRE(registry.catalog().size() == registry.types().size());
}

TEST_CASE("Registry restricted to a subset", "[manager][registry]") {
	const ModelRegistry registry(std::set<ModelType> {ModelType::Arima, ModelType::MovingAverage});
	REQUIRE(registry.types().size() == 2);
	REQUIRE(registry.resolve("arima") == ModelType::Arima);
	REQUIRE_THROWS_AS(registry.resolve("sarima"), atsa::core::UnknownModelError);
	REQUIRE_THROWS_AS(registry.create("holt-winters", json::object()), atsa::core::UnknownModelError);

	const auto catalog = registry.catalog();
	REQUIRE(catalog.size() == 2);
	REQUIRE(catalog.front().name == "ARIMA");
	REQUIRE(catalog.front().description == "AutoRegressive Integrated Moving Average");
}

TEST_CASE("Registry builds models from parameter maps", "[manager][registry][create]") {
	const ModelRegistry registry;

	auto arima = registry.create("arima", json::object());
	REQUIRE(arima->getName() == "ARIMA");

	auto sarima = registry.create("sarima", {{"order", {0, 1, 1}}, {"seasonal_order", {0, 1, 1, 4}}});
	REQUIRE(sarima->getName() == "SARIMA");

	auto hw = registry.create("holt-winters", {{"trend", nullptr}, {"seasonal", "mul"}, {"seasonal_period", 4}});
	REQUIRE(hw->getName() == "HoltWinters");

	auto ma = registry.create("moving_average", {{"window", 5}});
	REQUIRE(dynamic_cast<atsa::models::MovingAverage &>(*ma).window() == 5);

	auto null_params = registry.create("moving_average", nullptr);
	REQUIRE(dynamic_cast<atsa::models::MovingAverage &>(*null_params).window() == 12);
}

TEST_CASE("Registry rejects malformed parameters", "[manager][registry][create]") {
	const ModelRegistry registry;
	REQUIRE_THROWS_AS(registry.create("arima", {{"order", {1, 1}}}), atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(registry.create("arima", {{"order", "1,1,1"}}), atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(registry.create("holt-winters", {{"trend", "exp"}}), atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(registry.create("moving_average", {{"window", 0}}), atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(registry.create("arima", json::array({1, 2})), atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(registry.create("neural_prophet", json::object()), atsa::core::UnknownModelError);
}

TEST_CASE("Registry rejects fractional integer parameters", "[manager][registry][create]") {
	const ModelRegistry registry;
	REQUIRE_THROWS_AS(registry.create("moving_average", {{"window", 12.5}}), atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(registry.create("holt-winters", {{"seasonal_periods", 12.5}}),
	                  atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(registry.create("arima", {{"order", {1, 1.5, 1}}}), atsa::core::InvalidParameterError);
	REQUIRE_THROWS_AS(registry.create("moving_average", {{"window", 12.0}}), atsa::core::InvalidParameterError);

	auto ma = registry.create("moving_average", {{"window", 7}});
	REQUIRE(dynamic_cast<atsa::models::MovingAverage &>(*ma).window() == 7);
}
