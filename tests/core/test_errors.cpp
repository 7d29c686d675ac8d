#include <catch2/catch_test_macros.hpp>

#include "atsa/core/errors.hpp"

#include <stdexcept>
#include <string>

using namespace atsa::core;

TEST_CASE("Error codes have stable names", "[core][errors]") {
	REQUIRE(std::string(toString(ErrorCode::DataFormat)) == "data_format");
	REQUIRE(std::string(toString(ErrorCode::InsufficientData)) == "insufficient_data");
	REQUIRE(std::string(toString(ErrorCode::UnknownModel)) == "unknown_model");
	REQUIRE(std::string(toString(ErrorCode::InvalidParameter)) == "invalid_parameter");
	REQUIRE(std::string(toString(ErrorCode::Fitting)) == "fitting");
	REQUIRE(std::string(toString(ErrorCode::State)) == "state");
}

TEST_CASE("Error subclasses carry their code", "[core][errors]") {
	REQUIRE(DataFormatError("x").code() == ErrorCode::DataFormat);
	REQUIRE(InsufficientDataError("x").code() == ErrorCode::InsufficientData);
	REQUIRE(UnknownModelError("x").code() == ErrorCode::UnknownModel);
	REQUIRE(InvalidParameterError("x").code() == ErrorCode::InvalidParameter);
	REQUIRE(FittingError("x").code() == ErrorCode::Fitting);
	REQUIRE(StateError("x").code() == ErrorCode::State);
}

TEST_CASE("raise rethrows the matching subclass", "[core][errors]") {
	REQUIRE_THROWS_AS(raise({ErrorCode::DataFormat, "bad"}), DataFormatError);
	REQUIRE_THROWS_AS(raise({ErrorCode::InsufficientData, "short"}), InsufficientDataError);
	REQUIRE_THROWS_AS(raise({ErrorCode::UnknownModel, "who"}), UnknownModelError);
	REQUIRE_THROWS_AS(raise({ErrorCode::InvalidParameter, "p"}), InvalidParameterError);
	REQUIRE_THROWS_AS(raise({ErrorCode::Fitting, "f"}), FittingError);
	REQUIRE_THROWS_AS(raise({ErrorCode::State, "s"}), StateError);
}

TEST_CASE("capture keeps domain codes and maps other exceptions to fitting", "[core][errors][result]") {
	auto ok = capture([] { return 42; });
	REQUIRE(ok.ok());
	REQUIRE(ok.value() == 42);
	REQUIRE_THROWS_AS(ok.error(), std::logic_error);

	auto domain = capture([]() -> int { throw InsufficientDataError("Need more data."); });
	REQUIRE_FALSE(domain.ok());
	REQUIRE(domain.error().code == ErrorCode::InsufficientData);
	REQUIRE(domain.error().message == "Need more data.");
	REQUIRE_THROWS_AS(domain.value(), InsufficientDataError);

	auto numeric = capture([]() -> int { throw std::domain_error("singular matrix"); });
	REQUIRE_FALSE(numeric);
	REQUIRE(numeric.error().code == ErrorCode::Fitting);
	REQUIRE(numeric.error().message == "singular matrix");
}
