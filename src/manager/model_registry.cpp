#include "atsa/manager/model_registry.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/models/arima.hpp"
#include "atsa/models/holt_winters.hpp"
#include "atsa/models/moving_average.hpp"
#include "atsa/models/parameters.hpp"
#include "atsa/models/sarima.hpp"
#include "atsa/utils/logging.hpp"

#ifdef ATSA_HAVE_PROPHET
#include "atsa/models/prophet.hpp"
#endif
#ifdef ATSA_HAVE_LSTM
#include "atsa/models/sequence_network.hpp"
#endif

#include <algorithm>
#include <array>
#include <cstdint>

namespace atsa::manager {

namespace {

using models::getParam;

template <std::size_t N>
std::array<int, N> orderParam(const nlohmann::json &params, const char *key, const std::array<int, N> &fallback) {
	const auto values = getParam<std::vector<int>>(params, key, std::vector<int>(fallback.begin(), fallback.end()));
	if (values.size() != N) {
		throw core::InvalidParameterError(std::string("Parameter '") + key + "' must have exactly " +
		                                  std::to_string(N) + " entries.");
	}
	std::array<int, N> order {};
	std::copy(values.begin(), values.end(), order.begin());
	return order;
}

// An explicit null selects no component.
models::HoltWinters::Component componentParam(const nlohmann::json &params, const char *key, const char *fallback) {
	if (params.is_object()) {
		auto it = params.find(key);
		if (it != params.end() && it->is_null()) {
			return models::HoltWinters::Component::None;
		}
	}
	return models::HoltWinters::parseComponent(getParam<std::string>(params, key, std::string(fallback)));
}

#ifdef ATSA_HAVE_PROPHET
models::Prophet::Toggle toggleParam(const nlohmann::json &params, const char *key) {
	if (!params.is_object()) {
		return models::Prophet::Toggle::Auto;
	}
	auto it = params.find(key);
	if (it == params.end() || it->is_null()) {
		return models::Prophet::Toggle::Auto;
	}
	if (it->is_boolean()) {
		return it->get<bool>() ? models::Prophet::Toggle::On : models::Prophet::Toggle::Off;
	}
	if (it->is_string()) {
		const auto text = it->get<std::string>();
		if (text == "auto") {
			return models::Prophet::Toggle::Auto;
		}
		if (text == "true") {
			return models::Prophet::Toggle::On;
		}
		if (text == "false") {
			return models::Prophet::Toggle::Off;
		}
	}
	throw core::InvalidParameterError(std::string("Parameter '") + key + "' must be true, false or \"auto\".");
}

std::unique_ptr<models::IForecaster> createProphet(const nlohmann::json &params) {
	const auto growth = getParam<std::string>(params, "growth", "linear");
	if (growth != "linear") {
		throw core::InvalidParameterError("Only linear growth is supported, got '" + growth + "'.");
	}
	models::Prophet::Options options;
	const auto mode = getParam<std::string>(params, "seasonality_mode", "additive");
	if (mode == "additive") {
		options.mode = models::Prophet::SeasonalityMode::Additive;
	} else if (mode == "multiplicative") {
		options.mode = models::Prophet::SeasonalityMode::Multiplicative;
	} else {
		throw core::InvalidParameterError("seasonality_mode must be 'additive' or 'multiplicative'.");
	}
	options.n_changepoints = getParam<int>(params, "n_changepoints", options.n_changepoints);
	options.changepoint_range = getParam<double>(params, "changepoint_range", options.changepoint_range);
	options.changepoint_prior_scale =
	    getParam<double>(params, "changepoint_prior_scale", options.changepoint_prior_scale);
	options.seasonality_prior_scale =
	    getParam<double>(params, "seasonality_prior_scale", options.seasonality_prior_scale);
	options.yearly = toggleParam(params, "yearly_seasonality");
	options.weekly = toggleParam(params, "weekly_seasonality");
	options.daily = toggleParam(params, "daily_seasonality");
	options.uncertainty_samples = getParam<int>(params, "uncertainty_samples", options.uncertainty_samples);
	options.seed = getParam<std::uint32_t>(params, "seed", options.seed);
	return std::make_unique<models::Prophet>(options);
}
#endif

#ifdef ATSA_HAVE_LSTM
std::unique_ptr<models::IForecaster> createSequenceNetwork(const nlohmann::json &params) {
	models::SequenceNetwork::Options options;
	options.sequence_length = getParam<int>(params, "sequence_length", options.sequence_length);
	options.lstm_units = getParam<int>(params, "lstm_units", options.lstm_units);
	options.dropout = getParam<double>(params, {"dropout", "dropout_rate"}, options.dropout);
	options.epochs = getParam<int>(params, "epochs", options.epochs);
	options.batch_size = getParam<int>(params, "batch_size", options.batch_size);
	options.validation_split = getParam<double>(params, "validation_split", options.validation_split);
	options.learning_rate = getParam<double>(params, "learning_rate", options.learning_rate);
	options.seed = getParam<std::uint32_t>(params, "seed", options.seed);
	return std::make_unique<models::SequenceNetwork>(options);
}
#endif

} // namespace

std::string toString(ModelType type) {
	switch (type) {
	case ModelType::Arima:
		return "arima";
	case ModelType::Sarima:
		return "sarima";
	case ModelType::HoltWinters:
		return "holt-winters";
	case ModelType::Prophet:
		return "prophet";
	case ModelType::MovingAverage:
		return "moving_average";
	case ModelType::Lstm:
		return "lstm";
	}
	return "unknown";
}

std::optional<ModelType> parseModelType(const std::string &name) {
	for (auto type : {ModelType::Arima, ModelType::Sarima, ModelType::HoltWinters, ModelType::Prophet,
	                  ModelType::MovingAverage, ModelType::Lstm}) {
		if (toString(type) == name) {
			return type;
		}
	}
	return std::nullopt;
}

std::set<ModelType> ModelRegistry::compiledCapabilities() {
	std::set<ModelType> types {ModelType::Arima, ModelType::Sarima, ModelType::HoltWinters, ModelType::MovingAverage};
#ifdef ATSA_HAVE_PROPHET
	types.insert(ModelType::Prophet);
#endif
#ifdef ATSA_HAVE_LSTM
	types.insert(ModelType::Lstm);
#endif
	return types;
}

ModelRegistry::ModelRegistry() : types_(compiledCapabilities()) {
}

ModelRegistry::ModelRegistry(const std::set<ModelType> &requested) {
	const auto compiled = compiledCapabilities();
	for (auto type : requested) {
		if (compiled.count(type) != 0) {
			types_.insert(type);
		} else {
			ATSA_WARN("Model type '{}' is not available in this build and will not be registered.", toString(type));
		}
	}
}

bool ModelRegistry::contains(ModelType type) const {
	return types_.count(type) != 0;
}

ModelType ModelRegistry::resolve(const std::string &name) const {
	const auto type = parseModelType(name);
	if (!type || !contains(*type)) {
		throw core::UnknownModelError("Unknown model type: " + name);
	}
	return *type;
}

std::unique_ptr<models::IForecaster> ModelRegistry::create(const std::string &model_type,
                                                           const nlohmann::json &parameters) const {
	const auto type = resolve(model_type);
	if (!parameters.is_null() && !parameters.is_object()) {
		throw core::InvalidParameterError("Model parameters must be a JSON object.");
	}
	ATSA_DEBUG("Creating model '{}' with parameters {}", model_type, parameters.dump());

	switch (type) {
	case ModelType::Arima: {
		const auto order = orderParam<3>(parameters, "order", {1, 1, 1});
		return models::ARIMABuilder().withAR(order[0]).withDifferencing(order[1]).withMA(order[2]).build();
	}
	case ModelType::Sarima:
		return std::make_unique<models::SARIMA>(orderParam<3>(parameters, "order", {1, 1, 1}),
		                                        orderParam<4>(parameters, "seasonal_order", {1, 1, 1, 12}));
	case ModelType::HoltWinters:
		return std::make_unique<models::HoltWinters>(
		    componentParam(parameters, "trend", "add"), componentParam(parameters, "seasonal", "add"),
		    getParam<int>(parameters, {"seasonal_periods", "seasonal_period", "period"}, 12));
	case ModelType::MovingAverage:
		return models::MovingAverageBuilder().withWindow(getParam<int>(parameters, "window", 12)).build();
	case ModelType::Prophet:
#ifdef ATSA_HAVE_PROPHET
		return createProphet(parameters);
#else
		break;
#endif
	case ModelType::Lstm:
#ifdef ATSA_HAVE_LSTM
		return createSequenceNetwork(parameters);
#else
		break;
#endif
	}
	throw core::UnknownModelError("Unknown model type: " + model_type);
}

std::vector<ModelDescriptor> ModelRegistry::catalog() const {
	std::vector<ModelDescriptor> rows;
	for (auto type : types_) {
		switch (type) {
		case ModelType::Arima:
			rows.push_back({type, "ARIMA", "AutoRegressive Integrated Moving Average", {"order"},
			                "Stationary time series"});
			break;
		case ModelType::Sarima:
			rows.push_back({type, "SARIMA", "Seasonal ARIMA", {"order", "seasonal_order"},
			                "Time series with seasonality"});
			break;
		case ModelType::HoltWinters:
			rows.push_back({type, "Holt-Winters", "Exponential Smoothing with Trend and Seasonality",
			                {"trend", "seasonal", "seasonal_periods"}, "Data with trend and seasonality"});
			break;
		case ModelType::Prophet:
			rows.push_back({type, "Prophet", "Piecewise-linear trend with Fourier seasonalities",
			                {"seasonality_mode", "yearly_seasonality", "weekly_seasonality", "daily_seasonality",
			                 "changepoint_prior_scale", "seasonality_prior_scale"},
			                "Business metrics with strong seasonal patterns"});
			break;
		case ModelType::MovingAverage:
			rows.push_back({type, "Moving Average", "Simple moving average forecasting", {"window"},
			                "Stable time series without strong trends"});
			break;
		case ModelType::Lstm:
			rows.push_back({type, "LSTM", "Long Short-Term Memory Neural Network",
			                {"sequence_length", "lstm_units", "dropout", "epochs", "batch_size"},
			                "Complex non-linear patterns"});
			break;
		}
	}
	return rows;
}

} // namespace atsa::manager
