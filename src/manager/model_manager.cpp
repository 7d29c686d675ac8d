#include "atsa/manager/model_manager.hpp"

#include "atsa/analysis/stationarity.hpp"
#include "atsa/core/calendar.hpp"
#include "atsa/core/errors.hpp"
#include "atsa/utils/logging.hpp"
#include "atsa/utils/statistics.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace atsa::manager {

namespace {

// Integer array parameter; std::nullopt when present but not an array of JSON integers.
std::optional<std::vector<long long>> integerArray(const nlohmann::json &params, const char *key,
                                                   std::vector<long long> fallback) {
	if (!params.is_object()) {
		return fallback;
	}
	auto it = params.find(key);
	if (it == params.end() || it->is_null()) {
		return fallback;
	}
	if (!it->is_array()) {
		return std::nullopt;
	}
	std::vector<long long> values;
	for (const auto &entry : *it) {
		if (!entry.is_number_integer()) {
			return std::nullopt;
		}
		values.push_back(entry.get<long long>());
	}
	return values;
}

bool isComponent(const nlohmann::json &params, const char *key, const char *fallback, bool allow_none) {
	std::string name = fallback;
	if (params.is_object()) {
		auto it = params.find(key);
		if (it != params.end()) {
			if (it->is_null()) {
				return allow_none;
			}
			if (!it->is_string()) {
				return false;
			}
			name = it->get<std::string>();
		}
	}
	if (name == "add" || name == "additive" || name == "mul" || name == "multiplicative") {
		return true;
	}
	return allow_none && name == "none";
}

AdfCheck adfCheck(const std::vector<double> &values) {
	AdfCheck check;
	check.adf = analysis::adfTest(values);
	check.is_stationary = check.adf.pvalue < 0.05;
	check.recommendation = check.is_stationary ? "Data is stationary" : "Consider differencing the data";
	return check;
}

template <typename T>
void warnOnFailure(const core::Result<T> &section, const char *name) {
	if (!section.ok()) {
		ATSA_WARN("Data analysis section '{}' failed: {}", name, section.error().message);
	}
}

} // namespace

ModelManager::ModelManager(utils::Settings settings, ModelRegistry registry)
    : settings_(std::move(settings)), registry_(std::move(registry)) {
}

std::unique_ptr<models::IForecaster> ModelManager::create(const std::string &model_type,
                                                          const nlohmann::json &parameters) const {
	return registry_.create(model_type, parameters);
}

ValidationResult ModelManager::validate(const ModelConfiguration &config) const {
	const auto type = parseModelType(config.model_type);
	if (!type || !registry_.contains(*type)) {
		return {false, "Unknown model type: " + config.model_type};
	}
	const auto &params = config.parameters;
	switch (*type) {
	case ModelType::Arima: {
		const auto order = integerArray(params, "order", {1, 1, 1});
		if (!order || order->size() != 3 ||
		    std::any_of(order->begin(), order->end(), [](long long v) { return v < 0; })) {
			return {false, "ARIMA order must be three non-negative integers (p, d, q)"};
		}
		break;
	}
	case ModelType::Sarima: {
		const auto order = integerArray(params, "order", {1, 1, 1});
		const auto seasonal = integerArray(params, "seasonal_order", {1, 1, 1, 12});
		if (!order || !seasonal || order->size() != 3 || seasonal->size() != 4) {
			return {false, "SARIMA requires valid order and seasonal_order parameters"};
		}
		break;
	}
	case ModelType::HoltWinters:
		if (!isComponent(params, "trend", "add", true) || !isComponent(params, "seasonal", "add", false)) {
			return {false, "Holt-Winters trend must be 'add', 'mul' or none, and seasonal must be 'add' or 'mul'"};
		}
		break;
	default:
		break;
	}
	return {true, "Parameters are valid"};
}

int ModelManager::resolvePeriods(const ModelConfiguration &config) const {
	const int periods = config.forecast_periods.value_or(settings_.default_forecast_periods);
	if (periods < 1 || periods > settings_.max_forecast_periods) {
		throw core::InvalidParameterError("forecast_periods must be between 1 and " +
		                                  std::to_string(settings_.max_forecast_periods) + ", got " +
		                                  std::to_string(periods) + ".");
	}
	return periods;
}

double ModelManager::resolveConfidence(const ModelConfiguration &config) const {
	const double confidence = config.confidence_interval.value_or(settings_.default_confidence_interval);
	if (!(confidence > 0.0 && confidence < 1.0)) {
		throw core::InvalidParameterError("confidence_interval must lie strictly between 0 and 1.");
	}
	return confidence;
}

ForecastResult ModelManager::fitAndForecast(const data::DataInput &data, const ModelConfiguration &config) const {
	return fitAndForecast(data::TimeSeriesAdapter::build(data), config);
}

ForecastResult ModelManager::fitAndForecast(const core::TimeSeries &series, const ModelConfiguration &config) const {
	const auto floor = static_cast<std::size_t>(std::max(1, settings_.min_observations));
	if (series.size() < floor) {
		throw core::InsufficientDataError("Insufficient data points for modeling: need at least " +
		                                  std::to_string(floor) + ", got " + std::to_string(series.size()) + ".");
	}
	const int periods = resolvePeriods(config);
	const double confidence = resolveConfidence(config);
	registry_.resolve(config.model_type);
	const auto validation = validate(config);
	if (!validation.ok) {
		throw core::InvalidParameterError(validation.message);
	}

	auto model = create(config.model_type, config.parameters);
	ATSA_DEBUG("Fitting {} on {} observations, horizon {}.", model->getName(), series.size(), periods);

	ForecastResult result;
	result.model_type = config.model_type;
	result.confidence_interval = confidence;
	try {
		model->fit(series);
		auto forecast = model->predict(periods, confidence);
		result.forecast = std::move(forecast.point);
		result.lower_bound = std::move(forecast.lower);
		result.upper_bound = std::move(forecast.upper);
		result.fitted_values = model->fittedValues();
		result.model_info = model->modelInfo();
	} catch (const core::Error &) {
		throw;
	} catch (const std::exception &e) {
		throw core::FittingError(std::string("Model fitting failed: ") + e.what());
	}

	if (result.forecast.size() != static_cast<std::size_t>(periods) ||
	    result.lower_bound.size() != result.forecast.size() || result.upper_bound.size() != result.forecast.size()) {
		throw core::FittingError(model->getName() + " returned a forecast of unexpected length.");
	}
	if (result.fitted_values.size() != series.size()) {
		throw core::FittingError(model->getName() + " returned fitted values misaligned with the input.");
	}

	result.metrics = calculateMetrics(series.getValues(), result.fitted_values);
	result.forecast_dates = forecastDates(series, periods);
	if (result.metrics.valid()) {
		ATSA_DEBUG("{} in-sample RMSE {:.4f} over {} points.", model->getName(), result.metrics.rmse,
		           result.metrics.n);
	}
	return result;
}

utils::AccuracyMetrics ModelManager::calculateMetrics(const std::vector<double> &actual,
                                                      const std::vector<double> &predicted) {
	return utils::Metrics::evaluate(actual, predicted);
}

ComparisonResult ModelManager::compare(const std::vector<ForecastResult> &results) {
	ComparisonResult comparison;
	comparison.models.reserve(results.size());
	for (const auto &result : results) {
		comparison.models.push_back({result.model_type, result.metrics});
	}

	std::vector<const ComparisonRow *> ranked;
	for (const auto &row : comparison.models) {
		if (row.metrics.valid()) {
			ranked.push_back(&row);
		}
	}
	std::stable_sort(ranked.begin(), ranked.end(),
	                 [](const ComparisonRow *lhs, const ComparisonRow *rhs) { return lhs->metrics.rmse < rhs->metrics.rmse; });
	for (const auto *row : ranked) {
		comparison.ranking.push_back(row->model_type);
	}
	if (!comparison.ranking.empty()) {
		comparison.best_model = comparison.ranking.front();
	}
	return comparison;
}

ModelComparison ModelManager::compareModels(const data::DataInput &data,
                                            const std::vector<ModelConfiguration> &configs) const {
	const auto series = data::TimeSeriesAdapter::build(data);
	ModelComparison out;
	for (const auto &config : configs) {
		auto fitted = core::capture([&] { return fitAndForecast(series, config); });
		if (fitted) {
			out.results.push_back(std::move(fitted.value()));
		} else {
			ATSA_WARN("Model '{}' failed during comparison: {}", config.model_type, fitted.error().message);
			out.failures.push_back({config.model_type, fitted.error()});
		}
	}
	out.comparison = compare(out.results);
	return out;
}

AutoSelection ModelManager::autoSelect(std::size_t length) {
	if (length < 24) {
		return {"arima", {{"order", {1, 1, 1}}}, "insufficient data for seasonal models"};
	}
	if (length < 50) {
		return {"holt-winters",
		        {{"trend", "add"}, {"seasonal", "add"}, {"seasonal_periods", 12}},
		        "medium-sized dataset suitable for Holt-Winters"};
	}
	return {"sarima", {{"order", {1, 1, 1}}, {"seasonal_order", {1, 1, 1, 12}}}, "large dataset suitable for SARIMA"};
}

AutoSelection ModelManager::autoSelect(const data::DataInput &data) const {
	const auto series = data::TimeSeriesAdapter::build(data);
	auto selection = autoSelect(series.size());
	ATSA_DEBUG("Auto-selected '{}' for {} observations.", selection.model_type, series.size());
	return selection;
}

std::vector<ModelDescriptor> ModelManager::availableModels() const {
	return registry_.catalog();
}

DataAnalysis ModelManager::analyzeData(const data::DataInput &data) const {
	const auto series = data::TimeSeriesAdapter::build(data);
	const auto &values = series.getValues();
	const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());

	BasicStats stats;
	stats.count = values.size();
	stats.mean = utils::stats::mean(values);
	stats.std = utils::stats::stddev(values, 1);
	stats.min = *min_it;
	stats.max = *max_it;
	stats.median = utils::stats::median(values);

	DataAnalysis result {stats, core::capture([&] { return adfCheck(values); }),
	                     core::capture([&] { return analyzer_.detectOutliers(series); }),
	                     core::capture([&] { return analyzer_.suggestParameters(series); }), std::nullopt};
	if (series.size() >= 24) {
		result.decomposition = core::capture([&] { return analyzer_.decompose(series); });
		warnOnFailure(*result.decomposition, "decomposition");
	}
	warnOnFailure(result.stationarity, "stationarity");
	warnOnFailure(result.outliers, "outliers");
	warnOnFailure(result.parameter_suggestions, "parameter_suggestions");
	return result;
}

std::vector<std::string> ModelManager::forecastDates(const core::TimeSeries &series, int periods) {
	std::vector<std::string> dates;
	dates.reserve(static_cast<std::size_t>(std::max(periods, 0)));
	const auto step = series.inferStep();
	if (step && !series.isEmpty()) {
		const auto last = series.getTimestamps().back();
		for (int i = 1; i <= periods; ++i) {
			dates.push_back(core::calendar::formatDate(step->advance(last, i)));
		}
		return dates;
	}
	for (int i = 0; i < periods; ++i) {
		dates.push_back("Period " + std::to_string(series.size() + static_cast<std::size_t>(i) + 1));
	}
	return dates;
}

} // namespace atsa::manager
