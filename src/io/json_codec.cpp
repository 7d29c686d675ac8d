#include "atsa/io/json_codec.hpp"

#include <cmath>
#include <string>

namespace atsa::io {

namespace {

json criticalValues(const analysis::CriticalValues &values) {
	json out = json::object();
	for (const auto &entry : values) {
		out[entry.first] = entry.second;
	}
	return out;
}

json correlogram(const analysis::Correlogram &c) {
	json intervals = json::array();
	json lags = json::array();
	for (std::size_t k = 0; k < c.values.size(); ++k) {
		intervals.push_back({number(c.lower[k]), number(c.upper[k])});
		lags.push_back(k);
	}
	return {{"values", numbers(c.values)}, {"confidence_intervals", intervals}, {"lags", lags}};
}

// Dates when the series had a time index, otherwise positional indices.
json dateAxis(const std::vector<std::string> &dates, std::size_t length) {
	if (!dates.empty()) {
		return dates;
	}
	json indices = json::array();
	for (std::size_t i = 0; i < length; ++i) {
		indices.push_back(i);
	}
	return indices;
}

template <typename T>
json optionalJson(const std::optional<T> &value) {
	return value ? json(*value) : json(nullptr);
}

} // namespace

json number(double value) {
	return std::isfinite(value) ? json(value) : json(nullptr);
}

json numbers(const std::vector<double> &values) {
	json out = json::array();
	for (double v : values) {
		out.push_back(number(v));
	}
	return out;
}

data::DataInput parseDataInput(const json &request) {
	if (!request.is_object()) {
		throw core::DataFormatError("Invalid data format: expected an object with records and value_column.");
	}
	data::DataInput input;
	auto records = request.find("records");
	if (records != request.end() && !records->is_null()) {
		if (!records->is_array()) {
			throw core::DataFormatError("Invalid data format: records must be an array.");
		}
		input.records.assign(records->begin(), records->end());
	}
	auto value_column = request.find("value_column");
	if (value_column != request.end() && !value_column->is_null()) {
		if (!value_column->is_string()) {
			throw core::DataFormatError("Invalid data format: value_column must be a string.");
		}
		input.value_column = value_column->get<std::string>();
	}
	auto time_column = request.find("time_column");
	if (time_column != request.end() && !time_column->is_null()) {
		if (!time_column->is_string()) {
			throw core::DataFormatError("Invalid data format: time_column must be a string.");
		}
		if (!time_column->get<std::string>().empty()) {
			input.time_column = time_column->get<std::string>();
		}
	}
	return input;
}

manager::ModelConfiguration parseModelConfiguration(const json &request) {
	if (!request.is_object()) {
		throw core::InvalidParameterError("Model configuration must be an object.");
	}
	manager::ModelConfiguration config;
	try {
		config.model_type = request.value("model_type", config.model_type);
		if (request.contains("parameters") && !request["parameters"].is_null()) {
			config.parameters = request["parameters"];
		}
		if (request.contains("forecast_periods") && !request["forecast_periods"].is_null()) {
			if (!request["forecast_periods"].is_number_integer()) {
				throw core::InvalidParameterError("forecast_periods must be an integer, got " +
				                                  request["forecast_periods"].dump() + ".");
			}
			config.forecast_periods = request["forecast_periods"].get<int>();
		}
		if (request.contains("confidence_interval") && !request["confidence_interval"].is_null()) {
			config.confidence_interval = request["confidence_interval"].get<double>();
		}
	} catch (const json::exception &e) {
		throw core::InvalidParameterError(std::string("Invalid model configuration: ") + e.what());
	}
	return config;
}

data::DataInput dataFromRequest(const json &request) {
	if (request.is_object() && request.contains("data")) {
		return parseDataInput(request["data"]);
	}
	return parseDataInput(request);
}

json toJson(const core::ErrorInfo &error) {
	return {{"error", error.message}, {"code", core::toString(error.code)}};
}

json toJson(const utils::AccuracyMetrics &metrics) {
	if (metrics.error) {
		return {{"error", *metrics.error}};
	}
	return {{"mae", number(metrics.mae)},
	        {"mse", number(metrics.mse)},
	        {"rmse", number(metrics.rmse)},
	        {"mape", metrics.mape ? number(*metrics.mape) : json(nullptr)},
	        {"n", metrics.n}};
}

json toJson(const manager::ForecastResult &result) {
	return {{"model_type", result.model_type},
	        {"fitted_values", numbers(result.fitted_values)},
	        {"forecast", numbers(result.forecast)},
	        {"lower_bound", numbers(result.lower_bound)},
	        {"upper_bound", numbers(result.upper_bound)},
	        {"forecast_dates", result.forecast_dates},
	        {"confidence_interval", result.confidence_interval},
	        {"metrics", toJson(result.metrics)},
	        {"model_info", result.model_info}};
}

json toJson(const manager::ComparisonResult &comparison) {
	json models = json::array();
	for (const auto &row : comparison.models) {
		const auto &m = row.metrics;
		models.push_back({{"model_type", row.model_type},
		                  {"mae", m.valid() ? number(m.mae) : json(nullptr)},
		                  {"rmse", m.valid() ? number(m.rmse) : json(nullptr)},
		                  {"mape", m.mape ? number(*m.mape) : json(nullptr)}});
	}
	return {{"models", models}, {"ranking", comparison.ranking}, {"best_model", optionalJson(comparison.best_model)}};
}

json toJson(const manager::ModelComparison &comparison) {
	json results = json::array();
	for (const auto &result : comparison.results) {
		results.push_back(toJson(result));
	}
	json failures = json::array();
	for (const auto &failure : comparison.failures) {
		json row = toJson(failure.error);
		row["model_type"] = failure.model_type;
		failures.push_back(row);
	}
	return {{"results", results}, {"failures", failures}, {"comparison", toJson(comparison.comparison)}};
}

json toJson(const manager::AutoSelection &selection) {
	return {{"model_type", selection.model_type}, {"parameters", selection.parameters}, {"reason", selection.reason}};
}

json toJson(const std::vector<manager::ModelDescriptor> &catalog) {
	json out = json::object();
	for (const auto &row : catalog) {
		out[manager::toString(row.type)] = {{"name", row.name},
		                                    {"description", row.description},
		                                    {"parameters", row.parameters},
		                                    {"suitable_for", row.suitable_for}};
	}
	return out;
}

json toJson(const manager::AdfCheck &check) {
	return {{"adf_statistic", number(check.adf.statistic)},
	        {"adf_p_value", number(check.adf.pvalue)},
	        {"is_stationary", check.is_stationary},
	        {"critical_values", criticalValues(check.adf.critical_values)},
	        {"recommendation", check.recommendation}};
}

json toJson(const manager::DataAnalysis &analysis) {
	const auto &s = analysis.basic_stats;
	json out = {{"basic_stats",
	             {{"count", s.count},
	              {"mean", number(s.mean)},
	              {"std", number(s.std)},
	              {"min", number(s.min)},
	              {"max", number(s.max)},
	              {"median", number(s.median)}}},
	            {"stationarity", toJson(analysis.stationarity)},
	            {"outliers", toJson(analysis.outliers)},
	            {"parameter_suggestions", toJson(analysis.parameter_suggestions)}};
	if (analysis.decomposition) {
		out["decomposition"] = toJson(*analysis.decomposition);
	}
	return out;
}

json toJson(const analysis::StationarityReport &report) {
	return {{"adf_test",
	         {{"statistic", number(report.adf.statistic)},
	          {"pvalue", number(report.adf.pvalue)},
	          {"used_lag", report.adf.used_lag},
	          {"nobs", report.adf.nobs},
	          {"critical_values", criticalValues(report.adf.critical_values)},
	          {"is_stationary", report.adf.is_stationary}}},
	        {"kpss_test",
	         {{"statistic", number(report.kpss.statistic)},
	          {"pvalue", number(report.kpss.pvalue)},
	          {"lags", report.kpss.lags},
	          {"critical_values", criticalValues(report.kpss.critical_values)},
	          {"is_stationary", report.kpss.is_stationary}}},
	        {"conclusion", {{"is_stationary", report.is_stationary}, {"recommendation", report.recommendation}}}};
}

json toJson(const analysis::SeasonalityReport &report) {
	if (report.reason) {
		return {{"has_seasonality", false}, {"reason", *report.reason}};
	}
	json periods = json::object();
	for (const auto &p : report.periods) {
		periods["period_" + std::to_string(p.period)] = {{"seasonal_strength", number(p.strength)},
		                                                 {"significant", p.significant}};
	}
	return {{"has_seasonality", report.has_seasonality},
	        {"seasonal_period", optionalJson(report.seasonal_period)},
	        {"seasonal_strength", number(report.seasonal_strength)},
	        {"all_periods", periods}};
}

json toJson(const analysis::DecompositionReport &report) {
	const auto &c = report.components;
	return {{"trend", numbers(c.trend)},
	        {"seasonal", numbers(c.seasonal)},
	        {"residual", numbers(c.residual)},
	        {"original", numbers(report.original)},
	        {"dates", dateAxis(report.dates, report.original.size())},
	        {"method", analysis::toString(c.mode)},
	        {"period", c.period}};
}

json toJson(const analysis::AcfPacfReport &report) {
	return {{"acf", correlogram(report.acf)}, {"pacf", correlogram(report.pacf)}};
}

json toJson(const analysis::RollingStatistics &stats) {
	return {{"original", numbers(stats.original)},
	        {"rolling_mean", numbers(stats.rolling_mean)},
	        {"rolling_std", numbers(stats.rolling_std)},
	        {"dates", dateAxis(stats.dates, stats.original.size())},
	        {"window", stats.window}};
}

json toJson(const analysis::OutlierReport &report) {
	json out = {{"method", report.method == analysis::OutlierMethod::IQR ? "IQR" : "Z-Score"},
	            {"outliers", report.indices},
	            {"outlier_values", numbers(report.values)},
	            {"count", report.count()}};
	if (report.lower_bound) {
		out["lower_bound"] = number(*report.lower_bound);
	}
	if (report.upper_bound) {
		out["upper_bound"] = number(*report.upper_bound);
	}
	if (report.threshold) {
		out["threshold"] = *report.threshold;
	}
	return out;
}

json toJson(const analysis::ParameterSuggestions &suggestions) {
	json out = {{"has_trend", suggestions.has_trend},
	            {"arima", {{"order", suggestions.arima.order}, {"reasoning", suggestions.arima.reasoning}}},
	            {"holt_winters",
	             {{"trend", optionalJson(suggestions.holt_winters.trend)},
	              {"seasonal", optionalJson(suggestions.holt_winters.seasonal)},
	              {"seasonal_periods", suggestions.holt_winters.seasonal_periods},
	              {"reasoning", suggestions.holt_winters.reasoning}}}};
	if (suggestions.has_seasonality) {
		out["has_seasonality"] = *suggestions.has_seasonality;
		out["seasonal_period"] = optionalJson(suggestions.seasonal_period);
	}
	if (suggestions.sarima) {
		out["sarima"] = {{"order", suggestions.sarima->order},
		                 {"seasonal_order", suggestions.sarima->seasonal_order},
		                 {"reasoning", suggestions.sarima->reasoning}};
	}
	return out;
}

json toJson(const analysis::DataSummary &summary) {
	return {{"length", summary.length},
	        {"mean", number(summary.mean)},
	        {"std", number(summary.std)},
	        {"min", number(summary.min)},
	        {"max", number(summary.max)},
	        {"missing_values", summary.missing_values}};
}

json toJson(const analysis::ComprehensiveAnalysis &analysis) {
	return {{"data_summary", toJson(analysis.data_summary)},
	        {"stationarity", toJson(analysis.stationarity)},
	        {"seasonality", toJson(analysis.seasonality)},
	        {"acf_pacf", toJson(analysis.acf_pacf)},
	        {"rolling_stats", toJson(analysis.rolling_statistics)}};
}

} // namespace atsa::io
