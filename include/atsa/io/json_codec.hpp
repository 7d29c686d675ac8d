#pragma once

#include "atsa/analysis/statistical_analyzer.hpp"
#include "atsa/core/errors.hpp"
#include "atsa/data/time_series_adapter.hpp"
#include "atsa/manager/model_registry.hpp"
#include "atsa/manager/results.hpp"
#include "atsa/utils/metrics.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace atsa::io {

using nlohmann::json;

/// A finite number, or null for NaN and infinities.
json number(double value);
json numbers(const std::vector<double> &values);

/// Reads {records, value_column, time_column?}. Throws core::DataFormatError on a malformed request.
data::DataInput parseDataInput(const json &request);

/// Reads {model_type, parameters, forecast_periods?, confidence_interval?}.
manager::ModelConfiguration parseModelConfiguration(const json &request);

/// Request payload under "data", or the request itself when it is a bare data input.
data::DataInput dataFromRequest(const json &request);

json toJson(const core::ErrorInfo &error);
json toJson(const utils::AccuracyMetrics &metrics);

json toJson(const manager::ForecastResult &result);
json toJson(const manager::ComparisonResult &comparison);
json toJson(const manager::ModelComparison &comparison);
json toJson(const manager::AutoSelection &selection);
json toJson(const std::vector<manager::ModelDescriptor> &catalog);
json toJson(const manager::AdfCheck &check);
json toJson(const manager::DataAnalysis &analysis);

json toJson(const analysis::StationarityReport &report);
json toJson(const analysis::SeasonalityReport &report);
json toJson(const analysis::DecompositionReport &report);
json toJson(const analysis::AcfPacfReport &report);
json toJson(const analysis::RollingStatistics &stats);
json toJson(const analysis::OutlierReport &report);
json toJson(const analysis::ParameterSuggestions &suggestions);
json toJson(const analysis::DataSummary &summary);
json toJson(const analysis::ComprehensiveAnalysis &analysis);

/// The section's value, or {"error": message, "code": ...} when it failed.
template <typename T>
json toJson(const core::Result<T> &section) {
	if (!section.ok()) {
		return toJson(section.error());
	}
	return toJson(section.value());
}

} // namespace atsa::io
