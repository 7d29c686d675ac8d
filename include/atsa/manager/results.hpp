#pragma once

#include "atsa/analysis/statistical_analyzer.hpp"
#include "atsa/core/errors.hpp"
#include "atsa/utils/metrics.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace atsa::manager {

/**
 * @struct ModelConfiguration
 * @brief A model request. Unset horizon and confidence take the Settings defaults.
 */
struct ModelConfiguration {
	std::string model_type = "arima";
	nlohmann::json parameters = nlohmann::json::object();
	std::optional<int> forecast_periods;
	std::optional<double> confidence_interval;
};

struct ValidationResult {
	bool ok = true;
	std::string message;
};

/**
 * @struct ForecastResult
 * @brief Output of one fit-and-forecast run.
 *
 * @c fitted_values is aligned with the input series; the forecast, bounds and
 * dates all have forecast_periods entries.
 */
struct ForecastResult {
	std::string model_type;
	std::vector<double> fitted_values;
	std::vector<double> forecast;
	std::vector<double> lower_bound;
	std::vector<double> upper_bound;
	std::vector<std::string> forecast_dates;
	double confidence_interval = 0.95;
	utils::AccuracyMetrics metrics;
	nlohmann::json model_info;
};

struct ComparisonRow {
	std::string model_type;
	utils::AccuracyMetrics metrics;
};

/**
 * @struct ComparisonResult
 * @brief Ranking by ascending RMSE; models without a valid RMSE are listed but not ranked.
 */
struct ComparisonResult {
	std::vector<ComparisonRow> models;
	std::vector<std::string> ranking;
	std::optional<std::string> best_model;
};

struct ModelFailure {
	std::string model_type;
	core::ErrorInfo error;
};

struct ModelComparison {
	std::vector<ForecastResult> results;
	std::vector<ModelFailure> failures;
	ComparisonResult comparison;
};

struct AutoSelection {
	std::string model_type;
	nlohmann::json parameters;
	std::string reason;
};

struct BasicStats {
	std::size_t count = 0;
	double mean = 0.0;
	double std = 0.0;
	double min = 0.0;
	double max = 0.0;
	double median = 0.0;
};

/**
 * @struct AdfCheck
 * @brief ADF-only stationarity screen of the quick data profile.
 *
 * Stationary when the ADF p-value is below 0.05; the full ADF+KPSS verdict is
 * StatisticalAnalyzer::testStationarity.
 */
struct AdfCheck {
	analysis::AdfResult adf;
	bool is_stationary = false;
	std::string recommendation;
};

/**
 * @struct DataAnalysis
 * @brief Quick profile of a dataset with independently computed sections.
 */
struct DataAnalysis {
	BasicStats basic_stats;
	core::Result<AdfCheck> stationarity;
	core::Result<analysis::OutlierReport> outliers;
	core::Result<analysis::ParameterSuggestions> parameter_suggestions;
	/// Only attempted for series of 24 or more points.
	std::optional<core::Result<analysis::DecompositionReport>> decomposition;
};

} // namespace atsa::manager
