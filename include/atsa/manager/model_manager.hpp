#pragma once

#include "atsa/analysis/statistical_analyzer.hpp"
#include "atsa/core/time_series.hpp"
#include "atsa/data/time_series_adapter.hpp"
#include "atsa/manager/model_registry.hpp"
#include "atsa/manager/results.hpp"
#include "atsa/utils/settings.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace atsa::manager {

/**
 * @class ModelManager
 * @brief Creates, validates, fits and compares forecasting models.
 *
 * Every call builds fresh model instances; the manager itself only holds its
 * registry and settings, so one instance can serve concurrent requests.
 */
class ModelManager {
public:
	explicit ModelManager(utils::Settings settings = {}, ModelRegistry registry = {});

	const ModelRegistry &registry() const {
		return registry_;
	}

	const utils::Settings &settings() const {
		return settings_;
	}

	/// @throws core::UnknownModelError, core::InvalidParameterError
	std::unique_ptr<models::IForecaster> create(const std::string &model_type,
	                                            const nlohmann::json &parameters = nlohmann::json::object()) const;

	/**
	 * @brief Checks the per-model parameter rules without constructing the model.
	 *
	 * ARIMA needs three non-negative orders, SARIMA three orders and four
	 * seasonal orders, Holt-Winters a known trend and an additive or
	 * multiplicative seasonal component.
	 */
	ValidationResult validate(const ModelConfiguration &config) const;

	/**
	 * @brief Adapts @p data, fits the configured model and forecasts.
	 * @throws core::DataFormatError, core::InsufficientDataError, core::UnknownModelError,
	 *         core::InvalidParameterError, core::FittingError
	 */
	ForecastResult fitAndForecast(const data::DataInput &data, const ModelConfiguration &config) const;

	ForecastResult fitAndForecast(const core::TimeSeries &series, const ModelConfiguration &config) const;

	/// MAE, MSE, RMSE and MAPE over the valid (actual, predicted) pairs.
	static utils::AccuracyMetrics calculateMetrics(const std::vector<double> &actual,
	                                               const std::vector<double> &predicted);

	/// Ranks results by ascending RMSE; ties keep their input order.
	static ComparisonResult compare(const std::vector<ForecastResult> &results);

	/// Fits every configuration on the same data; per-model failures are recorded, not thrown.
	ModelComparison compareModels(const data::DataInput &data, const std::vector<ModelConfiguration> &configs) const;

	/// Length-only policy: < 24 ARIMA, < 50 Holt-Winters, otherwise SARIMA.
	static AutoSelection autoSelect(std::size_t length);

	AutoSelection autoSelect(const data::DataInput &data) const;

	std::vector<ModelDescriptor> availableModels() const;

	DataAnalysis analyzeData(const data::DataInput &data) const;

	/**
	 * @brief Labels for the forecast horizon.
	 *
	 * Extends a regular time index by its step; otherwise "Period N" with
	 * N = series length + i + 1.
	 */
	static std::vector<std::string> forecastDates(const core::TimeSeries &series, int periods);

private:
	int resolvePeriods(const ModelConfiguration &config) const;
	double resolveConfidence(const ModelConfiguration &config) const;

	utils::Settings settings_;
	ModelRegistry registry_;
	analysis::StatisticalAnalyzer analyzer_;
};

} // namespace atsa::manager
