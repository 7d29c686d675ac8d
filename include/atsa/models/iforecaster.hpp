#pragma once

#include "atsa/core/forecast.hpp"
#include "atsa/core/time_series.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace atsa::models {

/**
 * @class IForecaster
 * @brief An interface for all forecasting models.
 *
 * Implementations throw core::FittingError when the input cannot be modelled
 * and core::StateError when queried before fit().
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The time series data to train the model on.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates forecasts for a specified number of steps into the future.
	 * @param horizon The number of future time steps to predict.
	 * @param confidence Coverage of the prediction interval, in (0, 1).
	 * @return Point forecasts with lower and upper bounds of equal length.
	 */
	virtual core::Forecast predict(int horizon, double confidence = 0.95) = 0;

	/**
	 * @brief In-sample predictions aligned index-for-index with the fitted series.
	 *
	 * Positions a model cannot reconstruct (warm-up windows, differencing lags)
	 * hold NaN.
	 */
	virtual std::vector<double> fittedValues() const = 0;

	/// Diagnostic metadata such as information criteria and coefficients.
	virtual nlohmann::json modelInfo() const = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 * @return A string representing the model's name (e.g., "ARIMA").
	 */
	virtual std::string getName() const = 0;
};

} // namespace atsa::models
