#pragma once

#include "atsa/models/iforecaster.hpp"
#include "atsa/utils/logging.hpp"

#include <memory>
#include <vector>

namespace atsa::models {

class MovingAverageBuilder; // Forward declaration

/**
 * @class MovingAverage
 * @brief Forecasts the mean of the last @c window observations for every step.
 *
 * Intervals are mean +/- z * std of that window (sample standard deviation),
 * which collapse to zero width on a constant window.
 */
class MovingAverage final : public IForecaster {
public:
	friend class MovingAverageBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon, double confidence = 0.95) override;
	std::vector<double> fittedValues() const override;
	nlohmann::json modelInfo() const override;

	std::string getName() const override {
		return "MovingAverage";
	}

	int window() const {
		return window_;
	}

private:
	/**
	 * @brief Private constructor for MovingAverage model.
	 * @param window The number of past observations to include in the average.
	 */
	explicit MovingAverage(int window);

	void requireFitted(const char *operation) const;

	int window_;
	std::vector<double> history_;
	double last_mean_ = 0.0;
	double last_std_ = 0.0;
	bool is_fitted_ = false;
};

/**
 * @class MovingAverageBuilder
 * @brief A builder for fluently configuring and creating MovingAverage models.
 */
class MovingAverageBuilder {
public:
	/**
	 * @brief Sets the window size for the moving average.
	 * @param window The number of past observations.
	 * @return A reference to the builder for chaining.
	 */
	MovingAverageBuilder &withWindow(int window);

	std::unique_ptr<MovingAverage> build();

private:
	int window_ = 12;
};

} // namespace atsa::models
