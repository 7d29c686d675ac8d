#pragma once

#include "atsa/models/iforecaster.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace atsa::models {

/**
 * @class SequenceNetwork
 * @brief Two-layer LSTM regressor mapping a window of past values to the next one.
 *
 * Values are min-max scaled to [0, 1] and cut into sliding windows of
 * @c sequence_length. The network (LSTM -> dropout -> LSTM -> dropout -> dense)
 * is trained with Adam on mean squared error, holding out the last
 * @c validation_split of windows for validation.
 *
 * Multi-step forecasts are recursive: each scaled prediction is appended to
 * the input window for the next step, so errors compound over the horizon.
 * Intervals are forecast +/- z * sigma, where sigma is the standard deviation
 * of the forecast path (or 10% of the data's standard deviation for a
 * single-step horizon).
 */
class SequenceNetwork final : public IForecaster {
public:
	struct Options {
		int sequence_length = 60;
		int lstm_units = 50;
		double dropout = 0.2;
		int epochs = 50;
		int batch_size = 32;
		double validation_split = 0.2;
		double learning_rate = 0.001;
		std::uint32_t seed = 42;
	};

	explicit SequenceNetwork(Options options);
	~SequenceNetwork() override;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon, double confidence = 0.95) override;
	std::vector<double> fittedValues() const override;
	nlohmann::json modelInfo() const override;

	std::string getName() const override {
		return "LSTM";
	}

	/// Mean training loss per epoch.
	const std::vector<double> &trainingLoss() const {
		return training_loss_;
	}

	/// Validation loss per epoch (empty when no windows were held out).
	const std::vector<double> &validationLoss() const {
		return validation_loss_;
	}

private:
	struct Network;

	double scale(double value) const;
	double unscale(double value) const;
	void requireFitted(const char *operation) const;

	Options options_;
	std::unique_ptr<Network> network_;
	std::vector<double> history_;
	std::vector<double> scaled_;
	double data_min_ = 0.0;
	double data_range_ = 1.0;
	std::vector<double> training_loss_;
	std::vector<double> validation_loss_;
	bool is_fitted_ = false;
};

} // namespace atsa::models
