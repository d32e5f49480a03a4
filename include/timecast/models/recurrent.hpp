#pragma once

#include "timecast/models/iforecaster.hpp"

#include <Eigen/Dense>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace timecast::models {

/**
 * @struct RecurrentOptions
 * @brief Hyper-parameters of the recurrent forecaster.
 */
struct RecurrentOptions {
	/// Number of past differences fed to the network per prediction.
	std::size_t lookback = 8;
	std::size_t hidden_units = 8;
	std::size_t epochs = 150;
	double learning_rate = 0.01;
	/// Global gradient-norm ceiling.
	double gradient_clip = 5.0;
	std::uint64_t seed = 42;
	double confidence_level = 0.95;
};

class RecurrentBuilder; // Forward declaration

/**
 * @class Recurrent
 * @brief Single-layer LSTM trained on standardised first differences.
 *
 * Training runs full-batch back-propagation through time over every lookback
 * window of the differenced series and updates the weights with Adam. Weights
 * are initialised from a std::mt19937_64 seeded with RecurrentOptions::seed, so
 * equal seeds reproduce equal fits. Forecasts are produced recursively one
 * difference at a time and integrated back onto the last observed level.
 *
 * The deadline set on the model is polled once per epoch.
 */
class Recurrent final : public IForecaster {
public:
	friend class RecurrentBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon,
	                       const std::optional<RegressorTable> &future_regressors = std::nullopt) const override;

	std::string getName() const override {
		return "Recurrent";
	}

	std::size_t minTrainingLength() const override {
		return options_.lookback + 6;
	}

	double residualStdDev() const override {
		return sigma_;
	}

	const RecurrentOptions &options() const {
		return options_;
	}

	/// Mean squared error (standardised scale) after each epoch of the last fit.
	const std::vector<double> &lossHistory() const {
		return loss_history_;
	}

private:
	struct Parameters {
		Eigen::MatrixXd input_weights;     // 4H x 1
		Eigen::MatrixXd recurrent_weights; // 4H x H
		Eigen::VectorXd bias;              // 4H
		Eigen::RowVectorXd output_weights; // 1 x H
		double output_bias = 0.0;
	};

	explicit Recurrent(RecurrentOptions options);

	void initialise();
	double step(const std::vector<double> &window) const;
	double trainEpoch(const std::vector<std::vector<double>> &inputs, const std::vector<double> &targets);

	RecurrentOptions options_;
	Parameters params_;
	Parameters adam_m_;
	Parameters adam_v_;
	std::size_t adam_t_ = 0;

	double diff_mean_ = 0.0;
	double diff_scale_ = 1.0;
	double last_level_ = 0.0;
	std::vector<double> last_window_;
	double sigma_ = 0.0;
	std::vector<double> loss_history_;
};

/**
 * @class RecurrentBuilder
 * @brief A builder for fluently configuring and creating Recurrent models.
 */
class RecurrentBuilder {
public:
	RecurrentBuilder &withOptions(RecurrentOptions options);
	RecurrentBuilder &withLookback(std::size_t lookback);
	RecurrentBuilder &withHiddenUnits(std::size_t units);
	RecurrentBuilder &withEpochs(std::size_t epochs);
	RecurrentBuilder &withLearningRate(double rate);
	RecurrentBuilder &withSeed(std::uint64_t seed);
	RecurrentBuilder &withConfidenceLevel(double level);

	/// @throws std::invalid_argument If lookback, hidden units or epochs are zero or the learning rate is not positive.
	std::unique_ptr<Recurrent> build();

private:
	RecurrentOptions options_;
};

} // namespace timecast::models
