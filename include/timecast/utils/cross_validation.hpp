#pragma once

#include "timecast/core/errors.hpp"
#include "timecast/core/time_series.hpp"
#include "timecast/models/iforecaster.hpp"
#include "timecast/utils/deadline.hpp"
#include "timecast/utils/metrics.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace timecast::utils {

/**
 * @brief Accuracy metric used to rank validated models
 */
enum class CVMetric {
	MAE,   // Mean Absolute Error
	MSE,   // Mean Squared Error
	RMSE,  // Root Mean Squared Error
	MAPE,  // Mean Absolute Percentage Error
	SMAPE  // Symmetric Mean Absolute Percentage Error
};

/// @throws std::invalid_argument If @p name is not one of mae, mse, rmse, mape, smape.
CVMetric parseCVMetric(const std::string &name);

std::string cvMetricName(CVMetric metric);

/**
 * @brief Configuration for rolling-origin cross-validation
 */
struct CVConfig {
	std::size_t fold_count = 3;   // Number of folds carved from the end of the window
	std::size_t test_length = 1;  // Observations per fold test window
	bool parallel_folds = false;  // Evaluate folds concurrently; results keep fold order
	std::size_t max_workers = 0;  // Upper bound on concurrent folds; 0 means hardware concurrency
	Deadline deadline;            // Polled before every fold and handed to each model
};

/**
 * @brief Position of one fold; training data is every observation before test_start.
 *
 * test_start is signed because folds may begin before the first observation.
 */
struct CVFoldPlan {
	std::size_t fold_id = 0;
	long long test_start = 0;
	long long test_end = 0;
};

/**
 * @brief Results from a single evaluated fold
 */
struct CVFold {
	std::size_t fold_id = 0;
	std::size_t train_start = 0;
	std::size_t train_end = 0;   // exclusive, equals test_start
	std::size_t test_start = 0;
	std::size_t test_end = 0;    // exclusive

	std::vector<double> forecasts;
	std::vector<double> lower;
	std::vector<double> upper;
	std::vector<double> actuals;

	double mae = 0.0;
	double mse = 0.0;
	double rmse = 0.0;
	std::optional<double> mape;
	std::optional<double> smape;
	std::optional<double> coverage; // share of actuals inside the bounds, when the bounds are finite
};

/**
 * @brief Results from cross-validation
 */
struct CVResults {
	std::vector<CVFold> folds;
	std::vector<core::FoldSkippedWarning> skipped;

	// Arithmetic means of the per-fold metrics
	double mae = 0.0;
	double mse = 0.0;
	double rmse = 0.0;
	std::optional<double> mape;  // over folds where defined
	std::optional<double> smape; // over folds where defined
	std::optional<double> coverage; // over folds where defined

	std::size_t total_forecasts = 0;

	/**
	 * @brief Compute aggregated metrics from the evaluated folds
	 */
	void computeAggregatedMetrics();

	/**
	 * @brief Get the value of a specific metric
	 * @return The metric value, NaN when it is undefined for every fold
	 */
	double getMetric(CVMetric metric) const;
};

using ForecasterFactory = std::function<std::unique_ptr<models::IForecaster>()>;

/**
 * @brief Rolling-origin time series cross-validation
 *
 * The last fold_count * test_length observations form chronological folds.
 * Each fold trains a fresh model on everything strictly before its test window,
 * so no future information reaches training.
 */
class CrossValidation {
public:
	/**
	 * @brief Perform cross-validation on a time series
	 *
	 * @param ts Time series to validate
	 * @param model_factory Function that creates a new model instance for each fold
	 * @param config CV configuration
	 * @return CVResults with fold-wise and aggregated metrics
	 * @throws core::ValidationError If every fold is skipped
	 * @throws core::TrainingError, core::PredictionError If a model fails on an evaluated fold
	 * @throws core::TimeoutError If the deadline passes between folds
	 */
	static CVResults evaluate(const core::TimeSeries &ts, const ForecasterFactory &model_factory,
	                          const CVConfig &config = CVConfig{});

	/**
	 * @brief Plan folds for a window of @p n_samples observations
	 *
	 * Fold i (0 = oldest) starts at n_samples - (fold_count - i) * test_length.
	 * @throws std::invalid_argument If fold_count or test_length is zero
	 */
	static std::vector<CVFoldPlan> generateFolds(std::size_t n_samples, std::size_t fold_count,
	                                             std::size_t test_length);
};

} // namespace timecast::utils
