#pragma once

#include "timecast/models/model_factory.hpp"
#include "timecast/selectors/model_selector.hpp"
#include "timecast/transform/transformers.hpp"
#include "timecast/utils/cross_correlation.hpp"
#include "timecast/utils/cross_validation.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace timecast::pipeline {

/**
 * @brief What to do with explicit gaps (non-finite values) in the input window
 */
enum class GapPolicy {
	Interpolate, // fill linearly before validation
	Reject       // raise MalformedInputError
};

/**
 * @struct RegressorScreeningConfig
 * @brief Keeps only regressors whose peak lagged correlation with the target is strong enough.
 */
struct RegressorScreeningConfig {
	bool enabled = false;
	int max_lags = 10;
	utils::CorrelationMode mode = utils::CorrelationMode::Pearson;
	double min_abs_correlation = 0.3;
};

/**
 * @struct PipelineConfig
 * @brief Every knob of one orchestrator invocation.
 *
 * Seeds, pool sizes and timeouts live here rather than in process-wide state,
 * so concurrent invocations never interfere.
 */
struct PipelineConfig {
	static constexpr std::size_t kMaxFoldCount = 1000;
	static constexpr std::size_t kMaxFoldTestLength = 1000000;

	std::vector<models::ModelKind> candidate_models = {models::ModelKind::SeasonalRegression,
	                                                   models::ModelKind::Decomposition,
	                                                   models::ModelKind::Recurrent};
	std::size_t fold_count = 3;
	std::size_t fold_test_length = 5;
	std::size_t forecast_horizon = 5;
	double confidence_level = 0.95;
	selectors::EnsemblePolicy ensemble_policy = selectors::EnsemblePolicy::BestOf;
	utils::CVMetric primary_metric = utils::CVMetric::MAPE;
	std::size_t worker_pool_size = 2;
	std::chrono::milliseconds per_model_timeout = std::chrono::seconds(60);
	std::uint64_t random_seed = 42;

	bool parallel_folds = false;
	GapPolicy gap_policy = GapPolicy::Interpolate;
	transform::TransformKind transformation = transform::TransformKind::None;

	/// Seasonal periods in observations, used by the decomposition and regression models.
	std::vector<std::size_t> seasonal_periods;
	std::size_t fourier_order = 3;

	std::size_t recurrent_lookback = 8;
	std::size_t recurrent_hidden_units = 8;
	std::size_t recurrent_epochs = 150;
	double recurrent_learning_rate = 0.01;

	RegressorScreeningConfig regressor_screening;

	/// @throws std::invalid_argument If any value is out of range.
	void validate() const;

	/// Options for the model factory, with @p regressors as the regression inputs.
	models::ModelOptions modelOptions(const std::vector<std::string> &regressors = {}) const;

	/**
	 * @brief Builds a configuration from string key/value options.
	 *
	 * Keys match the member names (for example "fold_count" or
	 * "candidate_models" with a comma separated list); screening options use
	 * the "regressor_screening." prefix. Durations accept "ms", "s" and "m"
	 * suffixes and default to seconds. Unset keys keep their defaults.
	 * @throws std::invalid_argument On unknown keys, unparsable values, or a configuration that fails validate().
	 */
	static PipelineConfig fromOptions(const std::map<std::string, std::string> &options);
};

/// @throws std::invalid_argument If @p name is neither interpolate nor reject.
GapPolicy parseGapPolicy(const std::string &name);

std::string gapPolicyName(GapPolicy policy);

} // namespace timecast::pipeline
