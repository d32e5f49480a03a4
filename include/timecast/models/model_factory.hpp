#pragma once

#include "timecast/models/iforecaster.hpp"
#include "timecast/models/recurrent.hpp"

#include <memory>
#include <string>
#include <vector>

namespace timecast::models {

/// The interchangeable model variants, listed in tie-breaking priority order.
enum class ModelKind { SeasonalRegression, Decomposition, Recurrent };

/**
 * @struct ModelOptions
 * @brief Settings shared by every variant the factory builds.
 */
struct ModelOptions {
	double confidence_level = 0.95;
	/// Seasonal periods in observations; Decomposition uses the first one.
	std::vector<std::size_t> seasonal_periods;
	std::size_t fourier_order = 3;
	/// Regressors SeasonalRegression trains on.
	std::vector<std::string> regressors;
	RecurrentOptions recurrent;
};

class ModelFactory {
public:
	/// Creates an untrained model of the given kind.
	static std::unique_ptr<IForecaster> create(ModelKind kind, const ModelOptions &options);

	/// Creates an untrained model from its name.
	/// @throws std::invalid_argument If the name is unknown.
	static std::unique_ptr<IForecaster> create(const std::string &model_name, const ModelOptions &options);

	/**
	 * @brief Resolves a model name, case-insensitively.
	 *
	 * Accepts the canonical names plus the aliases "decomp", "regression",
	 * "seasonal_regression", "lstm" and "rnn".
	 * @throws std::invalid_argument If the name is unknown.
	 */
	static ModelKind parse(const std::string &model_name);

	static std::string name(ModelKind kind);

	static std::vector<std::string> supportedModels();

	/// Lower values are preferred when candidates tie on every metric.
	static int priority(ModelKind kind);

	/// Priority of a model by name; unknown names rank after every known kind.
	static int priority(const std::string &model_name);
};

} // namespace timecast::models
