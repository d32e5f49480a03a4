#include "timecast/models/iforecaster.hpp"

#include <cmath>
#include <stdexcept>

namespace timecast::models {

IForecaster::IForecaster(double confidence_level) : confidence_level_(confidence_level) {
	if (confidence_level_ <= 0.0 || confidence_level_ >= 1.0) {
		throw std::invalid_argument("Confidence level must be between 0 and 1.");
	}
}

void IForecaster::ensureTrainable(const core::TimeSeries &ts) const {
	if (ts.size() < minTrainingLength()) {
		throw core::TrainingError(getName() + " needs at least " + std::to_string(minTrainingLength()) +
		                          " observations, got " + std::to_string(ts.size()) + ".");
	}
	if (ts.hasGaps()) {
		throw core::TrainingError(getName() + " cannot be trained on a window with missing observations.");
	}
	for (const auto &name : requiredRegressors()) {
		if (!ts.hasRegressor(name)) {
			throw core::TrainingError(getName() + " requires regressor '" + name +
			                          "' which the training window does not carry.");
		}
	}
}

void IForecaster::ensurePredictable(int horizon, const std::optional<RegressorTable> &future_regressors) const {
	if (!isFitted()) {
		throw core::PredictionError(getName() + "::predict called before fit.");
	}
	if (horizon < 1) {
		throw core::PredictionError("Forecast horizon must be at least 1.");
	}
	const auto limit = maxHorizon();
	if (limit && static_cast<std::size_t>(horizon) > *limit) {
		throw core::PredictionError(getName() + " supports a horizon of at most " + std::to_string(*limit) +
		                            " steps.");
	}
	for (const auto &name : requiredRegressors()) {
		if (!future_regressors) {
			throw core::PredictionError(getName() + " requires future values for regressor '" + name + "'.");
		}
		const auto it = future_regressors->find(name);
		if (it == future_regressors->end()) {
			throw core::PredictionError(getName() + " requires future values for regressor '" + name + "'.");
		}
		if (it->second.size() != static_cast<std::size_t>(horizon)) {
			throw core::PredictionError("Future regressor '" + name + "' has " + std::to_string(it->second.size()) +
			                            " values; expected one per forecast step (" + std::to_string(horizon) + ").");
		}
		for (double v : it->second) {
			if (!std::isfinite(v)) {
				throw core::PredictionError("Future regressor '" + name + "' contains non-finite values.");
			}
		}
	}
}

void IForecaster::applyResidualBounds(core::Forecast &forecast, double sigma) const {
	applyResidualBounds(forecast, sigma, [](std::size_t) { return 1.0; });
}

} // namespace timecast::models
