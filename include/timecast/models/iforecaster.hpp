#pragma once

#include "timecast/core/forecast.hpp"
#include "timecast/core/time_series.hpp"
#include "timecast/utils/deadline.hpp"
#include "timecast/utils/statistics.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace timecast::models {

/**
 * @class IForecaster
 * @brief An interface for all forecasting models.
 *
 * This abstract base class defines the common contract every model variant
 * honours: fit on exactly one training window, then answer any number of
 * deterministic, side-effect-free predict calls. Every forecast carries
 * bounds at the model's confidence level.
 */
class IForecaster {
public:
	using RegressorTable = core::TimeSeries::RegressorTable;

	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The training window; must hold at least minTrainingLength() finite observations.
	 * @throws core::TrainingError If the window is too short or the fit fails numerically.
	 * @throws core::TimeoutError If the model's deadline passes during an iterative fit.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates forecasts for a specified number of steps into the future.
	 * @param horizon The number of future time steps to predict.
	 * @param future_regressors Regressor values for the forecast steps, one per step.
	 * @return A Forecast with point, lower and upper series of length @p horizon.
	 * @throws core::PredictionError If not fitted, the horizon is invalid, or regressors are missing.
	 */
	virtual core::Forecast predict(int horizon,
	                               const std::optional<RegressorTable> &future_regressors = std::nullopt) const = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 * @return A string representing the model's name (e.g., "Decomposition").
	 */
	virtual std::string getName() const = 0;

	/// Fewest observations fit() accepts.
	virtual std::size_t minTrainingLength() const = 0;

	/// Longest horizon predict() accepts; nullopt when unbounded.
	virtual std::optional<std::size_t> maxHorizon() const {
		return std::nullopt;
	}

	/// Regressors that must be supplied both for training and for prediction.
	virtual std::vector<std::string> requiredRegressors() const {
		return {};
	}

	/// In-sample residual standard deviation of the last fit.
	virtual double residualStdDev() const = 0;

	bool isFitted() const {
		return is_fitted_;
	}

	double confidenceLevel() const {
		return confidence_level_;
	}

	void setDeadline(utils::Deadline deadline) {
		deadline_ = deadline;
	}

	const utils::Deadline &deadline() const {
		return deadline_;
	}

protected:
	explicit IForecaster(double confidence_level);

	/// @throws core::TrainingError If @p ts is shorter than minTrainingLength() or holds non-finite values.
	void ensureTrainable(const core::TimeSeries &ts) const;

	/// @throws core::PredictionError If the model is not fitted, @p horizon is invalid or regressors mismatch.
	void ensurePredictable(int horizon, const std::optional<RegressorTable> &future_regressors) const;

	/**
	 * @brief Fills the bounds as point ± z·sigma·growth(h).
	 * @param growth Multiplier per step, evaluated at h = 1..horizon.
	 */
	template <typename Growth>
	void applyResidualBounds(core::Forecast &forecast, double sigma, Growth growth) const;

	/// Bounds expanded by the in-sample residual standard deviation, constant over the horizon.
	void applyResidualBounds(core::Forecast &forecast, double sigma) const;

	void markFitted(bool fitted) {
		is_fitted_ = fitted;
	}

private:
	double confidence_level_;
	utils::Deadline deadline_;
	bool is_fitted_ = false;
};

template <typename Growth>
void IForecaster::applyResidualBounds(core::Forecast &forecast, double sigma, Growth growth) const {
	const double z = utils::zScore(confidence_level_);
	forecast.confidence_level = confidence_level_;
	forecast.lower.resize(forecast.point.size());
	forecast.upper.resize(forecast.point.size());
	for (std::size_t idx = 0; idx < forecast.point.size(); ++idx) {
		const double half_width = z * sigma * growth(idx + 1);
		forecast.lower[idx] = forecast.point[idx] - half_width;
		forecast.upper[idx] = forecast.point[idx] + half_width;
	}
}

} // namespace timecast::models
