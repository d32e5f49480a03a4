#pragma once

#include "timecast/models/iforecaster.hpp"

#include <memory>
#include <string>
#include <vector>

namespace timecast::models {

class DecompositionBuilder; // Forward declaration

/**
 * @class Decomposition
 * @brief Classical additive seasonal decomposition with a linear trend forecast.
 *
 * Process:
 * 1. Estimate the trend with a centred moving average over one season
 * 2. Average the detrended values per season position into seasonal indices
 * 3. Fit a least-squares line to the deseasonalised series and extrapolate it
 * 4. Project the seasonal indices cyclically and add them back
 *
 * Bounds are the textbook prediction interval of the trend line, so they widen
 * as the forecast moves away from the centre of the training window. With a
 * seasonal period below 2 the model reduces to a linear trend.
 */
class Decomposition final : public IForecaster {
public:
	friend class DecompositionBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon,
	                       const std::optional<RegressorTable> &future_regressors = std::nullopt) const override;

	std::string getName() const override {
		return "Decomposition";
	}

	std::size_t minTrainingLength() const override;

	double residualStdDev() const override {
		return sigma_;
	}

	std::size_t seasonalPeriod() const {
		return seasonal_period_;
	}

	double trendIntercept() const {
		return intercept_;
	}

	double trendSlope() const {
		return slope_;
	}

	const std::vector<double> &seasonalIndices() const {
		return seasonal_indices_;
	}

	const std::vector<double> &fittedValues() const {
		return fitted_;
	}

	const std::vector<double> &residuals() const {
		return residuals_;
	}

private:
	Decomposition(std::size_t seasonal_period, double confidence_level);

	std::vector<double> centredMovingAverage(const std::vector<double> &values) const;
	void estimateSeasonalIndices(const std::vector<double> &values);
	double seasonalAt(std::size_t index) const;

	std::size_t seasonal_period_;
	std::vector<double> seasonal_indices_;
	double intercept_ = 0.0;
	double slope_ = 0.0;
	double mean_index_ = 0.0;
	double index_ss_ = 0.0;
	double sigma_ = 0.0;
	std::size_t n_ = 0;
	std::vector<double> fitted_;
	std::vector<double> residuals_;
};

/**
 * @class DecompositionBuilder
 * @brief A builder for fluently configuring and creating Decomposition models.
 */
class DecompositionBuilder {
public:
	/**
	 * @brief Sets the number of observations per season (0 or 1 disables seasonality).
	 */
	DecompositionBuilder &withSeasonalPeriod(std::size_t period);

	DecompositionBuilder &withConfidenceLevel(double level);

	std::unique_ptr<Decomposition> build();

private:
	std::size_t seasonal_period_ = 0;
	double confidence_level_ = 0.95;
};

} // namespace timecast::models
