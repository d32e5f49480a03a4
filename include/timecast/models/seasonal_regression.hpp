#pragma once

#include "timecast/models/iforecaster.hpp"

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace timecast::models {

class SeasonalRegressionBuilder; // Forward declaration

/**
 * @class SeasonalRegression
 * @brief Ordinary least squares on trend, Fourier seasonality and exogenous regressors.
 *
 * The design matrix holds an intercept, a linear trend, one sine/cosine pair per
 * harmonic of every seasonal period, and one column per declared regressor.
 * Coefficients are solved with a column-pivoting QR decomposition; bounds use
 * the classical OLS prediction variance sigma^2 * (1 + x' (X'X)^-1 x).
 */
class SeasonalRegression final : public IForecaster {
public:
	friend class SeasonalRegressionBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon,
	                       const std::optional<RegressorTable> &future_regressors = std::nullopt) const override;

	std::string getName() const override {
		return "SeasonalRegression";
	}

	std::size_t minTrainingLength() const override {
		return columnCount() + 2;
	}

	std::vector<std::string> requiredRegressors() const override {
		return regressors_;
	}

	double residualStdDev() const override {
		return sigma_;
	}

	/// Number of design-matrix columns implied by the configuration.
	std::size_t columnCount() const;

	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}

	/// Regressors that entered the last fit; constant ones are dropped.
	const std::vector<std::string> &activeRegressors() const {
		return active_regressors_;
	}

	const std::vector<double> &residuals() const {
		return residuals_;
	}

private:
	SeasonalRegression(std::vector<std::size_t> seasonal_periods, std::size_t fourier_order,
	                   std::vector<std::string> regressors, double confidence_level);

	std::size_t harmonicCount(std::size_t period) const;
	Eigen::MatrixXd designMatrix(std::size_t first_index, std::size_t rows,
	                             const std::vector<const std::vector<double> *> &regressor_columns) const;

	std::vector<std::size_t> seasonal_periods_;
	std::size_t fourier_order_;
	std::vector<std::string> regressors_;
	std::vector<std::string> active_regressors_;
	double trend_scale_ = 1.0;
	std::size_t n_ = 0;
	Eigen::VectorXd coefficients_;
	Eigen::MatrixXd xtx_inverse_;
	double sigma_ = 0.0;
	std::vector<double> residuals_;
};

/**
 * @class SeasonalRegressionBuilder
 * @brief A builder for fluently configuring and creating SeasonalRegression models.
 */
class SeasonalRegressionBuilder {
public:
	/// Seasonal periods in observations; periods below 2 are ignored.
	SeasonalRegressionBuilder &withSeasonalPeriods(std::vector<std::size_t> periods);

	/// Highest harmonic per period, capped at period / 2.
	SeasonalRegressionBuilder &withFourierOrder(std::size_t order);

	/// Exogenous regressors the model trains on and needs future values for.
	SeasonalRegressionBuilder &withRegressors(std::vector<std::string> names);

	SeasonalRegressionBuilder &withConfidenceLevel(double level);

	std::unique_ptr<SeasonalRegression> build();

private:
	std::vector<std::size_t> seasonal_periods_;
	std::size_t fourier_order_ = 3;
	std::vector<std::string> regressors_;
	double confidence_level_ = 0.95;
};

} // namespace timecast::models
