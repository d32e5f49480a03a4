#include "timecast/models/decomposition.hpp"
#include "timecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace timecast::models {

// --- Model Implementation ---

Decomposition::Decomposition(std::size_t seasonal_period, double confidence_level)
    : IForecaster(confidence_level), seasonal_period_(seasonal_period < 2 ? 0 : seasonal_period) {
}

std::size_t Decomposition::minTrainingLength() const {
	return std::max<std::size_t>(3, 2 * seasonal_period_);
}

std::vector<double> Decomposition::centredMovingAverage(const std::vector<double> &values) const {
	const std::size_t n = values.size();
	const std::size_t p = seasonal_period_;
	const std::size_t half = p / 2;
	std::vector<double> trend(n, std::numeric_limits<double>::quiet_NaN());

	for (std::size_t i = half; i + half < n; ++i) {
		double sum = 0.0;
		if (p % 2 == 1) {
			for (std::size_t j = i - half; j <= i + half; ++j) {
				sum += values[j];
			}
		} else {
			// 2xP moving average keeps the window centred for even periods.
			sum = 0.5 * values[i - half] + 0.5 * values[i + half];
			for (std::size_t j = i - half + 1; j < i + half; ++j) {
				sum += values[j];
			}
		}
		trend[i] = sum / static_cast<double>(p);
	}
	return trend;
}

void Decomposition::estimateSeasonalIndices(const std::vector<double> &values) {
	const std::size_t p = seasonal_period_;
	const auto trend = centredMovingAverage(values);

	std::vector<double> sums(p, 0.0);
	std::vector<std::size_t> counts(p, 0);
	for (std::size_t i = 0; i < values.size(); ++i) {
		if (std::isfinite(trend[i])) {
			sums[i % p] += values[i] - trend[i];
			++counts[i % p];
		}
	}

	seasonal_indices_.assign(p, 0.0);
	for (std::size_t k = 0; k < p; ++k) {
		if (counts[k] > 0) {
			seasonal_indices_[k] = sums[k] / static_cast<double>(counts[k]);
		}
	}
	const double centre =
	    std::accumulate(seasonal_indices_.begin(), seasonal_indices_.end(), 0.0) / static_cast<double>(p);
	for (double &index : seasonal_indices_) {
		index -= centre;
	}
}

double Decomposition::seasonalAt(std::size_t index) const {
	return seasonal_period_ == 0 ? 0.0 : seasonal_indices_[index % seasonal_period_];
}

void Decomposition::fit(const core::TimeSeries &ts) {
	ensureTrainable(ts);
	markFitted(false);

	const auto &values = ts.getValues();
	n_ = values.size();

	if (seasonal_period_ > 0) {
		estimateSeasonalIndices(values);
	} else {
		seasonal_indices_.clear();
	}

	// Least-squares line through the deseasonalised series.
	mean_index_ = static_cast<double>(n_ - 1) / 2.0;
	double mean_value = 0.0;
	for (std::size_t i = 0; i < n_; ++i) {
		mean_value += values[i] - seasonalAt(i);
	}
	mean_value /= static_cast<double>(n_);

	double numerator = 0.0;
	index_ss_ = 0.0;
	for (std::size_t i = 0; i < n_; ++i) {
		const double x_diff = static_cast<double>(i) - mean_index_;
		numerator += x_diff * (values[i] - seasonalAt(i) - mean_value);
		index_ss_ += x_diff * x_diff;
	}
	slope_ = index_ss_ > 1e-10 ? numerator / index_ss_ : 0.0;
	intercept_ = mean_value - slope_ * mean_index_;

	fitted_.resize(n_);
	residuals_.resize(n_);
	for (std::size_t i = 0; i < n_; ++i) {
		fitted_[i] = intercept_ + slope_ * static_cast<double>(i) + seasonalAt(i);
		residuals_[i] = values[i] - fitted_[i];
	}
	sigma_ = utils::residualStdDev(residuals_, 2);

	if (!std::isfinite(intercept_) || !std::isfinite(slope_) || !std::isfinite(sigma_)) {
		throw core::TrainingError("Decomposition produced non-finite trend parameters.");
	}

	markFitted(true);
	TIMECAST_DEBUG("Decomposition fitted with {} data points, period = {}, slope = {:.6f}, sigma = {:.6f}.", n_,
	               seasonal_period_, slope_, sigma_);
}

core::Forecast Decomposition::predict(int horizon, const std::optional<RegressorTable> &future_regressors) const {
	ensurePredictable(horizon, future_regressors);

	core::Forecast forecast;
	auto &series = forecast.primary();
	series.reserve(static_cast<std::size_t>(horizon));
	for (int h = 1; h <= horizon; ++h) {
		const std::size_t index = n_ - 1 + static_cast<std::size_t>(h);
		series.push_back(intercept_ + slope_ * static_cast<double>(index) + seasonalAt(index));
	}

	const double n = static_cast<double>(n_);
	const double mean_index = mean_index_;
	const double index_ss = index_ss_;
	const std::size_t last = n_ - 1;
	applyResidualBounds(forecast, sigma_, [n, mean_index, index_ss, last](std::size_t h) {
		const double x_diff = static_cast<double>(last + h) - mean_index;
		const double leverage = index_ss > 1e-10 ? (x_diff * x_diff) / index_ss : 0.0;
		return std::sqrt(1.0 + 1.0 / n + leverage);
	});
	return forecast;
}

// --- Builder Implementation ---

DecompositionBuilder &DecompositionBuilder::withSeasonalPeriod(std::size_t period) {
	seasonal_period_ = period;
	return *this;
}

DecompositionBuilder &DecompositionBuilder::withConfidenceLevel(double level) {
	confidence_level_ = level;
	return *this;
}

std::unique_ptr<Decomposition> DecompositionBuilder::build() {
	return std::unique_ptr<Decomposition>(new Decomposition(seasonal_period_, confidence_level_));
}

} // namespace timecast::models
