#include "timecast/models/seasonal_regression.hpp"
#include "timecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace timecast::models {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kConstantColumnTolerance = 1e-12;

bool isConstant(const std::vector<double> &values) {
	const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
	return (*hi - *lo) <= kConstantColumnTolerance * std::max(1.0, std::abs(*hi));
}

} // namespace

SeasonalRegression::SeasonalRegression(std::vector<std::size_t> seasonal_periods, std::size_t fourier_order,
                                       std::vector<std::string> regressors, double confidence_level)
    : IForecaster(confidence_level), fourier_order_(fourier_order), regressors_(std::move(regressors)) {
	for (std::size_t period : seasonal_periods) {
		if (period >= 2 && std::find(seasonal_periods_.begin(), seasonal_periods_.end(), period) ==
		                       seasonal_periods_.end()) {
			seasonal_periods_.push_back(period);
		}
	}
	std::sort(regressors_.begin(), regressors_.end());
	regressors_.erase(std::unique(regressors_.begin(), regressors_.end()), regressors_.end());
}

std::size_t SeasonalRegression::harmonicCount(std::size_t period) const {
	return std::min(fourier_order_, period / 2);
}

std::size_t SeasonalRegression::columnCount() const {
	std::size_t columns = 2; // intercept, trend
	for (std::size_t period : seasonal_periods_) {
		for (std::size_t k = 1; k <= harmonicCount(period); ++k) {
			// At the Nyquist harmonic the sine column is identically zero.
			columns += (2 * k == period) ? 1 : 2;
		}
	}
	return columns + regressors_.size();
}

Eigen::MatrixXd
SeasonalRegression::designMatrix(std::size_t first_index, std::size_t rows,
                                 const std::vector<const std::vector<double> *> &regressor_columns) const {
	const std::size_t columns = columnCount() - regressors_.size() + regressor_columns.size();
	Eigen::MatrixXd X(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(columns));

	for (std::size_t r = 0; r < rows; ++r) {
		const auto row = static_cast<Eigen::Index>(r);
		const double t = static_cast<double>(first_index + r);
		Eigen::Index col = 0;
		X(row, col++) = 1.0;
		X(row, col++) = t / trend_scale_;
		for (std::size_t period : seasonal_periods_) {
			for (std::size_t k = 1; k <= harmonicCount(period); ++k) {
				const double angle = 2.0 * kPi * static_cast<double>(k) * t / static_cast<double>(period);
				X(row, col++) = std::cos(angle);
				if (2 * k != period) {
					X(row, col++) = std::sin(angle);
				}
			}
		}
		for (const auto *column : regressor_columns) {
			X(row, col++) = (*column)[r];
		}
	}
	return X;
}

void SeasonalRegression::fit(const core::TimeSeries &ts) {
	ensureTrainable(ts);
	markFitted(false);

	n_ = ts.size();
	trend_scale_ = static_cast<double>(std::max<std::size_t>(n_ - 1, 1));

	active_regressors_.clear();
	std::vector<const std::vector<double> *> columns;
	for (const auto &name : regressors_) {
		const auto &values = ts.regressor(name);
		if (isConstant(values)) {
			TIMECAST_WARN("SeasonalRegression: regressor '{}' is constant over the training window; dropping it.",
			              name);
			continue;
		}
		active_regressors_.push_back(name);
		columns.push_back(&values);
	}

	const Eigen::MatrixXd X = designMatrix(0, n_, columns);
	const Eigen::VectorXd y =
	    Eigen::Map<const Eigen::VectorXd>(ts.getValues().data(), static_cast<Eigen::Index>(n_));

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	qr.setThreshold(1e-10);
	if (qr.rank() < X.cols()) {
		throw core::TrainingError("SeasonalRegression design matrix is rank deficient (rank " +
		                          std::to_string(qr.rank()) + " of " + std::to_string(X.cols()) + " columns).");
	}
	coefficients_ = qr.solve(y);

	const Eigen::VectorXd fitted = X * coefficients_;
	residuals_.resize(n_);
	for (std::size_t i = 0; i < n_; ++i) {
		residuals_[i] = y(static_cast<Eigen::Index>(i)) - fitted(static_cast<Eigen::Index>(i));
	}
	sigma_ = utils::residualStdDev(residuals_, static_cast<std::size_t>(X.cols()));

	const Eigen::MatrixXd xtx = X.transpose() * X;
	Eigen::LDLT<Eigen::MatrixXd> ldlt(xtx);
	if (ldlt.info() != Eigen::Success) {
		throw core::TrainingError("SeasonalRegression could not invert the normal matrix.");
	}
	xtx_inverse_ = ldlt.solve(Eigen::MatrixXd::Identity(xtx.rows(), xtx.cols()));

	if (!coefficients_.allFinite() || !xtx_inverse_.allFinite() || !std::isfinite(sigma_)) {
		throw core::TrainingError("SeasonalRegression produced non-finite coefficients.");
	}

	markFitted(true);
	TIMECAST_DEBUG("SeasonalRegression fitted with {} data points, {} columns, sigma = {:.6f}.", n_, X.cols(),
	               sigma_);
}

core::Forecast SeasonalRegression::predict(int horizon, const std::optional<RegressorTable> &future_regressors) const {
	ensurePredictable(horizon, future_regressors);

	std::vector<const std::vector<double> *> columns;
	for (const auto &name : active_regressors_) {
		columns.push_back(&future_regressors->at(name));
	}
	const auto steps = static_cast<std::size_t>(horizon);
	const Eigen::MatrixXd X = designMatrix(n_, steps, columns);
	const Eigen::VectorXd point = X * coefficients_;

	std::vector<double> growth(steps);
	for (std::size_t h = 0; h < steps; ++h) {
		const Eigen::VectorXd x = X.row(static_cast<Eigen::Index>(h)).transpose();
		const double leverage = x.dot(xtx_inverse_ * x);
		growth[h] = std::sqrt(1.0 + std::max(0.0, leverage));
	}

	core::Forecast forecast;
	forecast.point.assign(point.data(), point.data() + point.size());
	applyResidualBounds(forecast, sigma_, [&growth](std::size_t h) { return growth[h - 1]; });
	return forecast;
}

// --- Builder Implementation ---

SeasonalRegressionBuilder &SeasonalRegressionBuilder::withSeasonalPeriods(std::vector<std::size_t> periods) {
	seasonal_periods_ = std::move(periods);
	return *this;
}

SeasonalRegressionBuilder &SeasonalRegressionBuilder::withFourierOrder(std::size_t order) {
	fourier_order_ = order;
	return *this;
}

SeasonalRegressionBuilder &SeasonalRegressionBuilder::withRegressors(std::vector<std::string> names) {
	regressors_ = std::move(names);
	return *this;
}

SeasonalRegressionBuilder &SeasonalRegressionBuilder::withConfidenceLevel(double level) {
	confidence_level_ = level;
	return *this;
}

std::unique_ptr<SeasonalRegression> SeasonalRegressionBuilder::build() {
	return std::unique_ptr<SeasonalRegression>(
	    new SeasonalRegression(seasonal_periods_, fourier_order_, regressors_, confidence_level_));
}

} // namespace timecast::models
