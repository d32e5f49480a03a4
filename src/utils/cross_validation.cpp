#include "timecast/utils/cross_validation.hpp"
#include "timecast/utils/logging.hpp"
#include "timecast/utils/worker_pool.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <limits>
#include <stdexcept>
#include <thread>

namespace timecast::utils {

namespace {

CVFold runFold(const core::TimeSeries &ts, const ForecasterFactory &model_factory, const CVConfig &config,
               const CVFoldPlan &plan) {
	CVFold fold;
	fold.fold_id = plan.fold_id;
	fold.train_start = 0;
	fold.train_end = static_cast<std::size_t>(plan.test_start);
	fold.test_start = static_cast<std::size_t>(plan.test_start);
	fold.test_end = static_cast<std::size_t>(plan.test_end);

	const auto train = ts.sliceIndex(fold.train_start, fold.train_end);
	const auto test = ts.sliceIndex(fold.test_start, fold.test_end);

	auto model = model_factory();
	model->setDeadline(config.deadline);
	model->fit(train);

	std::optional<core::TimeSeries::RegressorTable> future_regressors;
	if (test.hasRegressors()) {
		future_regressors = test.regressors();
	}
	const auto horizon = static_cast<int>(test.size());
	const auto forecast = model->predict(horizon, future_regressors);
	if (forecast.horizon() != test.size()) {
		throw core::PredictionError(model->getName() + " returned " + std::to_string(forecast.horizon()) +
		                            " values for a horizon of " + std::to_string(test.size()) + ".");
	}

	fold.forecasts = forecast.point;
	fold.lower = forecast.lower;
	fold.upper = forecast.upper;
	fold.actuals = test.getValues();

	const auto metrics = Metrics::all(fold.actuals, fold.forecasts);
	fold.mae = metrics.mae;
	fold.mse = metrics.mse;
	fold.rmse = metrics.rmse;
	fold.mape = metrics.mape;
	fold.smape = metrics.smape;

	const auto finite = [](const std::vector<double> &v) {
		return std::all_of(v.begin(), v.end(), [](double x) { return std::isfinite(x); });
	};
	if (fold.lower.size() == fold.actuals.size() && finite(fold.lower) && finite(fold.upper)) {
		fold.coverage = Metrics::coverage(fold.actuals, fold.lower, fold.upper);
	}
	return fold;
}

} // namespace

CVMetric parseCVMetric(const std::string &name) {
	if (name == "mae") {
		return CVMetric::MAE;
	}
	if (name == "mse") {
		return CVMetric::MSE;
	}
	if (name == "rmse") {
		return CVMetric::RMSE;
	}
	if (name == "mape") {
		return CVMetric::MAPE;
	}
	if (name == "smape") {
		return CVMetric::SMAPE;
	}
	throw std::invalid_argument("Unknown accuracy metric: '" + name + "'. Expected mae, mse, rmse, mape or smape.");
}

std::string cvMetricName(CVMetric metric) {
	switch (metric) {
	case CVMetric::MAE:
		return "mae";
	case CVMetric::MSE:
		return "mse";
	case CVMetric::RMSE:
		return "rmse";
	case CVMetric::MAPE:
		return "mape";
	case CVMetric::SMAPE:
		return "smape";
	}
	return "mape";
}

std::vector<CVFoldPlan> CrossValidation::generateFolds(std::size_t n_samples, std::size_t fold_count,
                                                       std::size_t test_length) {
	if (fold_count == 0 || test_length == 0) {
		throw std::invalid_argument("Cross-validation needs at least one fold and a test length of at least one.");
	}

	std::vector<CVFoldPlan> folds;
	folds.reserve(fold_count);
	const auto n = static_cast<long long>(n_samples);
	const auto k = static_cast<long long>(fold_count);
	const auto t = static_cast<long long>(test_length);
	for (long long i = 0; i < k; ++i) {
		CVFoldPlan plan;
		plan.fold_id = static_cast<std::size_t>(i);
		plan.test_start = n - (k - i) * t;
		plan.test_end = plan.test_start + t;
		folds.push_back(plan);
	}
	return folds;
}

CVResults CrossValidation::evaluate(const core::TimeSeries &ts, const ForecasterFactory &model_factory,
                                    const CVConfig &config) {
	const auto plans = generateFolds(ts.size(), config.fold_count, config.test_length);
	const std::size_t required = model_factory()->minTrainingLength();

	CVResults results;
	std::vector<CVFoldPlan> runnable;
	for (const auto &plan : plans) {
		if (plan.test_start < static_cast<long long>(required)) {
			core::FoldSkippedWarning warning;
			warning.fold_id = plan.fold_id;
			warning.train_length = plan.test_start > 0 ? static_cast<std::size_t>(plan.test_start) : 0;
			warning.required_length = required;
			warning.reason = plan.test_start < 0 ? "fold starts before the first observation"
			                                     : "training prefix shorter than the model minimum";
			TIMECAST_DEBUG("Skipping fold {}: {} ({} < {}).", warning.fold_id, warning.reason, warning.train_length,
			               required);
			results.skipped.push_back(std::move(warning));
		} else {
			runnable.push_back(plan);
		}
	}

	if (runnable.empty()) {
		throw core::ValidationError("Every cross-validation fold was skipped: a window of " +
		                            std::to_string(ts.size()) + " observations cannot hold " +
		                            std::to_string(config.fold_count) + " folds of " +
		                            std::to_string(config.test_length) + " after " + std::to_string(required) +
		                            " training observations.",
		                            results.skipped);
	}

	results.folds.reserve(runnable.size());
	const std::size_t workers =
	    config.max_workers > 0 ? config.max_workers : std::max(1u, std::thread::hardware_concurrency());
	if (config.parallel_folds && runnable.size() > 1 && workers > 1) {
		config.deadline.check("Cross-validation");
		WorkerPool pool(std::min(runnable.size(), workers));
		std::vector<std::future<CVFold>> pending;
		pending.reserve(runnable.size());
		for (const auto &plan : runnable) {
			pending.push_back(pool.submit([&ts, &model_factory, &config, plan]() {
				config.deadline.check("Cross-validation fold " + std::to_string(plan.fold_id));
				return runFold(ts, model_factory, config, plan);
			}));
		}
		// get() rethrows the first failing fold; the pool joins the rest on scope exit.
		for (auto &future : pending) {
			results.folds.push_back(future.get());
		}
	} else {
		for (const auto &plan : runnable) {
			config.deadline.check("Cross-validation fold " + std::to_string(plan.fold_id));
			results.folds.push_back(runFold(ts, model_factory, config, plan));
		}
	}

	results.computeAggregatedMetrics();
	return results;
}

void CVResults::computeAggregatedMetrics() {
	total_forecasts = 0;
	if (folds.empty()) {
		mae = std::numeric_limits<double>::quiet_NaN();
		mse = std::numeric_limits<double>::quiet_NaN();
		rmse = std::numeric_limits<double>::quiet_NaN();
		mape.reset();
		smape.reset();
		coverage.reset();
		return;
	}

	double mae_sum = 0.0;
	double mse_sum = 0.0;
	double rmse_sum = 0.0;
	double mape_sum = 0.0;
	double smape_sum = 0.0;
	std::size_t mape_count = 0;
	std::size_t smape_count = 0;
	double coverage_sum = 0.0;
	std::size_t coverage_count = 0;
	for (const auto &fold : folds) {
		mae_sum += fold.mae;
		mse_sum += fold.mse;
		rmse_sum += fold.rmse;
		if (fold.mape) {
			mape_sum += *fold.mape;
			++mape_count;
		}
		if (fold.smape) {
			smape_sum += *fold.smape;
			++smape_count;
		}
		if (fold.coverage) {
			coverage_sum += *fold.coverage;
			++coverage_count;
		}
		total_forecasts += fold.forecasts.size();
	}

	const double count = static_cast<double>(folds.size());
	mae = mae_sum / count;
	mse = mse_sum / count;
	rmse = rmse_sum / count;
	mape = mape_count > 0 ? std::optional<double>(mape_sum / static_cast<double>(mape_count)) : std::nullopt;
	smape = smape_count > 0 ? std::optional<double>(smape_sum / static_cast<double>(smape_count)) : std::nullopt;
	coverage = coverage_count > 0 ? std::optional<double>(coverage_sum / static_cast<double>(coverage_count))
	                              : std::nullopt;
}

double CVResults::getMetric(CVMetric metric) const {
	switch (metric) {
	case CVMetric::MAE:
		return mae;
	case CVMetric::MSE:
		return mse;
	case CVMetric::RMSE:
		return rmse;
	case CVMetric::MAPE:
		return mape.value_or(std::numeric_limits<double>::quiet_NaN());
	case CVMetric::SMAPE:
		return smape.value_or(std::numeric_limits<double>::quiet_NaN());
	}
	return std::numeric_limits<double>::quiet_NaN();
}

} // namespace timecast::utils
