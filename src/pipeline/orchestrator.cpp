#include "timecast/pipeline/orchestrator.hpp"
#include "timecast/models/model_factory.hpp"
#include "timecast/transform/transformers.hpp"
#include "timecast/utils/cross_correlation.hpp"
#include "timecast/utils/deadline.hpp"
#include "timecast/utils/logging.hpp"
#include "timecast/utils/worker_pool.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <memory>
#include <set>
#include <stdexcept>

namespace timecast::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point start) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

CandidateDiagnostics validateCandidate(const core::TimeSeries &window, const CandidateSpec &spec,
                                       const PipelineConfig &config, std::size_t fold_workers) {
	CandidateDiagnostics diagnostics;
	diagnostics.model = spec.name;
	const auto started = Clock::now();

	utils::CVConfig cv_config;
	cv_config.fold_count = config.fold_count;
	cv_config.test_length = config.fold_test_length;
	cv_config.parallel_folds = config.parallel_folds;
	cv_config.max_workers = fold_workers;
	cv_config.deadline = utils::Deadline::after(config.per_model_timeout);

	try {
		auto results = utils::CrossValidation::evaluate(window, spec.factory, cv_config);
		diagnostics.skipped_folds = results.skipped;
		diagnostics.validation = std::move(results);
		diagnostics.status = CandidateStatus::Viable;
	} catch (const core::TimeoutError &e) {
		diagnostics.status = CandidateStatus::TimedOut;
		diagnostics.failure_reason = e.what();
	} catch (const core::ValidationError &e) {
		diagnostics.status = CandidateStatus::ValidationFailed;
		diagnostics.skipped_folds = e.skipped();
		diagnostics.failure_reason = e.what();
	} catch (const core::PredictionError &e) {
		diagnostics.status = CandidateStatus::PredictionFailed;
		diagnostics.failure_reason = e.what();
	} catch (const std::exception &e) {
		// TrainingError and anything a model or its factory throws while being built.
		diagnostics.status = CandidateStatus::TrainingFailed;
		diagnostics.failure_reason = e.what();
	}

	diagnostics.elapsed = since(started);
	if (diagnostics.status == CandidateStatus::Viable && diagnostics.elapsed > config.per_model_timeout) {
		diagnostics.status = CandidateStatus::TimedOut;
		diagnostics.failure_reason = "validation took " + std::to_string(diagnostics.elapsed.count()) +
		                             " ms, more than the " + std::to_string(config.per_model_timeout.count()) +
		                             " ms budget";
	}

	if (diagnostics.status == CandidateStatus::Viable) {
		TIMECAST_DEBUG("Candidate {} validated on {} folds ({} skipped) in {} ms.", spec.name,
		               diagnostics.validation->folds.size(), diagnostics.skipped_folds.size(),
		               diagnostics.elapsed.count());
	} else {
		TIMECAST_WARN("Candidate {} excluded ({}): {}", spec.name, candidateStatusName(diagnostics.status),
		              diagnostics.failure_reason);
	}
	return diagnostics;
}

void ensureUsableForecast(const std::string &model, const core::Forecast &forecast, std::size_t horizon) {
	if (forecast.horizon() != horizon || !forecast.hasBounds()) {
		throw core::PredictionError(model + " returned a forecast of the wrong shape.");
	}
	for (std::size_t h = 0; h < horizon; ++h) {
		if (!std::isfinite(forecast.point[h]) || !std::isfinite(forecast.lower[h]) ||
		    !std::isfinite(forecast.upper[h])) {
			throw core::PredictionError(model + " returned non-finite forecast values.");
		}
	}
}

utils::AccuracyMetrics summarise(const utils::CVResults &results) {
	utils::AccuracyMetrics metrics;
	metrics.mae = results.mae;
	metrics.mse = results.mse;
	metrics.rmse = results.rmse;
	metrics.mape = results.mape;
	metrics.smape = results.smape;
	metrics.n = results.total_forecasts;
	return metrics;
}

} // namespace

struct Orchestrator::PreparedInput {
	core::TimeSeries window;
	std::optional<RegressorTable> future_regressors;
	std::unique_ptr<transform::Transformer> transformer;
	std::vector<std::string> regressors;
	std::vector<PipelineStage> stages;
	Clock::time_point started;
};

Orchestrator::Orchestrator(PipelineConfig config) : config_(std::move(config)) {
	config_.validate();
}

std::vector<CandidateSpec> Orchestrator::defaultCandidates(const std::vector<std::string> &regressors) const {
	std::vector<CandidateSpec> candidates;
	const auto options = config_.modelOptions(regressors);
	for (const auto kind : config_.candidate_models) {
		CandidateSpec spec;
		spec.name = models::ModelFactory::name(kind);
		spec.priority = models::ModelFactory::priority(kind);
		spec.factory = [kind, options]() { return models::ModelFactory::create(kind, options); };
		candidates.push_back(std::move(spec));
	}
	return candidates;
}

Orchestrator::PreparedInput Orchestrator::prepare(const core::TimeSeries &ts,
                                                  const std::optional<RegressorTable> &future_regressors) const {
	const auto started = Clock::now();
	TIMECAST_INFO("Pipeline stage -> {} ({} observations, horizon {}).", stageName(PipelineStage::Init), ts.size(),
	              config_.forecast_horizon);

	core::TimeSeries window = ts;
	if (window.hasGaps()) {
		if (config_.gap_policy == GapPolicy::Reject) {
			throw core::MalformedInputError("Input window has " + std::to_string(window.gapCount()) +
			                                " missing observations and the gap policy is 'reject'.");
		}
		TIMECAST_WARN("Interpolating {} missing observations.", window.gapCount());
		window = window.interpolated();
	}

	auto transformer = transform::makeTransformer(config_.transformation);
	std::vector<double> values = window.getValues();
	transformer->fitTransform(values);
	for (double v : values) {
		if (!std::isfinite(v)) {
			throw core::MalformedInputError(std::string("Transformation '") + transformer->name() +
			                                "' produced non-finite values.");
		}
	}
	window = window.withValues(std::move(values));

	std::vector<std::string> names = window.regressorNames();
	if (config_.regressor_screening.enabled && window.hasRegressors()) {
		const auto &screening = config_.regressor_screening;
		names = utils::CrossCorrelation::screen(window, screening.max_lags, screening.mode,
		                                        screening.min_abs_correlation);
	}

	std::vector<std::string> usable;
	RegressorTable kept;
	for (const auto &name : names) {
		const bool has_future = future_regressors && future_regressors->count(name) > 0 &&
		                        future_regressors->at(name).size() == config_.forecast_horizon;
		if (!has_future) {
			TIMECAST_WARN("Regressor '{}' has no values for the {} forecast steps; it is not used.", name,
			              config_.forecast_horizon);
			continue;
		}
		usable.push_back(name);
		kept.emplace(name, window.regressor(name));
	}
	window = window.withRegressors(std::move(kept));

	return PreparedInput{std::move(window), future_regressors, std::move(transformer), std::move(usable),
	                     {PipelineStage::Init}, started};
}

PredictionArtifact Orchestrator::run(const core::TimeSeries &ts,
                                     const std::optional<RegressorTable> &future_regressors) const {
	const auto input = prepare(ts, future_regressors);
	return execute(input, defaultCandidates(input.regressors));
}

PredictionArtifact Orchestrator::run(const core::TimeSeries &ts, const std::vector<CandidateSpec> &candidates,
                                     const std::optional<RegressorTable> &future_regressors) const {
	const auto input = prepare(ts, future_regressors);
	return execute(input, candidates);
}

PredictionArtifact Orchestrator::execute(const PreparedInput &input,
                                         const std::vector<CandidateSpec> &candidates) const {
	if (candidates.empty()) {
		throw std::invalid_argument("The pipeline needs at least one candidate model.");
	}
	std::set<std::string> seen;
	for (const auto &candidate : candidates) {
		if (!candidate.factory || !seen.insert(candidate.name).second) {
			throw std::invalid_argument("Candidate '" + candidate.name + "' is duplicated or has no factory.");
		}
	}

	PredictionArtifact artifact;
	artifact.policy = config_.ensemble_policy;
	artifact.metric = config_.primary_metric;
	artifact.horizon = config_.forecast_horizon;
	artifact.confidence_level = config_.confidence_level;
	artifact.transformation = input.transformer->name();
	artifact.regressors = input.regressors;
	artifact.stages = input.stages;

	auto enter = [&artifact](PipelineStage stage) {
		artifact.stages.push_back(stage);
		TIMECAST_INFO("Pipeline stage -> {}.", stageName(stage));
	};

	// --- Validation, one task per candidate ---
	enter(PipelineStage::Validating);
	{
		// Candidate tasks times fold workers never exceeds worker_pool_size.
		const std::size_t candidate_workers = std::min(config_.worker_pool_size, candidates.size());
		const std::size_t fold_workers = std::max<std::size_t>(1, config_.worker_pool_size / candidate_workers);
		utils::WorkerPool pool(candidate_workers);
		std::vector<std::future<CandidateDiagnostics>> pending;
		pending.reserve(candidates.size());
		for (const auto &candidate : candidates) {
			pending.push_back(pool.submit([this, &input, &candidate, fold_workers]() {
				return validateCandidate(input.window, candidate, config_, fold_workers);
			}));
		}
		for (auto &future : pending) {
			artifact.candidates.push_back(future.get());
		}
	}

	std::vector<selectors::CandidateScore> scores;
	for (std::size_t i = 0; i < candidates.size(); ++i) {
		const auto &diagnostics = artifact.candidates[i];
		selectors::CandidateScore score;
		score.model = candidates[i].name;
		score.priority = candidates[i].priority;
		if (diagnostics.status == CandidateStatus::Viable) {
			score.results = diagnostics.validation;
		} else {
			score.failure_reason = candidateStatusName(diagnostics.status) + ": " + diagnostics.failure_reason;
		}
		scores.push_back(std::move(score));
	}

	auto indexOf = [&candidates](const std::string &name) {
		const auto it = std::find_if(candidates.begin(), candidates.end(),
		                             [&name](const CandidateSpec &spec) { return spec.name == name; });
		return static_cast<std::size_t>(it - candidates.begin());
	};
	auto drop = [&](const std::string &name, CandidateStatus status, const std::string &reason) {
		const std::size_t index = indexOf(name);
		artifact.candidates[index].status = status;
		artifact.candidates[index].failure_reason = reason;
		scores[index].results.reset();
		scores[index].failure_reason = candidateStatusName(status) + ": " + reason;
		TIMECAST_WARN("Candidate {} dropped ({}): {}", name, candidateStatusName(status), reason);
	};

	// --- Selection, retraining and forecasting; a chosen model that fails is dropped and selection reruns ---
	const selectors::ModelSelector selector(config_.ensemble_policy, config_.primary_metric);
	const int horizon = static_cast<int>(config_.forecast_horizon);
	std::map<std::string, std::unique_ptr<models::IForecaster>> fitted;
	std::map<std::string, core::Forecast> forecasts;
	selectors::SelectionResult selection;

	for (;;) {
		enter(PipelineStage::Selecting);
		try {
			selection = selector.select(scores);
		} catch (const core::NoViableModelError &) {
			enter(PipelineStage::Failed);
			TIMECAST_ERROR("No viable model after validating {} candidates.", candidates.size());
			throw;
		}

		enter(PipelineStage::Retraining);
		bool dropped = false;
		for (const auto &entry : selection.ranked) {
			if (entry.weight <= 0.0 || fitted.count(entry.model) > 0) {
				continue;
			}
			const auto &spec = candidates[indexOf(entry.model)];
			const auto started = Clock::now();
			try {
				auto model = spec.factory();
				model->setDeadline(utils::Deadline::after(config_.per_model_timeout));
				model->fit(input.window);
				fitted.emplace(entry.model, std::move(model));
			} catch (const core::TimeoutError &e) {
				drop(entry.model, CandidateStatus::TimedOut, e.what());
				dropped = true;
			} catch (const std::exception &e) {
				drop(entry.model, CandidateStatus::RetrainingFailed, e.what());
				dropped = true;
			}
			artifact.candidates[indexOf(entry.model)].elapsed += since(started);
		}
		if (dropped) {
			continue;
		}

		enter(PipelineStage::Forecasting);
		for (const auto &entry : selection.ranked) {
			if (entry.weight <= 0.0 || forecasts.count(entry.model) > 0) {
				continue;
			}
			try {
				auto forecast = fitted.at(entry.model)->predict(horizon, input.future_regressors);
				ensureUsableForecast(entry.model, forecast, config_.forecast_horizon);
				forecasts.emplace(entry.model, std::move(forecast));
			} catch (const core::Error &e) {
				drop(entry.model, CandidateStatus::PredictionFailed, e.what());
				dropped = true;
			}
		}
		if (!dropped) {
			break;
		}
	}

	// --- Assemble the artifact ---
	core::Forecast final_forecast;
	if (config_.ensemble_policy == selectors::EnsemblePolicy::BestOf) {
		final_forecast = forecasts.at(selection.best().model);
	} else {
		std::vector<std::pair<double, core::Forecast>> weighted;
		for (const auto &entry : selection.ranked) {
			if (entry.weight > 0.0) {
				weighted.emplace_back(entry.weight, forecasts.at(entry.model));
			}
		}
		final_forecast = selectors::ModelSelector::combine(weighted, config_.confidence_level);
	}
	input.transformer->inverseTransformForecast(final_forecast);

	const auto timestamps = input.window.futureTimestamps(config_.forecast_horizon);
	artifact.forecast.reserve(timestamps.size());
	for (std::size_t h = 0; h < timestamps.size(); ++h) {
		artifact.forecast.push_back(
		    {timestamps[h], final_forecast.point[h], final_forecast.lower[h], final_forecast.upper[h]});
	}
	artifact.confidence_level = final_forecast.confidence_level;
	artifact.chosen_model = selection.best().model;
	artifact.weights = selection.weights;
	artifact.metric = selection.metric;

	for (const auto &entry : selection.ranked) {
		auto &diagnostics = artifact.candidates[indexOf(entry.model)];
		diagnostics.score = entry.score;
		diagnostics.weight = entry.weight;
		if (entry.weight > 0.0) {
			diagnostics.status = CandidateStatus::Selected;
			artifact.selection_metrics[entry.model] = summarise(*diagnostics.validation);
		}
	}

	enter(PipelineStage::Done);
	artifact.elapsed = since(input.started);
	TIMECAST_INFO("Forecast of {} steps produced by {} in {} ms.", artifact.horizon,
	              artifact.weights.size() == 1 ? artifact.chosen_model
	                                           : std::to_string(artifact.weights.size()) + " weighted models",
	              artifact.elapsed.count());
	return artifact;
}

} // namespace timecast::pipeline
