#pragma once

#include "timecast/core/errors.hpp"
#include "timecast/core/time_series.hpp"
#include "timecast/selectors/model_selector.hpp"
#include "timecast/utils/cross_validation.hpp"
#include "timecast/utils/metrics.hpp"

#include <chrono>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace timecast::pipeline {

enum class PipelineStage { Init, Validating, Selecting, Retraining, Forecasting, Done, Failed };

std::string stageName(PipelineStage stage);

enum class CandidateStatus {
	Selected,         // contributes to the final forecast
	Viable,           // validated but not chosen
	TrainingFailed,
	PredictionFailed,
	ValidationFailed, // every fold skipped
	TimedOut,
	RetrainingFailed  // validated, then failed on the full window
};

std::string candidateStatusName(CandidateStatus status);

/**
 * @struct CandidateDiagnostics
 * @brief Everything the pipeline learned about one candidate model.
 */
struct CandidateDiagnostics {
	std::string model;
	CandidateStatus status = CandidateStatus::Viable;
	std::optional<utils::CVResults> validation;
	std::vector<core::FoldSkippedWarning> skipped_folds;
	std::string failure_reason;
	double score = std::numeric_limits<double>::quiet_NaN();
	double weight = 0.0;
	std::chrono::milliseconds elapsed{0};
};

struct ForecastPoint {
	core::TimeSeries::TimePoint timestamp;
	double point = 0.0;
	double lower = 0.0;
	double upper = 0.0;
};

/**
 * @struct PredictionArtifact
 * @brief Result of one orchestrator invocation, owned by the caller.
 *
 * Plain structs and standard containers only, so it can be serialised or
 * displayed without knowing anything about the models that produced it.
 */
struct PredictionArtifact {
	/// Best ranked model; under the weighted policy the largest contributor.
	std::string chosen_model;
	/// Model name to ensemble weight; a single entry of 1.0 under best-of.
	std::map<std::string, double> weights;
	selectors::EnsemblePolicy policy = selectors::EnsemblePolicy::BestOf;
	/// Metric the candidates were ranked by; RMSE when the configured one was undefined for some candidate.
	utils::CVMetric metric = utils::CVMetric::MAPE;
	std::size_t horizon = 0;
	double confidence_level = 0.95;
	std::vector<ForecastPoint> forecast;

	/// Mean validation metrics of every model that contributes to the forecast.
	std::map<std::string, utils::AccuracyMetrics> selection_metrics;
	std::vector<CandidateDiagnostics> candidates;

	std::string transformation = "none";
	/// Regressors the models were allowed to use after screening.
	std::vector<std::string> regressors;

	std::vector<PipelineStage> stages;
	std::chrono::milliseconds elapsed{0};

	/// @throws std::out_of_range If no candidate has that name.
	const CandidateDiagnostics &diagnostics(const std::string &model) const {
		for (const auto &candidate : candidates) {
			if (candidate.model == model) {
				return candidate;
			}
		}
		throw std::out_of_range("No diagnostics for model '" + model + "'.");
	}

	std::vector<double> points() const {
		std::vector<double> values;
		values.reserve(forecast.size());
		for (const auto &row : forecast) {
			values.push_back(row.point);
		}
		return values;
	}
};

} // namespace timecast::pipeline
