#pragma once

#include "timecast/pipeline/config.hpp"
#include "timecast/pipeline/prediction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace timecast::pipeline {

/**
 * @struct CandidateSpec
 * @brief A named way to build fresh, untrained models of one kind.
 */
struct CandidateSpec {
	std::string name;
	/// Tie-breaking rank; lower is preferred.
	int priority = 0;
	utils::ForecasterFactory factory;
};

/**
 * @class Orchestrator
 * @brief Runs the full prediction pipeline for one series.
 *
 * Stages: INIT, VALIDATING (rolling-origin validation of every candidate on
 * a worker pool), SELECTING, RETRAINING (chosen models refit on the whole
 * window), FORECASTING and DONE. Candidate failures are recorded and the
 * candidate is excluded; only MalformedInputError and NoViableModelError reach
 * the caller. The orchestrator keeps no state between invocations, so one
 * instance may serve concurrent calls.
 */
class Orchestrator {
public:
	using RegressorTable = core::TimeSeries::RegressorTable;

	/// @throws std::invalid_argument If the configuration is invalid.
	explicit Orchestrator(PipelineConfig config);

	/**
	 * @brief Forecasts with the configured candidate models.
	 * @param future_regressors Regressor values for the forecast steps; regressors without them are not used.
	 * @throws core::MalformedInputError If the window is rejected by the gap policy or transformation.
	 * @throws core::NoViableModelError If no candidate survives selection.
	 */
	PredictionArtifact run(const core::TimeSeries &ts,
	                       const std::optional<RegressorTable> &future_regressors = std::nullopt) const;

	/// Forecasts with an explicit candidate list instead of the configured one.
	PredictionArtifact run(const core::TimeSeries &ts, const std::vector<CandidateSpec> &candidates,
	                       const std::optional<RegressorTable> &future_regressors = std::nullopt) const;

	/// Candidates for the configured model kinds, regression models trained on @p regressors.
	std::vector<CandidateSpec> defaultCandidates(const std::vector<std::string> &regressors = {}) const;

	const PipelineConfig &config() const {
		return config_;
	}

private:
	struct PreparedInput;

	PreparedInput prepare(const core::TimeSeries &ts, const std::optional<RegressorTable> &future_regressors) const;
	PredictionArtifact execute(const PreparedInput &input, const std::vector<CandidateSpec> &candidates) const;

	PipelineConfig config_;
};

} // namespace timecast::pipeline
