#pragma once

#include "timecast/core/forecast.hpp"
#include "timecast/utils/cross_validation.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace timecast::selectors {

enum class EnsemblePolicy {
	BestOf,  // the single best validated model
	Weighted // every viable model, weighted by inverse validation error
};

/// @throws std::invalid_argument If @p name is neither best_of nor weighted.
EnsemblePolicy parseEnsemblePolicy(const std::string &name);

std::string ensemblePolicyName(EnsemblePolicy policy);

/**
 * @brief Validation outcome of one candidate, as handed to the selector.
 *
 * A candidate without results failed and carries the reason instead.
 */
struct CandidateScore {
	std::string model;
	int priority = 0;
	std::optional<utils::CVResults> results;
	std::string failure_reason;

	bool viable() const {
		return results.has_value();
	}
};

struct SelectionEntry {
	std::string model;
	double score = 0.0;
	double rmse = 0.0;
	int priority = 0;
	double weight = 0.0;
};

struct SelectionResult {
	EnsemblePolicy policy = EnsemblePolicy::BestOf;
	/// Metric the ranking used: the primary metric, or RMSE when it is undefined for any candidate.
	utils::CVMetric metric = utils::CVMetric::MAPE;
	/// Viable candidates, best first.
	std::vector<SelectionEntry> ranked;
	/// Non-zero weights by model name; they sum to 1.
	std::map<std::string, double> weights;
	/// Candidates that could not take part.
	std::vector<core::CandidateFailure> excluded;

	const SelectionEntry &best() const {
		return ranked.front();
	}
};

/**
 * @class ModelSelector
 * @brief Ranks validated candidates and decides how their forecasts are combined.
 *
 * Candidates are ranked by the primary metric. When that metric is undefined
 * for any viable candidate, every candidate is ranked by RMSE instead so that
 * scores and weights stay in one unit. Scores within a relative tolerance of 1e-12
 * tie and are ordered by RMSE, then by priority, then by name.
 */
class ModelSelector {
public:
	explicit ModelSelector(EnsemblePolicy policy = EnsemblePolicy::BestOf,
	                       utils::CVMetric metric = utils::CVMetric::MAPE);

	/**
	 * @brief Ranks the candidates and assigns weights according to the policy.
	 * @throws core::NoViableModelError If no candidate has a finite score.
	 */
	SelectionResult select(const std::vector<CandidateScore> &candidates) const;

	EnsemblePolicy policy() const {
		return policy_;
	}

	utils::CVMetric metric() const {
		return metric_;
	}

	/**
	 * @brief Weighted combination of forecasts.
	 *
	 * Points are averaged with the given weights. Each forecast's bounds are read
	 * back as a standard deviation at its own confidence level; the variances are
	 * averaged with the same weights and re-expanded at @p confidence_level.
	 * @throws std::invalid_argument If the list is empty or horizons differ.
	 */
	static core::Forecast combine(const std::vector<std::pair<double, core::Forecast>> &weighted,
	                              double confidence_level);

private:
	utils::CVMetric rankingMetric(const std::vector<CandidateScore> &candidates) const;
	bool ranksBefore(const SelectionEntry &lhs, const SelectionEntry &rhs) const;

	EnsemblePolicy policy_;
	utils::CVMetric metric_;
};

} // namespace timecast::selectors
