#include "timecast/selectors/model_selector.hpp"
#include "timecast/utils/logging.hpp"
#include "timecast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace timecast::selectors {

namespace {

constexpr double kTieTolerance = 1e-12;
constexpr double kMinMetric = 1e-12;

bool nearlyEqual(double lhs, double rhs) {
	return std::abs(lhs - rhs) <= kTieTolerance * std::max(std::abs(lhs), std::abs(rhs));
}

} // namespace

EnsemblePolicy parseEnsemblePolicy(const std::string &name) {
	if (name == "best_of" || name == "best") {
		return EnsemblePolicy::BestOf;
	}
	if (name == "weighted") {
		return EnsemblePolicy::Weighted;
	}
	throw std::invalid_argument("Unknown ensemble policy: '" + name + "'. Expected best_of or weighted.");
}

std::string ensemblePolicyName(EnsemblePolicy policy) {
	return policy == EnsemblePolicy::Weighted ? "weighted" : "best_of";
}

ModelSelector::ModelSelector(EnsemblePolicy policy, utils::CVMetric metric) : policy_(policy), metric_(metric) {
}

utils::CVMetric ModelSelector::rankingMetric(const std::vector<CandidateScore> &candidates) const {
	for (const auto &candidate : candidates) {
		if (candidate.viable() && std::isfinite(candidate.results->rmse) &&
		    !std::isfinite(candidate.results->getMetric(metric_))) {
			return utils::CVMetric::RMSE;
		}
	}
	return metric_;
}

bool ModelSelector::ranksBefore(const SelectionEntry &lhs, const SelectionEntry &rhs) const {
	if (!nearlyEqual(lhs.score, rhs.score)) {
		return lhs.score < rhs.score;
	}
	if (!nearlyEqual(lhs.rmse, rhs.rmse)) {
		return lhs.rmse < rhs.rmse;
	}
	if (lhs.priority != rhs.priority) {
		return lhs.priority < rhs.priority;
	}
	return lhs.model < rhs.model;
}

SelectionResult ModelSelector::select(const std::vector<CandidateScore> &candidates) const {
	SelectionResult result;
	result.policy = policy_;
	result.metric = rankingMetric(candidates);
	if (result.metric != metric_) {
		TIMECAST_WARN("{} is undefined for at least one candidate; ranking every candidate by rmse.",
		              utils::cvMetricName(metric_));
	}

	for (const auto &candidate : candidates) {
		if (!candidate.viable()) {
			result.excluded.push_back({candidate.model, candidate.failure_reason});
			continue;
		}
		SelectionEntry entry;
		entry.model = candidate.model;
		entry.priority = candidate.priority;
		entry.score = candidate.results->getMetric(result.metric);
		entry.rmse = candidate.results->rmse;
		if (!std::isfinite(entry.score) || !std::isfinite(entry.rmse)) {
			result.excluded.push_back({candidate.model, "validation produced a non-finite metric"});
			continue;
		}

		// Insertion keeps the ranking stable under the tolerance-based comparison.
		auto position = result.ranked.begin();
		while (position != result.ranked.end() && !ranksBefore(entry, *position)) {
			++position;
		}
		result.ranked.insert(position, std::move(entry));
	}

	if (result.ranked.empty()) {
		throw core::NoViableModelError("No candidate model produced a usable validation score.", result.excluded);
	}

	if (policy_ == EnsemblePolicy::BestOf) {
		result.ranked.front().weight = 1.0;
	} else {
		double total = 0.0;
		for (auto &entry : result.ranked) {
			entry.weight = 1.0 / std::max(entry.score, kMinMetric);
			total += entry.weight;
		}
		for (auto &entry : result.ranked) {
			entry.weight /= total;
		}
	}
	for (const auto &entry : result.ranked) {
		if (entry.weight > 0.0) {
			result.weights[entry.model] = entry.weight;
		}
	}

	TIMECAST_DEBUG("Selected {} ({} = {:.6f}) under the {} policy from {} viable candidates.", result.best().model,
	               utils::cvMetricName(result.metric), result.best().score, ensemblePolicyName(policy_),
	               result.ranked.size());
	return result;
}

core::Forecast ModelSelector::combine(const std::vector<std::pair<double, core::Forecast>> &weighted,
                                      double confidence_level) {
	if (weighted.empty()) {
		throw std::invalid_argument("Cannot combine an empty set of forecasts.");
	}
	const std::size_t horizon = weighted.front().second.horizon();

	core::Forecast combined;
	combined.confidence_level = confidence_level;
	combined.point.assign(horizon, 0.0);
	std::vector<double> variance(horizon, 0.0);
	double total_weight = 0.0;

	for (const auto &[weight, forecast] : weighted) {
		if (forecast.horizon() != horizon) {
			throw std::invalid_argument("Combined forecasts must share the same horizon.");
		}
		if (weight <= 0.0) {
			continue;
		}
		const double z = utils::zScore(forecast.confidence_level);
		for (std::size_t h = 0; h < horizon; ++h) {
			combined.point[h] += weight * forecast.point[h];
			const double sigma = forecast.hasBounds() ? (forecast.upper[h] - forecast.lower[h]) / (2.0 * z) : 0.0;
			variance[h] += weight * sigma * sigma;
		}
		total_weight += weight;
	}
	if (total_weight <= 0.0) {
		throw std::invalid_argument("Combined forecasts need a positive total weight.");
	}

	const double z = utils::zScore(confidence_level);
	combined.lower.resize(horizon);
	combined.upper.resize(horizon);
	for (std::size_t h = 0; h < horizon; ++h) {
		combined.point[h] /= total_weight;
		const double half_width = z * std::sqrt(variance[h] / total_weight);
		combined.lower[h] = combined.point[h] - half_width;
		combined.upper[h] = combined.point[h] + half_width;
	}
	return combined;
}

} // namespace timecast::selectors
