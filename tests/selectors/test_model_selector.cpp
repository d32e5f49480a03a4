#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "timecast/selectors/model_selector.hpp"
#include "timecast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace timecast;
using selectors::CandidateScore;
using selectors::EnsemblePolicy;
using selectors::ModelSelector;

namespace {

CandidateScore viable(const std::string &model, int priority, double mape, double rmse) {
	CandidateScore score;
	score.model = model;
	score.priority = priority;
	utils::CVResults results;
	results.mae = rmse;
	results.mse = rmse * rmse;
	results.rmse = rmse;
	if (mape >= 0.0) {
		results.mape = mape;
	}
	score.results = results;
	return score;
}

CandidateScore failed(const std::string &model, const std::string &reason) {
	CandidateScore score;
	score.model = model;
	score.failure_reason = reason;
	return score;
}

core::Forecast constantForecast(double point, double half_width, std::size_t horizon, double level = 0.95) {
	core::Forecast forecast;
	forecast.confidence_level = level;
	forecast.point.assign(horizon, point);
	forecast.lower.assign(horizon, point - half_width);
	forecast.upper.assign(horizon, point + half_width);
	return forecast;
}

} // namespace

TEST_CASE("Best-of picks the lowest primary metric", "[selectors][model_selector]") {
	const ModelSelector selector;
	const auto result = selector.select({viable("Recurrent", 2, 4.0, 1.0), viable("Decomposition", 1, 2.5, 3.0),
	                                     viable("SeasonalRegression", 0, 3.0, 0.5)});

	REQUIRE(result.policy == EnsemblePolicy::BestOf);
	REQUIRE(result.best().model == "Decomposition");
	REQUIRE(result.ranked.size() == 3);
	REQUIRE(result.ranked[1].model == "SeasonalRegression");
	REQUIRE(result.ranked[2].model == "Recurrent");
	REQUIRE(result.weights.size() == 1);
	REQUIRE(result.weights.at("Decomposition") == Catch::Approx(1.0));
}

TEST_CASE("Ties are broken by RMSE, then priority, then name", "[selectors][model_selector]") {
	const ModelSelector selector;

	const auto by_rmse = selector.select({viable("A", 0, 2.0, 5.0), viable("B", 1, 2.0, 4.0)});
	REQUIRE(by_rmse.best().model == "B");

	const auto by_priority = selector.select({viable("A", 1, 2.0, 4.0), viable("B", 0, 2.0, 4.0)});
	REQUIRE(by_priority.best().model == "B");

	const auto by_name = selector.select({viable("Zeta", 0, 2.0, 4.0), viable("Alpha", 0, 2.0, 4.0)});
	REQUIRE(by_name.best().model == "Alpha");

	// Differences below the relative tolerance count as ties.
	const auto near = selector.select({viable("A", 1, 2.0, 4.0), viable("B", 0, 2.0 + 1e-14, 4.0)});
	REQUIRE(near.best().model == "B");
}

TEST_CASE("Selection is independent of candidate order", "[selectors][model_selector]") {
	const ModelSelector selector(EnsemblePolicy::BestOf, utils::CVMetric::RMSE);
	std::vector<CandidateScore> candidates{viable("A", 2, 1.0, 3.0), viable("B", 1, 1.0, 3.0),
	                                       viable("C", 0, 1.0, 4.0)};
	const auto expected = selector.select(candidates).best().model;
	REQUIRE(expected == "B");

	std::reverse(candidates.begin(), candidates.end());
	REQUIRE(selector.select(candidates).best().model == expected);
	std::rotate(candidates.begin(), candidates.begin() + 1, candidates.end());
	REQUIRE(selector.select(candidates).best().model == expected);
}

TEST_CASE("Undefined MAPE falls back to RMSE", "[selectors][model_selector]") {
	const ModelSelector selector;
	const auto no_mape = viable("Zeros", 0, -1.0, 0.75);

	const auto result = selector.select({no_mape, viable("Other", 1, 5.0, 0.1)});
	REQUIRE(result.metric == utils::CVMetric::RMSE);
	REQUIRE(result.best().model == "Other");
	REQUIRE(result.best().score == Catch::Approx(0.1));

	const auto defined = selector.select({viable("A", 0, 5.0, 0.1), viable("B", 1, 2.0, 0.9)});
	REQUIRE(defined.metric == utils::CVMetric::MAPE);
	REQUIRE(defined.best().model == "B");
}

TEST_CASE("Weighted policy never mixes metric units", "[selectors][model_selector][weighted]") {
	const ModelSelector selector(EnsemblePolicy::Weighted);
	// MAPE of 50 percent against an RMSE of 2 would hand the weaker model most of the weight.
	const auto result = selector.select({viable("Percent", 0, 50.0, 1.0), viable("NoMape", 1, -1.0, 2.0)});

	REQUIRE(result.metric == utils::CVMetric::RMSE);
	REQUIRE(result.best().model == "Percent");
	REQUIRE(result.weights.at("Percent") == Catch::Approx(2.0 / 3.0));
	REQUIRE(result.weights.at("NoMape") == Catch::Approx(1.0 / 3.0));
}

TEST_CASE("Weighted policy uses normalised inverse errors", "[selectors][model_selector][weighted]") {
	const ModelSelector selector(EnsemblePolicy::Weighted);
	const auto result = selector.select(
	    {viable("A", 0, 1.0, 1.0), viable("B", 1, 2.0, 1.0), viable("C", 2, 4.0, 1.0), failed("D", "timed out")});

	REQUIRE(result.weights.size() == 3);
	double total = 0.0;
	for (const auto &[model, weight] : result.weights) {
		REQUIRE(weight > 0.0);
		total += weight;
	}
	REQUIRE(total == Catch::Approx(1.0));
	REQUIRE(result.weights.at("A") == Catch::Approx(4.0 / 7.0));
	REQUIRE(result.weights.at("C") == Catch::Approx(1.0 / 7.0));
	REQUIRE(result.best().model == "A");
	REQUIRE(result.excluded.size() == 1);
	REQUIRE(result.excluded.front().model == "D");
}

TEST_CASE("A perfect score does not divide by zero", "[selectors][model_selector][weighted]") {
	const ModelSelector selector(EnsemblePolicy::Weighted, utils::CVMetric::MAE);
	const auto result = selector.select({viable("Exact", 0, 0.0, 0.0), viable("Rough", 1, 1.0, 1.0)});
	REQUIRE(result.weights.at("Exact") > 0.999);
	REQUIRE(result.weights.at("Exact") + result.weights.at("Rough") == Catch::Approx(1.0));
}

TEST_CASE("No viable candidate raises NoViableModelError", "[selectors][model_selector]") {
	const ModelSelector selector;
	auto broken = viable("NaN", 0, -1.0, std::numeric_limits<double>::quiet_NaN());

	try {
		selector.select({failed("A", "training failed"), broken});
		FAIL("Expected NoViableModelError");
	} catch (const core::NoViableModelError &error) {
		REQUIRE(error.failures().size() == 2);
		REQUIRE(error.failures()[0].model == "A");
		REQUIRE(error.failures()[0].reason == "training failed");
		REQUIRE(error.failures()[1].model == "NaN");
	}
	REQUIRE_THROWS_AS(selector.select({}), core::NoViableModelError);
}

TEST_CASE("Combining forecasts averages points and variances", "[selectors][model_selector][combine]") {
	const double z = utils::zScore(0.95);
	std::vector<std::pair<double, core::Forecast>> weighted;
	weighted.emplace_back(0.75, constantForecast(10.0, z * 1.0, 3));
	weighted.emplace_back(0.25, constantForecast(20.0, z * 3.0, 3));

	const auto combined = ModelSelector::combine(weighted, 0.95);
	REQUIRE(combined.horizon() == 3);
	REQUIRE(combined.point[0] == Catch::Approx(12.5));
	const double sigma = std::sqrt(0.75 * 1.0 + 0.25 * 9.0);
	REQUIRE(combined.upper[1] - combined.point[1] == Catch::Approx(z * sigma));
	REQUIRE(combined.point[2] - combined.lower[2] == Catch::Approx(z * sigma));

	// Bounds stated at another level are rescaled.
	std::vector<std::pair<double, core::Forecast>> mixed;
	mixed.emplace_back(1.0, constantForecast(5.0, utils::zScore(0.8) * 2.0, 2, 0.8));
	const auto rescaled = ModelSelector::combine(mixed, 0.95);
	REQUIRE(rescaled.upper[0] - rescaled.point[0] == Catch::Approx(z * 2.0));
}

TEST_CASE("Combining rejects empty or misaligned input", "[selectors][model_selector][combine]") {
	REQUIRE_THROWS_AS(ModelSelector::combine({}, 0.95), std::invalid_argument);

	std::vector<std::pair<double, core::Forecast>> misaligned;
	misaligned.emplace_back(0.5, constantForecast(1.0, 1.0, 3));
	misaligned.emplace_back(0.5, constantForecast(1.0, 1.0, 4));
	REQUIRE_THROWS_AS(ModelSelector::combine(misaligned, 0.95), std::invalid_argument);
}

TEST_CASE("Ensemble policy names", "[selectors][model_selector]") {
	REQUIRE(selectors::parseEnsemblePolicy("weighted") == EnsemblePolicy::Weighted);
	REQUIRE(selectors::parseEnsemblePolicy("best") == EnsemblePolicy::BestOf);
	REQUIRE(selectors::ensemblePolicyName(EnsemblePolicy::BestOf) == "best_of");
	REQUIRE_THROWS_AS(selectors::parseEnsemblePolicy("stacked"), std::invalid_argument);
}
