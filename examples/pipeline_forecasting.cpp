#include "timecast/core/errors.hpp"
#include "timecast/core/time_series.hpp"
#include "timecast/pipeline/orchestrator.hpp"
#include "timecast/utils/logging.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

using namespace timecast;

namespace {

constexpr double kPi = 3.14159265358979323846;

std::vector<double> generateSeasonalDemand(std::size_t length, const std::vector<double> &promotions) {
	std::mt19937 rng(42);
	std::normal_distribution<double> noise(0.0, 2.5);

	std::vector<double> data;
	data.reserve(length);

	for (std::size_t i = 0; i < length; ++i) {
		const double seasonal = 10.0 * std::sin(2.0 * kPi * static_cast<double>(i % 12) / 12.0);
		const double trend = 0.3 * static_cast<double>(i);
		data.push_back(120.0 + trend + seasonal + 15.0 * promotions[i] + noise(rng));
	}

	return data;
}

std::vector<double> promotionCalendar(std::size_t length) {
	std::vector<double> promotions(length, 0.0);
	for (std::size_t i = 0; i < length; i += 9) {
		promotions[i] = 1.0;
	}
	return promotions;
}

std::vector<core::TimeSeries::TimePoint> dailyTimestamps(std::size_t count) {
	std::vector<core::TimeSeries::TimePoint> timestamps;
	timestamps.reserve(count);
	const auto start = core::TimeSeries::TimePoint{} + std::chrono::hours(24 * 19000);
	for (std::size_t i = 0; i < count; ++i) {
		timestamps.push_back(start + std::chrono::hours(24) * static_cast<long long>(i));
	}
	return timestamps;
}

void printArtifact(const pipeline::PredictionArtifact &artifact) {
	std::cout << "Chosen model: " << artifact.chosen_model << " ("
	          << selectors::ensemblePolicyName(artifact.policy) << ")\n";
	for (const auto &[model, weight] : artifact.weights) {
		std::cout << "  weight " << std::setw(20) << model << ": " << std::fixed << std::setprecision(3) << weight
		          << '\n';
	}

	std::cout << "\nCandidates\n";
	for (const auto &candidate : artifact.candidates) {
		std::cout << "  " << std::setw(20) << candidate.model << "  " << std::setw(18)
		          << pipeline::candidateStatusName(candidate.status);
		if (std::isfinite(candidate.score)) {
			std::cout << "  " << utils::cvMetricName(artifact.metric) << " = " << std::setprecision(4)
			          << candidate.score;
		}
		if (candidate.validation && candidate.validation->coverage) {
			std::cout << "  coverage = " << std::setprecision(2) << *candidate.validation->coverage;
		}
		if (!candidate.failure_reason.empty()) {
			std::cout << "  (" << candidate.failure_reason << ")";
		}
		std::cout << "  " << candidate.elapsed.count() << " ms\n";
	}

	std::cout << "\nForecast at " << artifact.confidence_level * 100.0 << "% confidence\n";
	for (std::size_t h = 0; h < artifact.forecast.size(); ++h) {
		const auto &row = artifact.forecast[h];
		std::cout << "  t+" << std::setw(2) << h + 1 << "  " << std::setprecision(2) << std::setw(9) << row.point
		          << "  [" << std::setw(9) << row.lower << ", " << std::setw(9) << row.upper << "]\n";
	}

	std::cout << "\nStages:";
	for (const auto stage : artifact.stages) {
		std::cout << ' ' << pipeline::stageName(stage);
	}
	std::cout << "\nElapsed: " << artifact.elapsed.count() << " ms\n";
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	constexpr std::size_t history_points = 120;
	constexpr std::size_t horizon = 12;

	const auto promotions = promotionCalendar(history_points + horizon);
	const auto demand = generateSeasonalDemand(history_points, promotions);

	core::TimeSeries::RegressorTable history_regressors{
	    {"promotion", std::vector<double>(promotions.begin(), promotions.begin() + history_points)}};
	core::TimeSeries::RegressorTable future_regressors{
	    {"promotion", std::vector<double>(promotions.begin() + history_points, promotions.end())}};

	const auto series = core::TimeSeries(dailyTimestamps(history_points), demand, std::chrono::hours(24),
	                                     history_regressors, {{"series", "demand"}});

	const std::map<std::string, std::string> options{{"fold_count", "3"},
	                                                 {"fold_test_length", "12"},
	                                                 {"forecast_horizon", std::to_string(horizon)},
	                                                 {"seasonal_periods", "12"},
	                                                 {"ensemble_policy", "weighted"},
	                                                 {"worker_pool_size", "3"},
	                                                 {"per_model_timeout", "30s"},
	                                                 {"recurrent_epochs", "80"},
	                                                 {"random_seed", "7"}};

	try {
		const pipeline::Orchestrator orchestrator(pipeline::PipelineConfig::fromOptions(options));
		const auto artifact = orchestrator.run(series, future_regressors);
		printArtifact(artifact);
	} catch (const core::NoViableModelError &e) {
		std::cerr << "No forecast could be produced: " << e.what() << '\n';
		return 1;
	} catch (const core::MalformedInputError &e) {
		std::cerr << "Input rejected: " << e.what() << '\n';
		return 1;
	}

	return 0;
}
