#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/forecaster_stubs.hpp"
#include "common/time_series_helpers.hpp"
#include "timecast/utils/cross_validation.hpp"

#include <chrono>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace timecast;
using tests::helpers::LastValueForecaster;

namespace {

utils::ForecasterFactory lastValueFactory(std::size_t min_length = 2) {
	return [min_length]() { return std::make_unique<LastValueForecaster>(min_length); };
}

} // namespace

TEST_CASE("Fold plan places folds at the end of the window", "[utils][cross_validation]") {
	const auto folds = utils::CrossValidation::generateFolds(20, 3, 4);
	REQUIRE(folds.size() == 3);
	REQUIRE(folds[0].test_start == 8);
	REQUIRE(folds[0].test_end == 12);
	REQUIRE(folds[1].test_start == 12);
	REQUIRE(folds[2].test_start == 16);
	REQUIRE(folds[2].test_end == 20);

	const auto early = utils::CrossValidation::generateFolds(5, 3, 3);
	REQUIRE(early[0].test_start == -4);
	REQUIRE(early[2].test_start == 2);

	REQUIRE_THROWS_AS(utils::CrossValidation::generateFolds(10, 0, 1), std::invalid_argument);
	REQUIRE_THROWS_AS(utils::CrossValidation::generateFolds(10, 2, 0), std::invalid_argument);
}

TEST_CASE("Cross-validation evaluates every fold on a long window", "[utils][cross_validation]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(1.0, 1.0, 30));

	utils::CVConfig config;
	config.fold_count = 3;
	config.test_length = 5;

	const auto results = utils::CrossValidation::evaluate(ts, lastValueFactory(), config);
	REQUIRE(results.folds.size() == 3);
	REQUIRE(results.skipped.empty());
	REQUIRE(results.total_forecasts == 15);

	for (std::size_t i = 0; i < results.folds.size(); ++i) {
		const auto &fold = results.folds[i];
		REQUIRE(fold.fold_id == i);
		REQUIRE(fold.train_end == fold.test_start);
		REQUIRE(fold.test_end - fold.test_start == 5);
		REQUIRE(fold.forecasts.size() == 5);
		REQUIRE(fold.lower.size() == 5);
		// Last value forecast misses a unit slope by 1..5.
		REQUIRE(fold.mae == Catch::Approx(3.0));
	}
	REQUIRE(results.mae == Catch::Approx(3.0));
	REQUIRE(results.getMetric(utils::CVMetric::MAE) == Catch::Approx(3.0));
	REQUIRE(results.mape.has_value());
	REQUIRE(results.folds[0].test_start == 15);
}

TEST_CASE("Cross-validation skips folds with too little history", "[utils][cross_validation]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(1.0, 1.0, 12));

	utils::CVConfig config;
	config.fold_count = 3;
	config.test_length = 4;

	const auto results = utils::CrossValidation::evaluate(ts, lastValueFactory(5), config);
	REQUIRE(results.folds.size() == 1);
	REQUIRE(results.skipped.size() == 2);
	REQUIRE(results.skipped[0].fold_id == 0);
	REQUIRE(results.skipped[0].train_length == 0);
	REQUIRE(results.skipped[1].fold_id == 1);
	REQUIRE(results.skipped[1].train_length == 4);
	REQUIRE(results.skipped[1].required_length == 5);
	REQUIRE(results.folds[0].fold_id == 2);
}

TEST_CASE("Cross-validation fails when every fold is skipped", "[utils][cross_validation]") {
	const auto ts = tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0, 4.0, 5.0});

	utils::CVConfig config;
	config.fold_count = 3;
	config.test_length = 5;

	try {
		utils::CrossValidation::evaluate(ts, lastValueFactory(), config);
		FAIL("Expected ValidationError");
	} catch (const core::ValidationError &error) {
		REQUIRE(error.skipped().size() == 3);
		REQUIRE(error.skipped().front().reason == "fold starts before the first observation");
	}
}

TEST_CASE("Parallel folds match sequential folds", "[utils][cross_validation][parallel]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::seasonalSeries(60, 12));

	utils::CVConfig sequential;
	sequential.fold_count = 4;
	sequential.test_length = 6;
	auto parallel = sequential;
	parallel.parallel_folds = true;

	const auto a = utils::CrossValidation::evaluate(ts, lastValueFactory(), sequential);
	const auto b = utils::CrossValidation::evaluate(ts, lastValueFactory(), parallel);

	REQUIRE(a.folds.size() == b.folds.size());
	for (std::size_t i = 0; i < a.folds.size(); ++i) {
		REQUIRE(b.folds[i].fold_id == i);
		REQUIRE(a.folds[i].forecasts == b.folds[i].forecasts);
	}
	REQUIRE(a.rmse == Catch::Approx(b.rmse));
}

TEST_CASE("Parallel folds respect the worker limit", "[utils][cross_validation][parallel]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(1.0, 1.0, 40));
	tests::helpers::FitConcurrency tracker;
	const utils::ForecasterFactory slow = [&tracker]() {
		return std::make_unique<tests::helpers::SlowForecaster>(tracker, std::chrono::milliseconds{30});
	};

	utils::CVConfig config;
	config.fold_count = 6;
	config.test_length = 2;
	config.parallel_folds = true;
	config.max_workers = 2;

	const auto results = utils::CrossValidation::evaluate(ts, slow, config);
	REQUIRE(results.folds.size() == 6);
	REQUIRE(tracker.peak.load() >= 1);
	REQUIRE(tracker.peak.load() <= 2);

	tracker.peak = 0;
	config.max_workers = 1;
	utils::CrossValidation::evaluate(ts, slow, config);
	REQUIRE(tracker.peak.load() == 1);
}

TEST_CASE("Folds record prediction interval coverage", "[utils][cross_validation][intervals]") {
	const auto linear = tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(3.0, 2.0, 30));
	utils::CVConfig config;
	config.fold_count = 3;
	config.test_length = 4;

	const utils::ForecasterFactory drift = []() { return std::make_unique<tests::helpers::DriftForecaster>(); };
	const auto exact = utils::CrossValidation::evaluate(linear, drift, config);
	for (const auto &fold : exact.folds) {
		REQUIRE(fold.coverage.has_value());
		REQUIRE(*fold.coverage == Catch::Approx(1.0));
	}
	REQUIRE(exact.coverage.has_value());
	REQUIRE(*exact.coverage == Catch::Approx(1.0));

	const auto seasonal = tests::helpers::makeUnivariateSeries(tests::helpers::seasonalSeries(60, 12));
	const auto results = utils::CrossValidation::evaluate(seasonal, lastValueFactory(), config);
	double sum = 0.0;
	for (const auto &fold : results.folds) {
		REQUIRE(fold.coverage.has_value());
		REQUIRE(*fold.coverage == Catch::Approx(utils::Metrics::coverage(fold.actuals, fold.lower, fold.upper)));
		sum += *fold.coverage;
	}
	REQUIRE(*results.coverage == Catch::Approx(sum / static_cast<double>(results.folds.size())));
}

TEST_CASE("Training failures propagate out of cross-validation", "[utils][cross_validation]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(1.0, 1.0, 20));
	const utils::ForecasterFactory failing = []() { return std::make_unique<tests::helpers::FailingForecaster>(); };
	REQUIRE_THROWS_AS(utils::CrossValidation::evaluate(ts, failing), core::TrainingError);
}

TEST_CASE("Cross-validation honours an expired deadline", "[utils][cross_validation][deadline]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(1.0, 1.0, 20));

	utils::CVConfig config;
	config.deadline = utils::Deadline::after(std::chrono::milliseconds{1});
	std::this_thread::sleep_for(std::chrono::milliseconds{5});

	REQUIRE_THROWS_AS(utils::CrossValidation::evaluate(ts, lastValueFactory(), config), core::TimeoutError);
}

TEST_CASE("Aggregated percentage metrics ignore undefined folds", "[utils][cross_validation]") {
	utils::CVResults results;
	utils::CVFold defined;
	defined.mae = 2.0;
	defined.mse = 4.0;
	defined.rmse = 2.0;
	defined.mape = 10.0;
	defined.forecasts = {1.0, 2.0};
	utils::CVFold undefined;
	undefined.mae = 4.0;
	undefined.mse = 16.0;
	undefined.rmse = 4.0;
	undefined.forecasts = {0.0};
	results.folds = {defined, undefined};

	results.computeAggregatedMetrics();
	REQUIRE(results.mae == Catch::Approx(3.0));
	REQUIRE(results.mse == Catch::Approx(10.0));
	REQUIRE(results.mape.has_value());
	REQUIRE(*results.mape == Catch::Approx(10.0));
	REQUIRE_FALSE(results.smape.has_value());
	REQUIRE(std::isnan(results.getMetric(utils::CVMetric::SMAPE)));
	REQUIRE(results.total_forecasts == 3);
}

TEST_CASE("Metric names round trip", "[utils][cross_validation]") {
	REQUIRE(utils::parseCVMetric("smape") == utils::CVMetric::SMAPE);
	REQUIRE(utils::cvMetricName(utils::CVMetric::RMSE) == "rmse");
	REQUIRE_THROWS_AS(utils::parseCVMetric("r2"), std::invalid_argument);
}
