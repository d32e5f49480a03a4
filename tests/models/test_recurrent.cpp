#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "timecast/models/recurrent.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <vector>

using timecast::core::PredictionError;
using timecast::core::TimeoutError;
using timecast::core::TrainingError;
using timecast::models::RecurrentBuilder;

TEST_CASE("Recurrent training is reproducible for a fixed seed", "[models][recurrent]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::seasonalSeries(60, 8));

	auto first = RecurrentBuilder().withLookback(6).withHiddenUnits(6).withEpochs(40).withSeed(11).build();
	auto second = RecurrentBuilder().withLookback(6).withHiddenUnits(6).withEpochs(40).withSeed(11).build();
	first->fit(ts);
	second->fit(ts);

	const auto a = first->predict(5);
	const auto b = second->predict(5);
	REQUIRE(a.point == b.point);
	REQUIRE(a.lower == b.lower);
	REQUIRE(first->lossHistory() == second->lossHistory());
}

TEST_CASE("Recurrent loss decreases over training", "[models][recurrent]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::seasonalSeries(72, 8));

	auto model = RecurrentBuilder().withLookback(8).withEpochs(60).build();
	model->fit(ts);

	const auto &loss = model->lossHistory();
	REQUIRE(loss.size() == 60);
	REQUIRE(loss.back() < loss.front());
	for (double value : loss) {
		REQUIRE(std::isfinite(value));
	}
}

TEST_CASE("Recurrent continues a linear trend", "[models][recurrent]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(10.0, 2.0, 40));

	auto model = RecurrentBuilder().withLookback(4).withEpochs(150).build();
	model->fit(ts);

	const auto forecast = model->predict(3);
	REQUIRE(forecast.point[0] == Catch::Approx(90.0).margin(0.5));
	REQUIRE(forecast.point[2] == Catch::Approx(94.0).margin(1.5));
}

TEST_CASE("Recurrent intervals grow with the square root of the horizon", "[models][recurrent][intervals]") {
	auto values = tests::helpers::seasonalSeries(64, 8);
	for (std::size_t i = 0; i < values.size(); ++i) {
		values[i] += std::cos(static_cast<double>(i) * 2.3);
	}
	auto model = RecurrentBuilder().withLookback(6).withEpochs(30).build();
	model->fit(tests::helpers::makeUnivariateSeries(values));

	const auto forecast = model->predict(4);
	REQUIRE(model->residualStdDev() > 0.0);
	const double first_width = forecast.upper[0] - forecast.lower[0];
	const double last_width = forecast.upper[3] - forecast.lower[3];
	REQUIRE(last_width == Catch::Approx(2.0 * first_width));
}

TEST_CASE("Recurrent validates its configuration and input", "[models][recurrent]") {
	REQUIRE_THROWS_AS(RecurrentBuilder().withLookback(0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(RecurrentBuilder().withEpochs(0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(RecurrentBuilder().withLearningRate(0.0).build(), std::invalid_argument);

	auto model = RecurrentBuilder().withLookback(8).build();
	REQUIRE(model->minTrainingLength() == 14);
	REQUIRE_THROWS_AS(model->fit(tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(1.0, 1.0, 13))),
	                  TrainingError);
	REQUIRE_THROWS_AS(model->predict(2), PredictionError);
}

TEST_CASE("Recurrent training stops at the deadline", "[models][recurrent][deadline]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::seasonalSeries(60, 8));

	auto model = RecurrentBuilder().withEpochs(100000).build();
	model->setDeadline(timecast::utils::Deadline::after(std::chrono::milliseconds{1}));
	std::this_thread::sleep_for(std::chrono::milliseconds{5});

	REQUIRE_THROWS_AS(model->fit(ts), TimeoutError);
	REQUIRE_FALSE(model->isFitted());
}
