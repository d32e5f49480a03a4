#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "timecast/models/decomposition.hpp"

#include <cmath>
#include <vector>

using timecast::core::PredictionError;
using timecast::core::TrainingError;
using timecast::models::DecompositionBuilder;

TEST_CASE("Decomposition recovers a clean linear trend", "[models][decomposition]") {
	const auto ts = tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(2.0, 3.0, 24));

	auto model = DecompositionBuilder().withSeasonalPeriod(4).build();
	model->fit(ts);

	REQUIRE(model->trendSlope() == Catch::Approx(3.0));
	REQUIRE(model->trendIntercept() == Catch::Approx(2.0));
	for (double index : model->seasonalIndices()) {
		REQUIRE(index == Catch::Approx(0.0).margin(1e-9));
	}

	const auto forecast = model->predict(3);
	REQUIRE(forecast.horizon() == 3);
	REQUIRE(forecast.point[0] == Catch::Approx(74.0));
	REQUIRE(forecast.point[2] == Catch::Approx(80.0));
}

TEST_CASE("Decomposition projects seasonal indices cyclically", "[models][decomposition][seasonal]") {
	const std::vector<double> pattern{1.0, -1.0, 2.0, -2.0};
	std::vector<double> values;
	for (std::size_t i = 0; i < 20; ++i) {
		values.push_back(10.0 + pattern[i % 4]);
	}
	const auto ts = tests::helpers::makeUnivariateSeries(values);

	auto model = DecompositionBuilder().withSeasonalPeriod(4).build();
	model->fit(ts);

	REQUIRE(model->seasonalPeriod() == 4);
	const auto &indices = model->seasonalIndices();
	REQUIRE(indices.size() == 4);
	for (std::size_t k = 0; k < 4; ++k) {
		REQUIRE(indices[k] == Catch::Approx(pattern[k]).margin(1e-9));
	}
	REQUIRE(model->trendSlope() == Catch::Approx(0.0).margin(1e-9));

	const auto forecast = model->predict(6);
	for (std::size_t h = 0; h < 6; ++h) {
		REQUIRE(forecast.point[h] == Catch::Approx(10.0 + pattern[(20 + h) % 4]).margin(1e-9));
	}
	REQUIRE(model->residualStdDev() == Catch::Approx(0.0).margin(1e-9));
}

TEST_CASE("Decomposition intervals widen away from the training window", "[models][decomposition][intervals]") {
	auto values = tests::helpers::seasonalSeries(48, 12);
	for (std::size_t i = 0; i < values.size(); ++i) {
		values[i] += (i % 3 == 0) ? 0.8 : -0.4;
	}
	const auto ts = tests::helpers::makeUnivariateSeries(values);

	auto model = DecompositionBuilder().withSeasonalPeriod(12).withConfidenceLevel(0.9).build();
	model->fit(ts);

	const auto forecast = model->predict(12);
	REQUIRE(forecast.hasBounds());
	REQUIRE(forecast.confidence_level == Catch::Approx(0.9));
	double previous_width = 0.0;
	for (std::size_t h = 0; h < 12; ++h) {
		REQUIRE(forecast.lower[h] <= forecast.point[h]);
		REQUIRE(forecast.point[h] <= forecast.upper[h]);
		const double width = forecast.upper[h] - forecast.lower[h];
		REQUIRE(width > previous_width);
		previous_width = width;
	}
}

TEST_CASE("Decomposition requires two seasons of history", "[models][decomposition]") {
	auto model = DecompositionBuilder().withSeasonalPeriod(6).build();
	REQUIRE(model->minTrainingLength() == 12);
	REQUIRE_THROWS_AS(model->fit(tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(1.0, 1.0, 11))),
	                  TrainingError);
	REQUIRE_THROWS_AS(model->predict(3), PredictionError);

	auto trend_only = DecompositionBuilder().withSeasonalPeriod(1).build();
	REQUIRE(trend_only->seasonalPeriod() == 0);
	REQUIRE(trend_only->minTrainingLength() == 3);
}
