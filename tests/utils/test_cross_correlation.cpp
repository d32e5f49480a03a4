#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "timecast/utils/cross_correlation.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace timecast::utils;

namespace {

const std::vector<CorrelationMode> kModes{CorrelationMode::Pearson, CorrelationMode::Kendall,
                                          CorrelationMode::Spearman, CorrelationMode::MatlabNormalized};

// Equivalent of numpy.roll: result[t] = values[(t - shift) mod n].
std::vector<double> roll(const std::vector<double> &values, int shift) {
	const int n = static_cast<int>(values.size());
	std::vector<double> rolled(values.size());
	for (int t = 0; t < n; ++t) {
		rolled[static_cast<std::size_t>(t)] = values[static_cast<std::size_t>(((t - shift) % n + n) % n)];
	}
	return rolled;
}

int argmaxLag(const std::vector<LagCorrelation> &correlations) {
	const auto it = std::max_element(correlations.begin(), correlations.end(),
	                                 [](const LagCorrelation &l, const LagCorrelation &r) { return l.value < r.value; });
	return it->lag;
}

} // namespace

TEST_CASE("Cross-correlation finds a five step delay", "[utils][cross_correlation]") {
	std::vector<double> x;
	for (int n = 0; n < 16; ++n) {
		x.push_back(std::pow(0.84, n));
	}
	const auto y = roll(x, 5);

	for (auto mode : kModes) {
		const auto correlations = CrossCorrelation::compute(x, y, 10, mode);
		REQUIRE(correlations.size() == 21);
		REQUIRE(correlations.front().lag == -10);
		REQUIRE(correlations.back().lag == 10);
		INFO("mode " << correlationModeName(mode));
		REQUIRE(CrossCorrelation::peak(correlations).lag == -5);
	}
}

TEST_CASE("Cross-correlation tracks a shifted sine", "[utils][cross_correlation]") {
	constexpr double pi = 3.14159265358979323846;
	std::vector<double> y;
	for (int i = 0; i < 100; ++i) {
		y.push_back(std::sin(2.0 * pi * static_cast<double>(i) / 99.0));
	}

	for (int shift : {-40, -17, -3, 0, 8, 25, 45}) {
		const auto delayed = roll(y, shift);
		for (auto mode : kModes) {
			INFO("shift " << shift << " mode " << correlationModeName(mode));
			const auto correlations = CrossCorrelation::compute(y, delayed, 49, mode);
			REQUIRE(std::abs(argmaxLag(correlations) + shift) < 4);
		}
	}
}

TEST_CASE("Correlation modes on simple sequences", "[utils][cross_correlation]") {
	const std::vector<double> a{1.0, 2.0, 3.0, 4.0, 5.0};
	const std::vector<double> b{1.0, 4.0, 9.0, 16.0, 100.0};
	const std::vector<double> flat(5, 3.0);

	REQUIRE(CrossCorrelation::correlation(a, b, CorrelationMode::Spearman) == Catch::Approx(1.0));
	REQUIRE(CrossCorrelation::correlation(a, b, CorrelationMode::Kendall) == Catch::Approx(1.0));
	REQUIRE(CrossCorrelation::correlation(a, b, CorrelationMode::Pearson) < 1.0);
	REQUIRE(CrossCorrelation::correlation(a, flat, CorrelationMode::Pearson) == 0.0);
	REQUIRE_THROWS_AS(CrossCorrelation::correlation(a, {1.0}, CorrelationMode::Pearson), std::invalid_argument);
	REQUIRE_THROWS_AS(CrossCorrelation::compute({}, {}, 3, CorrelationMode::Pearson), std::invalid_argument);

	// Lags are clipped to the sequence length.
	REQUIRE(CrossCorrelation::compute(a, b, 50, CorrelationMode::Pearson).size() == 9);
}

TEST_CASE("Regressor screening keeps correlated regressors", "[utils][cross_correlation][screening]") {
	const auto values = tests::helpers::seasonalSeries(60, 12);
	std::vector<double> leading(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		leading[i] = i + 3 < values.size() ? values[i + 3] : values.back();
	}
	const auto ts = tests::helpers::makeSeriesWithRegressors(
	    values, {{"leading", leading}, {"flat", std::vector<double>(values.size(), 1.0)}});

	const auto kept = CrossCorrelation::screen(ts, 5, CorrelationMode::Pearson, 0.5);
	REQUIRE(kept == std::vector<std::string>{"leading"});

	REQUIRE(CrossCorrelation::screen(ts, 5, CorrelationMode::Pearson, 0.0).size() == 2);
}

TEST_CASE("Correlation mode names", "[utils][cross_correlation]") {
	REQUIRE(parseCorrelationMode("matlab_normalized") == CorrelationMode::MatlabNormalized);
	REQUIRE(correlationModeName(CorrelationMode::Kendall) == "kendall");
	REQUIRE_THROWS_AS(parseCorrelationMode("distance"), std::invalid_argument);
}
