#pragma once

#include "timecast/core/time_series.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace tests::helpers {

inline std::vector<timecast::core::TimeSeries::TimePoint> makeTimestamps(std::size_t count,
                                                                         std::chrono::seconds step = std::chrono::seconds{1}) {
	std::vector<timecast::core::TimeSeries::TimePoint> timestamps;
	timestamps.reserve(count);
	const auto start = timecast::core::TimeSeries::TimePoint{};
	for (std::size_t i = 0; i < count; ++i) {
		timestamps.push_back(start + step * static_cast<long long>(i));
	}
	return timestamps;
}

inline timecast::core::TimeSeries makeUnivariateSeries(const std::vector<double> &values,
                                                       std::chrono::seconds step = std::chrono::seconds{1}) {
	return timecast::core::TimeSeries(makeTimestamps(values.size(), step), values, step);
}

inline timecast::core::TimeSeries makeSeriesWithRegressors(const std::vector<double> &values,
                                                           timecast::core::TimeSeries::RegressorTable regressors) {
	return timecast::core::TimeSeries(makeTimestamps(values.size()), values, std::chrono::seconds{1},
	                                  std::move(regressors));
}

inline std::vector<double> linearSeries(double start, double step, std::size_t count) {
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		values.push_back(start + static_cast<double>(i) * step);
	}
	return values;
}

/// Linear trend plus a sine wave of period @p period.
inline std::vector<double> seasonalSeries(std::size_t count, std::size_t period, double level = 50.0,
                                          double slope = 0.5, double amplitude = 5.0) {
	constexpr double pi = 3.14159265358979323846;
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		const double t = static_cast<double>(i);
		values.push_back(level + slope * t +
		                 amplitude * std::sin(2.0 * pi * t / static_cast<double>(period)));
	}
	return values;
}

} // namespace tests::helpers
