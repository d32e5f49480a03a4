#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace timecast::utils {

struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	std::optional<double> mape;
	std::optional<double> smape;
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Percentage error in [0, inf); observations with a zero actual are left out. nullopt when none remain.
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> smape(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Computes every metric above in one pass over the inputs.
	static AccuracyMetrics all(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Share of actuals inside [lower, upper], in [0, 1].
	/// @throws std::invalid_argument If lengths differ, inputs are empty or an interval is inverted.
	static double coverage(const std::vector<double> &actual, const std::vector<double> &lower,
	                       const std::vector<double> &upper);
};

} // namespace timecast::utils
