#include "timecast/utils/metrics.hpp"

namespace timecast::utils {

namespace {

void requireAligned(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.empty()) {
		throw std::invalid_argument("Accuracy metrics need at least one observation.");
	}
	if (actual.size() != predicted.size()) {
		throw std::invalid_argument("Accuracy metrics need as many forecasts (" + std::to_string(predicted.size()) +
		                            ") as actuals (" + std::to_string(actual.size()) + ").");
	}
}

// Mean of |a - p| / scale(a, p) in percent over the points whose scale is not ~0.
template <typename Scale>
std::optional<double> meanRelativeError(const std::vector<double> &actual, const std::vector<double> &predicted,
                                        Scale scale) {
	double total = 0.0;
	std::size_t used = 0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double s = scale(actual[i], predicted[i]);
		if (s <= std::numeric_limits<double>::epsilon()) {
			continue;
		}
		total += std::abs(actual[i] - predicted[i]) / s;
		++used;
	}
	if (used == 0) {
		return std::nullopt;
	}
	return 100.0 * total / static_cast<double>(used);
}

double absoluteActual(double a, double) {
	return std::abs(a);
}

double meanMagnitude(double a, double p) {
	return 0.5 * (std::abs(a) + std::abs(p));
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return all(actual, predicted).mae;
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return all(actual, predicted).mse;
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return all(actual, predicted).rmse;
}

std::optional<double> Metrics::mape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	requireAligned(actual, predicted);
	return meanRelativeError(actual, predicted, absoluteActual);
}

std::optional<double> Metrics::smape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	requireAligned(actual, predicted);
	return meanRelativeError(actual, predicted, meanMagnitude);
}

AccuracyMetrics Metrics::all(const std::vector<double> &actual, const std::vector<double> &predicted) {
	requireAligned(actual, predicted);

	double absolute = 0.0;
	double squared = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double error = actual[i] - predicted[i];
		absolute += std::abs(error);
		squared += error * error;
	}

	AccuracyMetrics metrics;
	metrics.n = actual.size();
	const auto n = static_cast<double>(metrics.n);
	metrics.mae = absolute / n;
	metrics.mse = squared / n;
	metrics.rmse = std::sqrt(metrics.mse);
	metrics.mape = meanRelativeError(actual, predicted, absoluteActual);
	metrics.smape = meanRelativeError(actual, predicted, meanMagnitude);
	return metrics;
}

double Metrics::coverage(const std::vector<double> &actual, const std::vector<double> &lower,
                         const std::vector<double> &upper) {
	requireAligned(actual, lower);
	requireAligned(actual, upper);

	std::size_t inside = 0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		if (!(lower[i] <= upper[i])) {
			throw std::invalid_argument("Interval " + std::to_string(i) + " has a lower bound above its upper bound.");
		}
		inside += (actual[i] >= lower[i] && actual[i] <= upper[i]) ? 1 : 0;
	}
	return static_cast<double>(inside) / static_cast<double>(actual.size());
}

} // namespace timecast::utils
