#include "timecast/transform/transformers.hpp"
#include "timecast/core/forecast.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace timecast::transform {

namespace {

double sign(double value) {
	return value > 0.0 ? 1.0 : (value < 0.0 ? -1.0 : 0.0);
}

} // namespace

void Transformer::inverseTransformForecast(core::Forecast &forecast) const {
	inverseTransform(forecast.point);
	inverseTransform(forecast.lower);
	inverseTransform(forecast.upper);
	const std::size_t n = std::min(forecast.lower.size(), forecast.upper.size());
	for (std::size_t i = 0; i < n; ++i) {
		if (forecast.lower[i] > forecast.upper[i]) {
			std::swap(forecast.lower[i], forecast.upper[i]);
		}
	}
}

// ============================================================================
// Identity
// ============================================================================

void Identity::fit(const std::vector<double> &) {
}

void Identity::transform(std::vector<double> &) const {
}

void Identity::inverseTransform(std::vector<double> &) const {
}

// ============================================================================
// Log
// ============================================================================

void Log::fit(const std::vector<double> &) {
	// No fitting needed
}

void Log::transform(std::vector<double> &data) const {
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = value == 0.0 ? 0.0 : sign(value) * std::log(std::abs(value));
	}
}

void Log::inverseTransform(std::vector<double> &data) const {
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = sign(value) * std::exp(std::abs(value));
	}
}

// ============================================================================
// LogModified
// ============================================================================

void LogModified::fit(const std::vector<double> &) {
	// No fitting needed
}

void LogModified::transform(std::vector<double> &data) const {
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = sign(value) * std::log1p(std::abs(value));
	}
}

void LogModified::inverseTransform(std::vector<double> &data) const {
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = sign(value) * std::expm1(std::abs(value));
	}
}

std::unique_ptr<Transformer> makeTransformer(TransformKind kind) {
	switch (kind) {
	case TransformKind::None:
		return std::make_unique<Identity>();
	case TransformKind::Log:
		return std::make_unique<Log>();
	case TransformKind::LogModified:
		return std::make_unique<LogModified>();
	}
	throw std::invalid_argument("Unknown transformation kind.");
}

TransformKind parseTransformKind(const std::string &name) {
	if (name == "none" || name.empty()) {
		return TransformKind::None;
	}
	if (name == "log") {
		return TransformKind::Log;
	}
	if (name == "log_modified") {
		return TransformKind::LogModified;
	}
	throw std::invalid_argument("Unknown transformation: '" + name + "'. Expected none, log or log_modified.");
}

std::string transformKindName(TransformKind kind) {
	switch (kind) {
	case TransformKind::None:
		return "none";
	case TransformKind::Log:
		return "log";
	case TransformKind::LogModified:
		return "log_modified";
	}
	return "none";
}

} // namespace timecast::transform
