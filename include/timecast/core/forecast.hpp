#pragma once

#include <cstddef>
#include <vector>

namespace timecast::core {

/**
 * @struct Forecast
 * @brief Holds the results of a forecasting operation.
 *
 * Point predictions always come with lower and upper bounds at the stated
 * confidence level; the three series have the same length.
 */
struct Forecast {
	using Value = double;
	using Series = std::vector<Value>;

	/// Point forecasts, one per step.
	Series point;

	/// Lower bounds of the prediction interval.
	Series lower;

	/// Upper bounds of the prediction interval.
	Series upper;

	/// Coverage probability the bounds were produced for.
	double confidence_level = 0.95;

	Series &primary() {
		return point;
	}

	const Series &primary() const {
		return point;
	}

	bool empty() const {
		return point.empty();
	}

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return point.size();
	}

	/// True when both bounds are present for every step.
	bool hasBounds() const {
		return !point.empty() && lower.size() == point.size() && upper.size() == point.size();
	}
};

} // namespace timecast::core
