#pragma once

#include <vector>

namespace timecast::core {
struct Forecast;
}

namespace timecast::transform {

/**
 * @class Transformer
 * @brief A reversible, element-wise value transformation applied before modelling.
 */
class Transformer {
public:
	virtual ~Transformer() = default;

	virtual void fit(const std::vector<double> &data) = 0;
	virtual void transform(std::vector<double> &data) const = 0;
	virtual void inverseTransform(std::vector<double> &data) const = 0;

	virtual const char *name() const = 0;

	virtual void fitTransform(std::vector<double> &data) {
		fit(data);
		transform(data);
	}

	/**
	 * @brief Maps point forecasts and bounds back to the original scale.
	 *
	 * A transformation may not preserve order near zero, so each lower/upper
	 * pair is re-sorted afterwards.
	 */
	void inverseTransformForecast(core::Forecast &forecast) const;
};

} // namespace timecast::transform
