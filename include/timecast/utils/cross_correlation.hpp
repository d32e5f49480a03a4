#pragma once

#include "timecast/core/time_series.hpp"

#include <string>
#include <vector>

namespace timecast::utils {

enum class CorrelationMode {
	Pearson,
	Spearman,
	Kendall,
	MatlabNormalized // raw lagged products over the full-length energies, as MATLAB xcorr(..., 'normalized')
};

/// @throws std::invalid_argument If @p name is not pearson, spearman, kendall or matlab_normalized.
CorrelationMode parseCorrelationMode(const std::string &name);

std::string correlationModeName(CorrelationMode mode);

struct LagCorrelation {
	int lag = 0;
	double value = 0.0;
};

/**
 * @class CrossCorrelation
 * @brief Lagged correlation between a target series and a candidate regressor.
 *
 * At lag k, target[t + k] is paired with other[t]. A regressor that leads the
 * target by five steps therefore peaks at lag 5, one that trails it at lag -5.
 * Correlations that are undefined (constant input, fewer than two pairs) are 0.
 */
class CrossCorrelation {
public:
	/// Correlation of two equally long sequences.
	static double correlation(const std::vector<double> &a, const std::vector<double> &b, CorrelationMode mode);

	/**
	 * @brief Correlations for every lag in [-max_lags, max_lags], in ascending lag order.
	 * @throws std::invalid_argument If the inputs differ in length or are empty.
	 */
	static std::vector<LagCorrelation> compute(const std::vector<double> &target, const std::vector<double> &other,
	                                           int max_lags, CorrelationMode mode);

	/// Lag with the largest absolute correlation; ties go to the lag closest to zero.
	static LagCorrelation peak(const std::vector<LagCorrelation> &correlations);

	/**
	 * @brief Names of the regressors whose peak absolute correlation with the
	 * window's values reaches @p min_abs_correlation.
	 */
	static std::vector<std::string> screen(const core::TimeSeries &ts, int max_lags, CorrelationMode mode,
	                                       double min_abs_correlation);
};

} // namespace timecast::utils
