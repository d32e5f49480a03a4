#include "timecast/utils/cross_correlation.hpp"
#include "timecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <stdexcept>

namespace timecast::utils {

namespace {

constexpr double kPeakTolerance = 1e-12;

double pearson(const std::vector<double> &a, const std::vector<double> &b) {
	const std::size_t n = a.size();
	if (n < 2) {
		return 0.0;
	}
	const double mean_a = std::accumulate(a.begin(), a.end(), 0.0) / static_cast<double>(n);
	const double mean_b = std::accumulate(b.begin(), b.end(), 0.0) / static_cast<double>(n);
	double cov = 0.0;
	double var_a = 0.0;
	double var_b = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		const double da = a[i] - mean_a;
		const double db = b[i] - mean_b;
		cov += da * db;
		var_a += da * da;
		var_b += db * db;
	}
	const double denom = std::sqrt(var_a * var_b);
	if (denom <= 1e-300) {
		return 0.0;
	}
	return cov / denom;
}

// Average ranks, ties share the mean of their positions.
std::vector<double> ranks(const std::vector<double> &values) {
	std::vector<std::size_t> order(values.size());
	std::iota(order.begin(), order.end(), 0);
	std::sort(order.begin(), order.end(), [&values](std::size_t l, std::size_t r) { return values[l] < values[r]; });

	std::vector<double> result(values.size());
	std::size_t i = 0;
	while (i < order.size()) {
		std::size_t j = i;
		while (j + 1 < order.size() && values[order[j + 1]] == values[order[i]]) {
			++j;
		}
		const double rank = (static_cast<double>(i) + static_cast<double>(j)) / 2.0 + 1.0;
		for (std::size_t k = i; k <= j; ++k) {
			result[order[k]] = rank;
		}
		i = j + 1;
	}
	return result;
}

// Kendall's tau-b.
double kendall(const std::vector<double> &a, const std::vector<double> &b) {
	const std::size_t n = a.size();
	if (n < 2) {
		return 0.0;
	}
	double concordant = 0.0;
	double discordant = 0.0;
	double ties_a = 0.0;
	double ties_b = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		for (std::size_t j = i + 1; j < n; ++j) {
			const double da = a[i] - a[j];
			const double db = b[i] - b[j];
			if (da == 0.0 && db == 0.0) {
				continue;
			}
			if (da == 0.0) {
				ties_a += 1.0;
			} else if (db == 0.0) {
				ties_b += 1.0;
			} else if ((da > 0.0) == (db > 0.0)) {
				concordant += 1.0;
			} else {
				discordant += 1.0;
			}
		}
	}
	const double denom = std::sqrt((concordant + discordant + ties_a) * (concordant + discordant + ties_b));
	if (denom <= 0.0) {
		return 0.0;
	}
	return (concordant - discordant) / denom;
}

} // namespace

CorrelationMode parseCorrelationMode(const std::string &name) {
	if (name == "pearson") {
		return CorrelationMode::Pearson;
	}
	if (name == "spearman") {
		return CorrelationMode::Spearman;
	}
	if (name == "kendall") {
		return CorrelationMode::Kendall;
	}
	if (name == "matlab_normalized") {
		return CorrelationMode::MatlabNormalized;
	}
	throw std::invalid_argument("Unknown correlation mode: '" + name +
	                            "'. Expected pearson, spearman, kendall or matlab_normalized.");
}

std::string correlationModeName(CorrelationMode mode) {
	switch (mode) {
	case CorrelationMode::Pearson:
		return "pearson";
	case CorrelationMode::Spearman:
		return "spearman";
	case CorrelationMode::Kendall:
		return "kendall";
	case CorrelationMode::MatlabNormalized:
		return "matlab_normalized";
	}
	return "pearson";
}

double CrossCorrelation::correlation(const std::vector<double> &a, const std::vector<double> &b,
                                     CorrelationMode mode) {
	if (a.size() != b.size()) {
		throw std::invalid_argument("Correlated sequences must have the same length.");
	}
	double value = 0.0;
	switch (mode) {
	case CorrelationMode::Pearson:
		value = pearson(a, b);
		break;
	case CorrelationMode::Spearman:
		value = pearson(ranks(a), ranks(b));
		break;
	case CorrelationMode::Kendall:
		value = kendall(a, b);
		break;
	case CorrelationMode::MatlabNormalized: {
		const double energy = std::sqrt(std::inner_product(a.begin(), a.end(), a.begin(), 0.0) *
		                                std::inner_product(b.begin(), b.end(), b.begin(), 0.0));
		value = energy > 0.0 ? std::inner_product(a.begin(), a.end(), b.begin(), 0.0) / energy : 0.0;
		break;
	}
	}
	return std::isfinite(value) ? value : 0.0;
}

std::vector<LagCorrelation> CrossCorrelation::compute(const std::vector<double> &target,
                                                      const std::vector<double> &other, int max_lags,
                                                      CorrelationMode mode) {
	if (target.empty() || target.size() != other.size()) {
		throw std::invalid_argument("Cross-correlation needs two non-empty sequences of equal length.");
	}
	const int n = static_cast<int>(target.size());
	const int limit = std::max(0, std::min(max_lags, n - 1));

	double energy = 0.0;
	if (mode == CorrelationMode::MatlabNormalized) {
		energy = std::sqrt(std::inner_product(target.begin(), target.end(), target.begin(), 0.0) *
		                   std::inner_product(other.begin(), other.end(), other.begin(), 0.0));
	}

	std::vector<LagCorrelation> result;
	result.reserve(static_cast<std::size_t>(2 * limit + 1));
	for (int lag = -limit; lag <= limit; ++lag) {
		// Pairs target[t + lag] with other[t] for every t where both exist.
		const int first = std::max(0, -lag);
		const int last = std::min(n, n - lag);
		std::vector<double> lhs;
		std::vector<double> rhs;
		lhs.reserve(static_cast<std::size_t>(std::max(0, last - first)));
		rhs.reserve(lhs.capacity());
		for (int t = first; t < last; ++t) {
			lhs.push_back(target[static_cast<std::size_t>(t + lag)]);
			rhs.push_back(other[static_cast<std::size_t>(t)]);
		}

		LagCorrelation entry;
		entry.lag = lag;
		if (mode == CorrelationMode::MatlabNormalized) {
			entry.value = energy > 0.0 ? std::inner_product(lhs.begin(), lhs.end(), rhs.begin(), 0.0) / energy : 0.0;
		} else {
			entry.value = correlation(lhs, rhs, mode);
		}
		result.push_back(entry);
	}
	return result;
}

LagCorrelation CrossCorrelation::peak(const std::vector<LagCorrelation> &correlations) {
	LagCorrelation best;
	bool found = false;
	for (const auto &entry : correlations) {
		if (!found) {
			best = entry;
			found = true;
			continue;
		}
		const double magnitude = std::abs(entry.value);
		const double best_magnitude = std::abs(best.value);
		// Magnitudes within rounding noise of each other count as a tie.
		const bool tie = std::abs(magnitude - best_magnitude) <= kPeakTolerance;
		if ((!tie && magnitude > best_magnitude) || (tie && std::abs(entry.lag) < std::abs(best.lag))) {
			best = entry;
		}
	}
	return best;
}

std::vector<std::string> CrossCorrelation::screen(const core::TimeSeries &ts, int max_lags, CorrelationMode mode,
                                                  double min_abs_correlation) {
	std::vector<std::string> kept;
	for (const auto &entry : ts.regressors()) {
		const auto best = peak(compute(ts.getValues(), entry.second, max_lags, mode));
		if (std::abs(best.value) >= min_abs_correlation) {
			TIMECAST_DEBUG("Regressor '{}' kept: peak {} correlation {:.4f} at lag {}.", entry.first,
			               correlationModeName(mode), best.value, best.lag);
			kept.push_back(entry.first);
		} else {
			TIMECAST_INFO("Regressor '{}' dropped: peak |{}| correlation {:.4f} below {:.4f}.", entry.first,
			              correlationModeName(mode), std::abs(best.value), min_abs_correlation);
		}
	}
	return kept;
}

} // namespace timecast::utils
