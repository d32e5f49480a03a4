#pragma once

#include <cstddef>
#include <vector>

namespace timecast::utils {

/**
 * @brief Inverse of the standard normal CDF (Acklam's rational approximation).
 * @param p Probability in (0, 1).
 */
double normalQuantile(double p);

/// Two-sided critical value for a central interval with coverage @p confidence_level.
double zScore(double confidence_level);

double mean(const std::vector<double> &values);

/**
 * @brief Residual standard deviation sqrt(SSR / (n - dof)).
 *
 * Non-finite residuals are ignored. Returns 0 when fewer than dof + 1 usable residuals exist.
 */
double residualStdDev(const std::vector<double> &residuals, std::size_t dof = 1);

} // namespace timecast::utils
