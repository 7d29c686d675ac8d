#pragma once

#include <cstddef>
#include <vector>

namespace atsa::utils::stats {

double mean(const std::vector<double> &values);

/// Variance with @p ddof delta degrees of freedom (0 = population, 1 = sample).
double variance(const std::vector<double> &values, int ddof = 0);

double stddev(const std::vector<double> &values, int ddof = 0);

double median(std::vector<double> values);

/**
 * @brief Quantile with linear interpolation between order statistics.
 * @param q Probability in [0, 1].
 */
double quantile(std::vector<double> values, double q);

/// Copy of @p values without NaN entries.
std::vector<double> dropNaN(const std::vector<double> &values);

double normalCdf(double x);

/// Inverse standard normal CDF (Acklam's rational approximation).
double normalQuantile(double p);

/// Two-sided critical value for a central interval, e.g. 1.96 for 0.95.
double zForConfidence(double confidence);

} // namespace atsa::utils::stats
