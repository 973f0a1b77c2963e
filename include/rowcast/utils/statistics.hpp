#pragma once

#include <vector>

namespace rowcast::utils {

/**
 * @brief Descriptive statistics shared by the detectors and forecasters.
 */
namespace Statistics {

/// Arithmetic mean; 0 for an empty input.
double mean(const std::vector<double> &data);

/// Population standard deviation (divides by n); 0 for an empty input.
double populationStdDev(const std::vector<double> &data);

/**
 * @brief Quantile of already sorted data by linear interpolation between order statistics.
 *
 * The rank is `p * (n + 1)` counted from 1 and clamped to `[1, n]`, the
 * definition used by Minitab and Excel's QUARTILE.EXC.
 *
 * @param sorted Data in ascending order.
 * @param p Probability in [0, 1].
 * @throws std::invalid_argument on empty data or p outside [0, 1].
 */
double sortedQuantile(const std::vector<double> &sorted, double p);

/**
 * @brief Inverse CDF of the standard normal distribution.
 *
 * Acklam's rational approximation, relative error below 1.15e-9.
 */
double normalQuantile(double p);

} // namespace Statistics
} // namespace rowcast::utils
