#pragma once

#include <cstddef>
#include <vector>

namespace rowcast::utils {

/**
 * @struct LinearFit
 * @brief Straight line `y = slope * x + intercept`.
 */
struct LinearFit {
	double slope = 0.0;
	double intercept = 0.0;

	double at(double x) const {
		return slope * x + intercept;
	}
};

/**
 * @brief Ordinary least squares regression utilities
 */
namespace LinearRegression {

/**
 * @brief Fits a least squares line of @p y against its position index 0..n-1.
 *
 * The time axis of the observations is not used; irregular sampling still
 * regresses on consecutive integers.
 *
 * @throws std::invalid_argument if fewer than two observations are given.
 */
LinearFit fitTrend(const std::vector<double> &y);

/**
 * @brief Fits a least squares line of @p y against @p x.
 * @throws std::invalid_argument on size mismatch, fewer than two points or constant @p x.
 */
LinearFit fit(const std::vector<double> &x, const std::vector<double> &y);

} // namespace LinearRegression
} // namespace rowcast::utils
