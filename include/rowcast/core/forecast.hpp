#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace rowcast::core {

/**
 * @struct Forecast
 * @brief Holds the results of a forecasting operation.
 *
 * This struct contains the point predictions and may optionally include
 * upper and lower prediction intervals for uncertainty estimation.
 */
struct Forecast {
	using Value = double;
	using Series = std::vector<Value>;

	/// Point forecasts, one per step ahead.
	Series point;

	/// Optional lower bounds of the prediction interval.
	std::optional<Series> lower;

	/// Optional upper bounds of the prediction interval.
	std::optional<Series> upper;

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

	bool hasIntervals() const {
		return lower.has_value() && upper.has_value();
	}

	/// Access (and create when needed) the lower interval.
	Series &lowerSeries() {
		if (!lower.has_value()) {
			lower.emplace();
		}
		return *lower;
	}

	/// Access (and create when needed) the upper interval.
	Series &upperSeries() {
		if (!upper.has_value()) {
			upper.emplace();
		}
		return *upper;
	}

	const Series &lowerSeries() const {
		if (!lower.has_value()) {
			throw std::out_of_range("Lower interval not available.");
		}
		return *lower;
	}

	const Series &upperSeries() const {
		if (!upper.has_value()) {
			throw std::out_of_range("Upper interval not available.");
		}
		return *upper;
	}
};

} // namespace rowcast::core
