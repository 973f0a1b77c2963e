#pragma once

#include "rowcast/core/dataset.hpp"
#include "rowcast/core/timestamp.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rowcast::core {

/**
 * @class TimeSeries
 * @brief A univariate sequence of observations with their timestamps.
 *
 * Timestamps and values are kept in separate vectors for cache-efficient
 * numerical processing. Timestamps label the observations but are not required
 * to be evenly spaced or even sorted: the models index observations by
 * position and only use the time axis to stamp projected points.
 */
class TimeSeries {
public:
	using Value = double;

	TimeSeries() = default;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @throws std::invalid_argument If the sizes of timestamps and values vectors do not match.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values)
	    : timestamps_(std::move(timestamps)), values_(std::move(values)) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
	}

	/**
	 * @brief Builds a series from a date column and a value column of @p dataset.
	 *
	 * Non-numeric values read as 0 and unparseable dates as the epoch.
	 */
	static TimeSeries fromDataset(const Dataset &dataset, const std::string &date_column,
	                              const std::string &value_column) {
		return TimeSeries(timestampColumn(dataset, date_column), numericColumn(dataset, value_column));
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	std::size_t size() const noexcept {
		return values_.size();
	}

	bool empty() const noexcept {
		return values_.empty();
	}

	/**
	 * @brief Mean spacing between consecutive observations in milliseconds.
	 *
	 * Computed as `(last - first) / (n - 1)`, so irregular sampling yields the
	 * average step. Zero for fewer than two observations.
	 */
	double averageIntervalMillis() const {
		if (timestamps_.size() < 2) {
			return 0.0;
		}
		const double span = toEpochMillis(timestamps_.back()) - toEpochMillis(timestamps_.front());
		return span / static_cast<double>(timestamps_.size() - 1);
	}

	/**
	 * @brief Timestamp of the projected point @p step periods after the last observation.
	 * @throws std::out_of_range if the projection leaves the representable time range.
	 */
	TimePoint projectTimestamp(int step) const {
		if (timestamps_.empty()) {
			throw std::logic_error("Cannot project timestamps of an empty series.");
		}
		const auto projected = fromEpochMillis(toEpochMillis(timestamps_.back()) + step * averageIntervalMillis());
		if (!projected) {
			throw std::out_of_range("Projected timestamp is outside the representable time range.");
		}
		return *projected;
	}

private:
	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
};

} // namespace rowcast::core
