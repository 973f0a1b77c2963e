#pragma once

#include "rowcast/core/dataset.hpp"
#include "rowcast/core/time_series.hpp"
#include "rowcast/core/timestamp.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace tests::helpers {

/// 2024-01-01T00:00:00Z
inline rowcast::core::TimePoint baseTime() {
	return *rowcast::core::fromEpochMillis(1704067200000.0);
}

inline std::vector<rowcast::core::TimePoint> makeTimestamps(std::size_t count,
                                                            std::chrono::hours step = std::chrono::hours{24}) {
	std::vector<rowcast::core::TimePoint> timestamps;
	timestamps.reserve(count);
	const auto start = baseTime();
	for (std::size_t i = 0; i < count; ++i) {
		timestamps.push_back(start + step * static_cast<long long>(i));
	}
	return timestamps;
}

inline rowcast::core::TimeSeries makeSeries(std::vector<double> values) {
	auto timestamps = makeTimestamps(values.size());
	return rowcast::core::TimeSeries(std::move(timestamps), std::move(values));
}

/// Daily rows with a "date" and a "value" column.
inline rowcast::core::Dataset makeDailyDataset(const std::vector<double> &values) {
	const auto timestamps = makeTimestamps(values.size());
	rowcast::core::Dataset dataset;
	dataset.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		dataset.push_back({{"date", timestamps[i]}, {"value", values[i]}});
	}
	return dataset;
}

/// Rows with a single "value" column.
inline rowcast::core::Dataset makeValueDataset(const std::vector<double> &values) {
	rowcast::core::Dataset dataset;
	dataset.reserve(values.size());
	for (double value : values) {
		dataset.push_back({{"value", value}});
	}
	return dataset;
}

/// Rows with one column per feature name, filled from @p rows.
inline rowcast::core::Dataset makeFeatureDataset(const std::vector<std::string> &features,
                                                 const std::vector<std::vector<double>> &rows) {
	rowcast::core::Dataset dataset;
	dataset.reserve(rows.size());
	for (const auto &row : rows) {
		rowcast::core::DataRecord record;
		for (std::size_t j = 0; j < features.size(); ++j) {
			record.set(features[j], row[j]);
		}
		dataset.push_back(std::move(record));
	}
	return dataset;
}

inline std::vector<double> linearSeries(double start, double step, std::size_t count) {
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		values.push_back(start + static_cast<double>(i) * step);
	}
	return values;
}

/// Weekly pattern on top of a mild upward trend.
inline std::vector<double> weeklySeries(std::size_t count) {
	static const double pattern[] = {10.0, 12.0, 15.0, 11.0, 9.0, 20.0, 22.0};
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		values.push_back(100.0 + 0.5 * static_cast<double>(i) + pattern[i % 7]);
	}
	return values;
}

} // namespace tests::helpers
