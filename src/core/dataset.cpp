#include "rowcast/core/dataset.hpp"
#include "rowcast/utils/logging.hpp"

namespace rowcast::core {

const Cell &DataRecord::get(const std::string &column) const {
	static const Cell missing_cell{};
	const auto it = cells_.find(column);
	if (it == cells_.end()) {
		return missing_cell;
	}
	return it->second;
}

std::vector<double> numericColumn(const Dataset &dataset, const std::string &column) {
	std::vector<double> values;
	values.reserve(dataset.size());
	std::size_t coerced = 0;
	for (const auto &record : dataset) {
		const auto number = toNumber(record.get(column));
		if (!number) {
			++coerced;
		}
		values.push_back(number.value_or(0.0));
	}
	if (coerced > 0) {
		ROWCAST_DEBUG("Column '{}': {} of {} values are not numeric and read as 0.", column, coerced,
		              dataset.size());
	}
	return values;
}

std::vector<TimePoint> timestampColumn(const Dataset &dataset, const std::string &column) {
	std::vector<TimePoint> timestamps;
	timestamps.reserve(dataset.size());
	std::size_t unparsed = 0;
	for (const auto &record : dataset) {
		const auto tp = toTimestamp(record.get(column));
		if (!tp) {
			++unparsed;
		}
		timestamps.push_back(tp.value_or(TimePoint{}));
	}
	if (unparsed > 0) {
		ROWCAST_DEBUG("Column '{}': {} of {} values are not dates and read as the epoch.", column, unparsed,
		              dataset.size());
	}
	return timestamps;
}

FeatureRows featureMatrix(const Dataset &dataset, const std::vector<std::string> &features) {
	FeatureRows rows;
	rows.reserve(dataset.size());
	for (const auto &record : dataset) {
		std::vector<double> row;
		row.reserve(features.size());
		for (const auto &feature : features) {
			row.push_back(numberOrZero(record.get(feature)));
		}
		rows.push_back(std::move(row));
	}
	return rows;
}

} // namespace rowcast::core
