#pragma once

#include "rowcast/core/cell.hpp"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rowcast::core {

/**
 * @class DataRecord
 * @brief One row of a result set, keyed by column name.
 */
class DataRecord {
public:
	using Columns = std::unordered_map<std::string, Cell>;

	DataRecord() = default;
	DataRecord(std::initializer_list<std::pair<const std::string, Cell>> cells) : cells_(cells) {}

	/// Returns the cell for @p column, or a Missing cell when the column is absent.
	const Cell &get(const std::string &column) const;

	bool has(const std::string &column) const {
		return cells_.find(column) != cells_.end();
	}

	DataRecord &set(const std::string &column, Cell value) {
		cells_[column] = std::move(value);
		return *this;
	}

	std::size_t size() const noexcept {
		return cells_.size();
	}

	const Columns &columns() const noexcept {
		return cells_;
	}

	bool operator==(const DataRecord &other) const {
		return cells_ == other.cells_;
	}

private:
	Columns cells_;
};

/// Rows in result-set order. For forecasting the order is the time order.
using Dataset = std::vector<DataRecord>;

/// Row-major numeric features, one inner vector per record.
using FeatureRows = std::vector<std::vector<double>>;

/**
 * @brief Extracts a column as numbers, mapping non-numeric cells to 0.
 */
std::vector<double> numericColumn(const Dataset &dataset, const std::string &column);

/**
 * @brief Extracts a column as instants, mapping unparseable cells to the epoch.
 */
std::vector<TimePoint> timestampColumn(const Dataset &dataset, const std::string &column);

/**
 * @brief Extracts the given feature columns, preserving their order.
 */
FeatureRows featureMatrix(const Dataset &dataset, const std::vector<std::string> &features);

} // namespace rowcast::core
