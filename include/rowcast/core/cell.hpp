#pragma once

#include "rowcast/core/timestamp.hpp"

#include <optional>
#include <string>
#include <variant>

namespace rowcast::core {

/**
 * @class Cell
 * @brief A single value of a tabular row.
 *
 * Values reach the engine from arbitrary upstream queries, so a column can hold
 * numbers, text, dates or nothing at all. The cell keeps the original kind and
 * every numeric consumer goes through toNumber(), the one coercion rule of the
 * library.
 */
class Cell {
public:
	struct Missing {
		bool operator==(const Missing &) const noexcept {
			return true;
		}
	};

	enum class Kind { Missing, Number, Text, DateLike, Boolean };

	Cell() = default;
	Cell(double number) : value_(number) {}
	Cell(int number) : value_(static_cast<double>(number)) {}
	Cell(long long number) : value_(static_cast<double>(number)) {}
	Cell(bool flag) : value_(flag) {}
	Cell(std::string text) : value_(std::move(text)) {}
	Cell(const char *text) : value_(std::string(text)) {}
	Cell(TimePoint date) : value_(date) {}

	static Cell missing() {
		return Cell();
	}

	Kind kind() const noexcept;

	bool isMissing() const noexcept {
		return std::holds_alternative<Missing>(value_);
	}
	bool isNumber() const noexcept {
		return std::holds_alternative<double>(value_);
	}
	bool isText() const noexcept {
		return std::holds_alternative<std::string>(value_);
	}
	bool isDate() const noexcept {
		return std::holds_alternative<TimePoint>(value_);
	}
	bool isBoolean() const noexcept {
		return std::holds_alternative<bool>(value_);
	}

	/// Typed accessors; throw std::bad_variant_access on a kind mismatch.
	double asNumber() const {
		return std::get<double>(value_);
	}
	const std::string &asText() const {
		return std::get<std::string>(value_);
	}
	TimePoint asDate() const {
		return std::get<TimePoint>(value_);
	}
	bool asBoolean() const {
		return std::get<bool>(value_);
	}

	bool operator==(const Cell &other) const {
		return value_ == other.value_;
	}
	bool operator!=(const Cell &other) const {
		return !(*this == other);
	}

private:
	std::variant<Missing, double, std::string, TimePoint, bool> value_;
};

/**
 * @brief Coerces a cell to a number.
 *
 * Numbers pass through unless NaN, text must parse completely as a decimal
 * number (blank text reads as 0), dates become epoch milliseconds and booleans
 * become 1 or 0. Missing cells never coerce.
 * @return The number, or std::nullopt when the cell has no numeric reading.
 */
std::optional<double> toNumber(const Cell &cell);

/// toNumber() with failures mapped to 0.
double numberOrZero(const Cell &cell);

/**
 * @brief Coerces a cell to an instant.
 *
 * Dates pass through, text is parsed as ISO-8601 and numbers are read as epoch
 * milliseconds.
 */
std::optional<TimePoint> toTimestamp(const Cell &cell);

/// Human readable rendering, used for logging and diagnostics.
std::string toString(const Cell &cell);

} // namespace rowcast::core
