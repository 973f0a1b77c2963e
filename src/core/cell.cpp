#include "rowcast/core/cell.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace rowcast::core {

namespace {

std::string trimmed(const std::string &text) {
	std::size_t begin = 0;
	std::size_t end = text.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
		++begin;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
		--end;
	}
	return text.substr(begin, end - begin);
}

std::optional<double> parseDecimal(const std::string &raw) {
	const std::string text = trimmed(raw);
	if (text.empty()) {
		return 0.0;
	}
	errno = 0;
	char *end = nullptr;
	const double value = std::strtod(text.c_str(), &end);
	if (end != text.c_str() + text.size() || errno == ERANGE || std::isnan(value)) {
		return std::nullopt;
	}
	return value;
}

} // namespace

Cell::Kind Cell::kind() const noexcept {
	switch (value_.index()) {
	case 1:
		return Kind::Number;
	case 2:
		return Kind::Text;
	case 3:
		return Kind::DateLike;
	case 4:
		return Kind::Boolean;
	default:
		return Kind::Missing;
	}
}

std::optional<double> toNumber(const Cell &cell) {
	switch (cell.kind()) {
	case Cell::Kind::Number: {
		const double value = cell.asNumber();
		if (std::isnan(value)) {
			return std::nullopt;
		}
		return value;
	}
	case Cell::Kind::Text:
		return parseDecimal(cell.asText());
	case Cell::Kind::DateLike:
		return toEpochMillis(cell.asDate());
	case Cell::Kind::Boolean:
		return cell.asBoolean() ? 1.0 : 0.0;
	case Cell::Kind::Missing:
		return std::nullopt;
	}
	return std::nullopt;
}

double numberOrZero(const Cell &cell) {
	return toNumber(cell).value_or(0.0);
}

std::optional<TimePoint> toTimestamp(const Cell &cell) {
	switch (cell.kind()) {
	case Cell::Kind::DateLike:
		return cell.asDate();
	case Cell::Kind::Text:
		return parseTimestamp(cell.asText());
	case Cell::Kind::Number:
		return fromEpochMillis(cell.asNumber());
	case Cell::Kind::Boolean:
	case Cell::Kind::Missing:
		return std::nullopt;
	}
	return std::nullopt;
}

std::string toString(const Cell &cell) {
	switch (cell.kind()) {
	case Cell::Kind::Number: {
		std::ostringstream out;
		out << cell.asNumber();
		return out.str();
	}
	case Cell::Kind::Text:
		return cell.asText();
	case Cell::Kind::DateLike:
		return formatTimestamp(cell.asDate());
	case Cell::Kind::Boolean:
		return cell.asBoolean() ? "true" : "false";
	case Cell::Kind::Missing:
		return "null";
	}
	return "null";
}

} // namespace rowcast::core
