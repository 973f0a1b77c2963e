#include "rowcast/core/timestamp.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace rowcast::core {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian civil date.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilDate {
	std::int64_t year;
	unsigned month;
	unsigned day;
};

CivilDate civilFromDays(std::int64_t z) {
	z += 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
	return {y, m, d};
}

bool isLeapYear(std::int64_t y) {
	return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(std::int64_t y, unsigned m) {
	static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (m == 2 && isLeapYear(y)) {
		return 29;
	}
	return days[m - 1];
}

class Cursor {
public:
	explicit Cursor(std::string_view text) : text_(text) {}

	bool atEnd() const {
		return pos_ >= text_.size();
	}

	char peek() const {
		return atEnd() ? '\0' : text_[pos_];
	}

	bool consume(char expected) {
		if (peek() != expected) {
			return false;
		}
		++pos_;
		return true;
	}

	bool digits(std::size_t count, int &out) {
		int value = 0;
		for (std::size_t i = 0; i < count; ++i) {
			if (atEnd() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
				return false;
			}
			value = value * 10 + (text_[pos_] - '0');
			++pos_;
		}
		out = value;
		return true;
	}

	double fraction() {
		double value = 0.0;
		double scale = 0.1;
		while (!atEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
			value += scale * (text_[pos_] - '0');
			scale /= 10.0;
			++pos_;
		}
		return value;
	}

private:
	std::string_view text_;
	std::size_t pos_ = 0;
};

} // namespace

std::optional<TimePoint> parseTimestamp(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
		text.remove_prefix(1);
	}
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
		text.remove_suffix(1);
	}

	Cursor cursor(text);
	int year = 0;
	int month = 0;
	int day = 0;
	if (!cursor.digits(4, year) || !cursor.consume('-') || !cursor.digits(2, month) || !cursor.consume('-') ||
	    !cursor.digits(2, day)) {
		return std::nullopt;
	}
	if (month < 1 || month > 12 || day < 1 || static_cast<unsigned>(day) > daysInMonth(year, month)) {
		return std::nullopt;
	}

	int hour = 0;
	int minute = 0;
	int second = 0;
	double fraction = 0.0;
	int offset_minutes = 0;

	if (cursor.consume('T') || cursor.consume(' ')) {
		if (!cursor.digits(2, hour) || !cursor.consume(':') || !cursor.digits(2, minute)) {
			return std::nullopt;
		}
		if (cursor.consume(':')) {
			if (!cursor.digits(2, second)) {
				return std::nullopt;
			}
			if (cursor.consume('.')) {
				fraction = cursor.fraction();
			}
		}
		if (hour > 23 || minute > 59 || second > 60) {
			return std::nullopt;
		}

		if (cursor.consume('Z')) {
			// UTC
		} else if (cursor.peek() == '+' || cursor.peek() == '-') {
			const int sign = cursor.peek() == '-' ? -1 : 1;
			cursor.consume(cursor.peek());
			int off_hour = 0;
			int off_minute = 0;
			if (!cursor.digits(2, off_hour)) {
				return std::nullopt;
			}
			cursor.consume(':');
			if (!cursor.digits(2, off_minute)) {
				return std::nullopt;
			}
			offset_minutes = sign * (off_hour * 60 + off_minute);
		}
	}

	if (!cursor.atEnd()) {
		return std::nullopt;
	}

	const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
	const double seconds = static_cast<double>(days) * 86400.0 + hour * 3600.0 + minute * 60.0 + second +
	                       fraction - offset_minutes * 60.0;
	return fromEpochMillis(seconds * 1000.0);
}

std::string formatTimestamp(const TimePoint &tp) {
	const auto total_ms =
	    std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
	std::int64_t days = total_ms / 86400000;
	std::int64_t ms_of_day = total_ms % 86400000;
	if (ms_of_day < 0) {
		ms_of_day += 86400000;
		--days;
	}
	const auto date = civilFromDays(days);
	const int hour = static_cast<int>(ms_of_day / 3600000);
	const int minute = static_cast<int>((ms_of_day / 60000) % 60);
	const int second = static_cast<int>((ms_of_day / 1000) % 60);
	const int millis = static_cast<int>(ms_of_day % 1000);

	char buffer[40];
	std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
	              static_cast<long long>(date.year), date.month, date.day, hour, minute, second, millis);
	return buffer;
}

double toEpochMillis(const TimePoint &tp) {
	return std::chrono::duration_cast<Milliseconds>(tp.time_since_epoch()).count();
}

std::optional<TimePoint> fromEpochMillis(double millis) {
	const double rounded = std::round(millis);
	if (!std::isfinite(rounded) || std::abs(rounded) > kMaxEpochMillis) {
		return std::nullopt;
	}
	return TimePoint(std::chrono::milliseconds(static_cast<std::int64_t>(rounded)));
}

} // namespace rowcast::core
