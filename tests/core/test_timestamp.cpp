#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "rowcast/core/timestamp.hpp"

#include <limits>

using namespace rowcast::core;

TEST_CASE("parseTimestamp accepts ISO-8601 variants", "[core][timestamp]") {
	const auto date_only = parseTimestamp("2024-01-01");
	REQUIRE(date_only.has_value());
	REQUIRE(toEpochMillis(*date_only) == Catch::Approx(1704067200000.0));

	REQUIRE(parseTimestamp("2024-01-01T00:00:00Z") == date_only);
	REQUIRE(parseTimestamp("2024-01-01 00:00") == date_only);
	REQUIRE(parseTimestamp("  2024-01-01T00:00:00.000Z  ") == date_only);

	const auto with_offset = parseTimestamp("2024-01-01T02:00:00+02:00");
	REQUIRE(with_offset == date_only);

	const auto fractional = parseTimestamp("2024-01-01T00:00:01.250Z");
	REQUIRE(fractional.has_value());
	REQUIRE(toEpochMillis(*fractional) == Catch::Approx(1704067201250.0));
}

TEST_CASE("parseTimestamp rejects malformed text", "[core][timestamp][error]") {
	REQUIRE_FALSE(parseTimestamp("").has_value());
	REQUIRE_FALSE(parseTimestamp("2024-13-01").has_value());
	REQUIRE_FALSE(parseTimestamp("2023-02-29").has_value());
	REQUIRE_FALSE(parseTimestamp("2024-01-01T25:00").has_value());
	REQUIRE_FALSE(parseTimestamp("2024-01-01T10").has_value());
	REQUIRE_FALSE(parseTimestamp("2024-01-01 trailing").has_value());
	REQUIRE_FALSE(parseTimestamp("01/02/2024").has_value());

	REQUIRE(parseTimestamp("2024-02-29").has_value());
}

TEST_CASE("formatTimestamp produces UTC text with milliseconds", "[core][timestamp]") {
	REQUIRE(formatTimestamp(*fromEpochMillis(0.0)) == "1970-01-01T00:00:00.000Z");
	REQUIRE(formatTimestamp(*fromEpochMillis(1704067201250.0)) == "2024-01-01T00:00:01.250Z");
	REQUIRE(formatTimestamp(*fromEpochMillis(-1.0)) == "1969-12-31T23:59:59.999Z");

	const auto parsed = parseTimestamp(formatTimestamp(*fromEpochMillis(1709294400123.0)));
	REQUIRE(parsed.has_value());
	REQUIRE(toEpochMillis(*parsed) == Catch::Approx(1709294400123.0));
}

TEST_CASE("Timestamps far from the epoch keep their calendar date", "[core][timestamp]") {
	const auto far_future = parseTimestamp("2500-01-01");
	REQUIRE(far_future.has_value());
	REQUIRE(formatTimestamp(*far_future) == "2500-01-01T00:00:00.000Z");
	REQUIRE(toEpochMillis(*far_future) == Catch::Approx(16725225600000.0));

	const auto far_past = parseTimestamp("1600-03-01T12:30:00Z");
	REQUIRE(far_past.has_value());
	REQUIRE(formatTimestamp(*far_past) == "1600-03-01T12:30:00.000Z");

	REQUIRE(formatTimestamp(*fromEpochMillis(253402300799999.0)) == "9999-12-31T23:59:59.999Z");
}

TEST_CASE("fromEpochMillis rejects values outside the time range", "[core][timestamp][edge]") {
	REQUIRE(fromEpochMillis(kMaxEpochMillis).has_value());
	REQUIRE(fromEpochMillis(-kMaxEpochMillis).has_value());
	REQUIRE_FALSE(fromEpochMillis(kMaxEpochMillis + 1.0).has_value());
	REQUIRE_FALSE(fromEpochMillis(1e20).has_value());
	REQUIRE_FALSE(fromEpochMillis(-1e20).has_value());
	REQUIRE_FALSE(fromEpochMillis(std::numeric_limits<double>::infinity()).has_value());
	REQUIRE_FALSE(fromEpochMillis(std::numeric_limits<double>::quiet_NaN()).has_value());
}
