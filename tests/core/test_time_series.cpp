#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "rowcast/core/time_series.hpp"
#include "common/dataset_helpers.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>

using rowcast::core::TimeSeries;
using rowcast::core::toEpochMillis;

TEST_CASE("TimeSeries constructs univariate data", "[core][time_series]") {
	auto series = tests::helpers::makeSeries({1.0, 2.0, 3.0});

	REQUIRE(series.size() == 3);
	REQUIRE_FALSE(series.empty());
	REQUIRE(series.getValues()[1] == Catch::Approx(2.0));
	REQUIRE(series.getTimestamps().size() == 3);
}

TEST_CASE("TimeSeries validates constructor inputs", "[core][time_series][error]") {
	auto timestamps = tests::helpers::makeTimestamps(2);
	REQUIRE_THROWS_AS(TimeSeries(timestamps, {1.0}), std::invalid_argument);

	const TimeSeries empty;
	REQUIRE(empty.empty());
	REQUIRE(empty.averageIntervalMillis() == Catch::Approx(0.0));
	REQUIRE_THROWS_AS(empty.projectTimestamp(1), std::logic_error);
}

TEST_CASE("TimeSeries averages irregular spacing", "[core][time_series]") {
	const auto base = tests::helpers::baseTime();
	std::vector<rowcast::core::TimePoint> timestamps{base, base + std::chrono::hours(1), base + std::chrono::hours(4)};
	const TimeSeries series(std::move(timestamps), {1.0, 2.0, 3.0});

	const double hour = 3600000.0;
	REQUIRE(series.averageIntervalMillis() == Catch::Approx(2.0 * hour));

	const auto projected = series.projectTimestamp(2);
	REQUIRE(toEpochMillis(projected) - toEpochMillis(base) == Catch::Approx(8.0 * hour));
}

TEST_CASE("TimeSeries refuses projections beyond the time range", "[core][time_series][edge]") {
	std::vector<rowcast::core::TimePoint> timestamps{*rowcast::core::fromEpochMillis(0.0),
	                                                 *rowcast::core::fromEpochMillis(8.0e15)};
	const TimeSeries series(std::move(timestamps), {1.0, 2.0});

	REQUIRE_THROWS_AS(series.projectTimestamp(1), std::out_of_range);
	REQUIRE(toEpochMillis(series.projectTimestamp(0)) == Catch::Approx(8.0e15));
}

TEST_CASE("TimeSeries reads date and value columns of a dataset", "[core][time_series]") {
	const rowcast::core::Dataset dataset{
	    {{"day", "2024-01-01"}, {"sales", 10.0}},
	    {{"day", "2024-01-02"}, {"sales", "12"}},
	    {{"day", "2024-01-03"}, {"sales", "oops"}},
	};

	const auto series = TimeSeries::fromDataset(dataset, "day", "sales");
	REQUIRE(series.getValues() == std::vector<double>{10.0, 12.0, 0.0});
	REQUIRE(series.averageIntervalMillis() == Catch::Approx(86400000.0));
	REQUIRE(rowcast::core::formatTimestamp(series.projectTimestamp(1)) == "2024-01-04T00:00:00.000Z");
}
