#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "rowcast/detectors/iqr.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using rowcast::detectors::IqrDetector;
using rowcast::detectors::IqrDetectorBuilder;

TEST_CASE("IqrDetector builder validates the multiplier", "[detectors][iqr][builder]") {
	REQUIRE_THROWS_AS(IqrDetectorBuilder().withMultiplier(0.0), std::invalid_argument);
	REQUIRE_THROWS_AS(IqrDetectorBuilder().withMultiplier(-2.0), std::invalid_argument);
	REQUIRE(IqrDetectorBuilder().build()->multiplier() == Catch::Approx(1.5));
	REQUIRE(IqrDetectorBuilder().withMultiplier(3.0).build()->multiplier() == Catch::Approx(3.0));
}

TEST_CASE("IqrDetector quartiles ignore input order", "[detectors][iqr]") {
	const auto q = IqrDetector::quartiles({100.0, 3.0, 1.0, 5.0, 2.0, 4.0});
	REQUIRE(q.q1 == Catch::Approx(1.75));
	REQUIRE(q.q3 == Catch::Approx(28.75));
	REQUIRE(q.range() == Catch::Approx(27.0));
}

TEST_CASE("IqrDetector flags only the outlier", "[detectors][iqr]") {
	const std::vector<double> values{3.0, 100.0, 1.0, 5.0, 2.0, 4.0};
	const auto report = IqrDetectorBuilder().build()->detect(values);

	REQUIRE(report.anomaly_indices == std::vector<std::size_t>{1});
	REQUIRE(report.threshold == Catch::Approx(1.5));
	REQUIRE(report.verdicts.size() == values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		REQUIRE(report.verdicts[i].value == values[i]);
		REQUIRE(report.verdicts[i].lower_bound == Catch::Approx(-38.75));
		REQUIRE(report.verdicts[i].upper_bound == Catch::Approx(69.25));
	}

	REQUIRE(report.verdicts[1].score == Catch::Approx((100.0 - 28.75) / 27.0));
	REQUIRE(report.verdicts[2].score == Catch::Approx(0.75 / 27.0));
	REQUIRE(report.verdicts[3].score == 0.0);
}

TEST_CASE("IqrDetector handles a zero interquartile range", "[detectors][iqr][edge]") {
	const auto report = IqrDetectorBuilder().build()->detect({5.0, 5.0, 5.0, 9.0, 5.0, 5.0, 5.0});
	REQUIRE(report.anomaly_indices == std::vector<std::size_t>{3});
	REQUIRE(std::isinf(report.verdicts[3].score));
	REQUIRE(report.verdicts[0].score == 0.0);

	REQUIRE(IqrDetectorBuilder().build()->detect({}).verdicts.empty());
}
