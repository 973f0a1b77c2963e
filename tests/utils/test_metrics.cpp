#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "rowcast/utils/metrics.hpp"

using rowcast::utils::Metrics;

TEST_CASE("Metrics compute basic error statistics", "[utils][metrics]") {
	const std::vector<double> actual{1.0, 2.0, 3.0};
	const std::vector<double> predicted{1.5, 2.5, 2.0};

	const double mae = Metrics::mae(actual, predicted);
	const double mse = Metrics::mse(actual, predicted);
	const double rmse = Metrics::rmse(actual, predicted);

	const double expected_mae = (0.5 + 0.5 + 1.0) / 3.0;
	const double expected_mse = (0.25 + 0.25 + 1.0) / 3.0;

	REQUIRE(mae == Catch::Approx(expected_mae));
	REQUIRE(mse == Catch::Approx(expected_mse));
	REQUIRE(rmse == Catch::Approx(std::sqrt(expected_mse)));
}

TEST_CASE("Metrics handles invalid inputs", "[utils][metrics][error]") {
	const std::vector<double> actual{1.0, 2.0};
	const std::vector<double> predicted{1.0};

	REQUIRE_THROWS_AS(Metrics::mae(actual, predicted), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::r2({}, {}), std::invalid_argument);
}

TEST_CASE("Metrics r2 is undefined for a constant actual", "[utils][metrics][r2]") {
	const std::vector<double> flat{3.0, 3.0, 3.0};
	REQUIRE_FALSE(Metrics::r2(flat, {2.0, 3.0, 4.0}).has_value());

	const std::vector<double> actual{1.0, 2.0, 3.0, 4.0};
	REQUIRE(*Metrics::r2(actual, actual) == Catch::Approx(1.0));
	REQUIRE(*Metrics::r2(actual, {2.5, 2.5, 2.5, 2.5}) == Catch::Approx(0.0).margin(1e-12));
}

TEST_CASE("Metrics evaluate bundles all statistics", "[utils][metrics]") {
	const std::vector<double> actual{2.0, 4.0, 6.0, 8.0};
	const std::vector<double> predicted{2.0, 5.0, 7.0, 8.0};

	const auto metrics = Metrics::evaluate(actual, predicted);
	REQUIRE(metrics.n == 4);
	REQUIRE(metrics.mae == Catch::Approx(0.5));
	REQUIRE(metrics.mse == Catch::Approx(0.5));
	REQUIRE(metrics.rmse == Catch::Approx(std::sqrt(0.5)));
	REQUIRE(metrics.r_squared.has_value());
	REQUIRE(*metrics.r_squared == Catch::Approx(1.0 - 2.0 / 20.0));
}
