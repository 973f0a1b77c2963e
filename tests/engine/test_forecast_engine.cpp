#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "rowcast/engine/forecast_engine.hpp"
#include "rowcast/engine/model_factory.hpp"
#include "common/dataset_helpers.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using rowcast::core::formatTimestamp;
using rowcast::engine::ForecastModel;
using rowcast::engine::ForecastOptions;
using rowcast::engine::kForecastMarkerColumn;

namespace {

ForecastOptions dailyOptions(int periods, ForecastModel model) {
	ForecastOptions options;
	options.date_column = "date";
	options.value_column = "value";
	options.periods = periods;
	options.model = model;
	return options;
}

} // namespace

TEST_CASE("Forecast model tags parse with aliases", "[engine][forecast][tags]") {
	using rowcast::engine::forecastModelOrDefault;
	using rowcast::engine::parseForecastModel;

	REQUIRE(parseForecastModel("linear") == ForecastModel::Linear);
	REQUIRE(parseForecastModel("exponential_smoothing") == ForecastModel::ExponentialSmoothing);
	REQUIRE(parseForecastModel("Holt-Winters") == ForecastModel::ExponentialSmoothing);
	REQUIRE(parseForecastModel(" exponential ") == ForecastModel::ExponentialSmoothing);
	REQUIRE(parseForecastModel("decomposition") == ForecastModel::Decomposition);
	REQUIRE_FALSE(parseForecastModel("arima").has_value());

	REQUIRE(forecastModelOrDefault("arima") == ForecastModel::Linear);
	REQUIRE(forecastModelOrDefault("") == ForecastModel::Linear);
	REQUIRE(rowcast::engine::toString(ForecastModel::ExponentialSmoothing) == "exponential_smoothing");
	REQUIRE(rowcast::engine::ModelFactory::supportedModels() ==
	        std::vector<std::string>{"linear", "exponential_smoothing", "decomposition"});
}

TEST_CASE("Linear forecast extends an exact line", "[engine][forecast][linear]") {
	// y = 2x + 5 on ten evenly spaced days
	const auto dataset = tests::helpers::makeDailyDataset(tests::helpers::linearSeries(5.0, 2.0, 10));
	const auto result = rowcast::engine::forecast(dataset, dailyOptions(3, ForecastModel::Linear));

	REQUIRE(result.model == ForecastModel::Linear);
	REQUIRE(result.forecast.size() == 3);
	REQUIRE_FALSE(result.confidence_interval.has_value());

	const std::vector<std::string> expected_dates{"2024-01-11T00:00:00.000Z", "2024-01-12T00:00:00.000Z",
	                                              "2024-01-13T00:00:00.000Z"};
	for (std::size_t h = 0; h < 3; ++h) {
		const auto &record = result.forecast[h];
		REQUIRE(record.size() == 3);
		REQUIRE(record.get("value").asNumber() == Catch::Approx(2.0 * static_cast<double>(10 + h) + 5.0));
		REQUIRE(formatTimestamp(record.get("date").asDate()) == expected_dates[h]);
		REQUIRE(record.get(kForecastMarkerColumn).asBoolean());
	}

	REQUIRE(result.accuracy.has_value());
	REQUIRE(*result.accuracy->r_squared == Catch::Approx(1.0));
}

TEST_CASE("Forecast needs at least two rows", "[engine][forecast][edge]") {
	const auto options = dailyOptions(4, ForecastModel::Decomposition);

	const auto empty = rowcast::engine::forecast({}, options);
	REQUIRE(empty.forecast.empty());
	REQUIRE(empty.model == ForecastModel::Decomposition);
	REQUIRE_FALSE(empty.accuracy.has_value());

	auto with_confidence = options;
	with_confidence.confidence_level = 0.9;
	const auto single = rowcast::engine::forecast(tests::helpers::makeDailyDataset({3.0}), with_confidence);
	REQUIRE(single.forecast.empty());
	REQUIRE_FALSE(single.confidence_interval.has_value());
}

TEST_CASE("Forecast rejects malformed options", "[engine][forecast][error]") {
	const auto dataset = tests::helpers::makeDailyDataset({1.0, 2.0, 3.0});

	REQUIRE_THROWS_AS(rowcast::engine::forecast(dataset, dailyOptions(0, ForecastModel::Linear)),
	                  std::invalid_argument);

	auto options = dailyOptions(2, ForecastModel::Linear);
	options.confidence_level = 1.5;
	REQUIRE_THROWS_AS(rowcast::engine::forecast(dataset, options), std::invalid_argument);

	auto smoothing_options = dailyOptions(1, ForecastModel::ExponentialSmoothing);
	smoothing_options.smoothing.alpha = 1.2;
	REQUIRE_THROWS_AS(rowcast::engine::forecast(dataset, smoothing_options), std::invalid_argument);
	smoothing_options.smoothing.alpha = 0.5;
	smoothing_options.smoothing.gamma = -0.1;
	REQUIRE_THROWS_AS(rowcast::engine::forecast(dataset, smoothing_options), std::invalid_argument);
}

TEST_CASE("Forecast rejects colliding column names", "[engine][forecast][error]") {
	const auto dataset = tests::helpers::makeDailyDataset({1.0, 2.0, 3.0});

	auto same = dailyOptions(2, ForecastModel::Linear);
	same.value_column = "date";
	REQUIRE_THROWS_AS(rowcast::engine::forecast(dataset, same), std::invalid_argument);

	auto marker_date = dailyOptions(2, ForecastModel::Linear);
	marker_date.date_column = kForecastMarkerColumn;
	REQUIRE_THROWS_AS(rowcast::engine::forecast(dataset, marker_date), std::invalid_argument);

	auto marker_value = dailyOptions(2, ForecastModel::Linear);
	marker_value.value_column = kForecastMarkerColumn;
	REQUIRE_THROWS_AS(rowcast::engine::forecast(dataset, marker_value), std::invalid_argument);

	// Checked before the row-count guard
	REQUIRE_THROWS_AS(rowcast::engine::forecast({}, same), std::invalid_argument);
}

TEST_CASE("Exponential smoothing falls back to linear on short series", "[engine][forecast][holt_winters]") {
	const std::vector<double> values{3.0, 5.0, 4.0, 6.0, 8.0, 7.0, 9.0, 11.0, 10.0, 12.0, 13.0};
	const auto dataset = tests::helpers::makeDailyDataset(values);

	const auto smoothing = rowcast::engine::forecast(dataset, dailyOptions(5, ForecastModel::ExponentialSmoothing));
	const auto linear = rowcast::engine::forecast(dataset, dailyOptions(5, ForecastModel::Linear));

	REQUIRE(smoothing.model == ForecastModel::Linear);
	REQUIRE(smoothing.forecast == linear.forecast);
}

TEST_CASE("Exponential smoothing runs on a seasonal history", "[engine][forecast][holt_winters]") {
	const auto dataset = tests::helpers::makeDailyDataset(tests::helpers::weeklySeries(21));
	const auto result = rowcast::engine::forecast(dataset, dailyOptions(7, ForecastModel::ExponentialSmoothing));

	REQUIRE(result.model == ForecastModel::ExponentialSmoothing);
	REQUIRE(result.forecast.size() == 7);
	REQUIRE(formatTimestamp(result.forecast.back().get("date").asDate()) == "2024-01-28T00:00:00.000Z");
}

TEST_CASE("Decomposition forecast projects trend plus season", "[engine][forecast][decomposition]") {
	const auto dataset = tests::helpers::makeDailyDataset(tests::helpers::weeklySeries(14));
	const auto result = rowcast::engine::forecast(dataset, dailyOptions(3, ForecastModel::Decomposition));

	REQUIRE(result.model == ForecastModel::Decomposition);
	REQUIRE(result.forecast.size() == 3);
	REQUIRE(result.accuracy.has_value());
	REQUIRE(result.accuracy->n == 14);
}

TEST_CASE("Forecast confidence interval brackets the projection", "[engine][forecast][intervals]") {
	const auto dataset = tests::helpers::makeDailyDataset({10.0, 12.0, 11.0, 14.0, 13.0, 15.0, 17.0, 16.0});
	auto options = dailyOptions(3, ForecastModel::Linear);
	options.confidence_level = 0.95;

	const auto result = rowcast::engine::forecast(dataset, options);
	REQUIRE(result.confidence_interval.has_value());
	const auto &interval = *result.confidence_interval;
	REQUIRE(interval.lower.size() == 3);
	REQUIRE(interval.upper.size() == 3);

	for (std::size_t h = 0; h < 3; ++h) {
		const double point = result.forecast[h].get("value").asNumber();
		REQUIRE(interval.lower[h].get("value").asNumber() < point);
		REQUIRE(interval.upper[h].get("value").asNumber() > point);
		REQUIRE(interval.lower[h].get("date") == result.forecast[h].get("date"));
		REQUIRE(interval.upper[h].get(kForecastMarkerColumn).asBoolean());
	}
}

TEST_CASE("Forecast coerces non-numeric values and is repeatable", "[engine][forecast]") {
	rowcast::core::Dataset dataset = tests::helpers::makeDailyDataset({4.0, 6.0, 8.0, 10.0});
	dataset[1].set("value", "n/a");

	const auto options = dailyOptions(2, ForecastModel::Linear);
	const auto first = rowcast::engine::forecast(dataset, options);
	const auto second = rowcast::engine::forecast(dataset, options);

	REQUIRE(first.forecast.size() == 2);
	REQUIRE(first.forecast == second.forecast);

	// Same as the series 4, 0, 8, 10
	const auto reference = rowcast::engine::forecast(tests::helpers::makeDailyDataset({4.0, 0.0, 8.0, 10.0}), options);
	REQUIRE(first.forecast == reference.forecast);
}

TEST_CASE("Seasonal forecasts are repeatable", "[engine][forecast]") {
	const auto dataset = tests::helpers::makeDailyDataset(tests::helpers::weeklySeries(28));

	for (const auto model : {ForecastModel::ExponentialSmoothing, ForecastModel::Decomposition}) {
		auto options = dailyOptions(10, model);
		options.confidence_level = 0.9;

		const auto first = rowcast::engine::forecast(dataset, options);
		const auto second = rowcast::engine::forecast(dataset, options);

		REQUIRE(first.model == model);
		REQUIRE(first.forecast.size() == 10);
		REQUIRE(first.forecast == second.forecast);
		REQUIRE(first.confidence_interval.has_value());
		REQUIRE(second.confidence_interval.has_value());
		REQUIRE(first.confidence_interval->lower == second.confidence_interval->lower);
		REQUIRE(first.confidence_interval->upper == second.confidence_interval->upper);
		REQUIRE(first.accuracy.has_value());
		REQUIRE(second.accuracy.has_value());
		REQUIRE(first.accuracy->rmse == second.accuracy->rmse);
	}
}
