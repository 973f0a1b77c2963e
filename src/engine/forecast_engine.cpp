#include "rowcast/engine/forecast_engine.hpp"
#include "rowcast/core/time_series.hpp"
#include "rowcast/engine/model_factory.hpp"
#include "rowcast/utils/logging.hpp"

#include <initializer_list>
#include <stdexcept>
#include <string>

namespace rowcast::engine {

namespace {

core::DataRecord projectedRecord(const ForecastOptions &options, const core::TimePoint &timestamp, double value) {
	core::DataRecord record;
	record.set(options.date_column, core::Cell(timestamp));
	record.set(options.value_column, core::Cell(value));
	record.set(kForecastMarkerColumn, core::Cell(true));
	return record;
}

void validate(const ForecastOptions &options) {
	if (options.periods <= 0) {
		throw std::invalid_argument("Forecast periods must be positive.");
	}
	if (options.confidence_level && !(*options.confidence_level > 0.0 && *options.confidence_level < 1.0)) {
		throw std::invalid_argument("Confidence level must be between 0 and 1");
	}
	if (options.date_column == options.value_column) {
		throw std::invalid_argument("Date and value columns must differ.");
	}
	if (options.date_column == kForecastMarkerColumn || options.value_column == kForecastMarkerColumn) {
		throw std::invalid_argument("Column name '" + std::string(kForecastMarkerColumn) + "' is reserved.");
	}
	const auto &smoothing = options.smoothing;
	for (double constant : {smoothing.alpha, smoothing.beta, smoothing.gamma}) {
		if (!(constant >= 0.0 && constant <= 1.0)) {
			throw std::invalid_argument("Smoothing constants must be in [0, 1].");
		}
	}
}

} // namespace

ForecastResult forecast(const core::Dataset &dataset, const ForecastOptions &options) {
	validate(options);

	ForecastResult result;
	result.model = options.model;
	if (dataset.size() < 2) {
		ROWCAST_DEBUG("Forecast needs at least two rows, got {}. Returning an empty forecast.", dataset.size());
		return result;
	}

	const auto series = core::TimeSeries::fromDataset(dataset, options.date_column, options.value_column);
	auto selection = ModelFactory::create(options.model, series.size(), options.smoothing);
	result.model = selection.resolved;

	auto &model = *selection.model;
	model.fit(series);
	const auto prediction = options.confidence_level
	                            ? model.predictWithConfidence(options.periods, *options.confidence_level)
	                            : model.predict(options.periods);
	result.accuracy = model.score();

	result.forecast.reserve(prediction.horizon());
	if (prediction.hasIntervals()) {
		result.confidence_interval.emplace();
		result.confidence_interval->lower.reserve(prediction.horizon());
		result.confidence_interval->upper.reserve(prediction.horizon());
	}

	for (std::size_t h = 0; h < prediction.horizon(); ++h) {
		const auto timestamp = series.projectTimestamp(static_cast<int>(h + 1));
		result.forecast.push_back(projectedRecord(options, timestamp, prediction.point[h]));
		if (result.confidence_interval) {
			result.confidence_interval->lower.push_back(
			    projectedRecord(options, timestamp, prediction.lowerSeries()[h]));
			result.confidence_interval->upper.push_back(
			    projectedRecord(options, timestamp, prediction.upperSeries()[h]));
		}
	}

	ROWCAST_INFO("Forecast of {} periods with model {} from {} rows.", options.periods, toString(result.model),
	             dataset.size());
	return result;
}

} // namespace rowcast::engine
