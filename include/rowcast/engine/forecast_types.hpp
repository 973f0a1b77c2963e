#pragma once

#include "rowcast/core/dataset.hpp"
#include "rowcast/models/holt_winters.hpp"
#include "rowcast/utils/metrics.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rowcast::engine {

/// Forecasting models selectable by callers.
enum class ForecastModel {
	Linear,
	ExponentialSmoothing,
	Decomposition
};

/// Canonical tag of @p model: "linear", "exponential_smoothing" or "decomposition".
std::string toString(ForecastModel model);

/**
 * @brief Parses a model tag.
 *
 * Accepts the canonical tags plus the aliases "holt_winters" and
 * "exponential". Matching ignores case and surrounding whitespace.
 */
std::optional<ForecastModel> parseForecastModel(std::string_view name);

/// parseForecastModel() falling back to ForecastModel::Linear.
ForecastModel forecastModelOrDefault(std::string_view name);

/// Name of the column marking synthesized forecast records.
inline constexpr const char *kForecastMarkerColumn = "_isForecast";

struct ForecastOptions {
	std::string date_column;
	std::string value_column;
	/// Number of future periods; must be positive.
	int periods = 1;
	ForecastModel model = ForecastModel::Linear;
	/// Interval coverage in (0, 1); no interval when absent.
	std::optional<double> confidence_level;
	/// Smoothing constants of the exponential smoothing model.
	models::HoltWinters::Params smoothing;
};

struct ConfidenceInterval {
	core::Dataset lower;
	core::Dataset upper;
};

struct ForecastResult {
	/// Projected records carrying the date column, the value column and the marker column.
	core::Dataset forecast;
	std::optional<ConfidenceInterval> confidence_interval;
	/// Model that produced the forecast, after any fallback.
	ForecastModel model = ForecastModel::Linear;
	/// In-sample fit of the model; absent when no forecast was produced.
	std::optional<utils::AccuracyMetrics> accuracy;
};

} // namespace rowcast::engine
