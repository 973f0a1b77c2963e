#pragma once

#include "rowcast/engine/forecast_types.hpp"

namespace rowcast::engine {

/**
 * @brief Projects the value column of @p dataset @p options.periods steps ahead.
 *
 * Rows are read in order as the time axis. Each projected record is stamped
 * `last + h * average_interval` and carries the marker column set to true.
 * Fewer than two rows yield an empty forecast.
 *
 * @throws std::invalid_argument if periods is not positive, the confidence
 *         level lies outside (0, 1) or a smoothing constant outside [0, 1].
 * @throws std::invalid_argument if the date and value columns coincide or
 *         either is named like the marker column.
 * @throws std::out_of_range if a projected timestamp leaves the time range.
 */
ForecastResult forecast(const core::Dataset &dataset, const ForecastOptions &options);

} // namespace rowcast::engine
