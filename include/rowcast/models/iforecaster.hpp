#pragma once

#include "rowcast/core/forecast.hpp"
#include "rowcast/core/time_series.hpp"
#include "rowcast/utils/metrics.hpp"

#include <string>
#include <vector>

namespace rowcast::models {

/**
 * @class IForecaster
 * @brief An interface for all forecasting models.
 *
 * This abstract base class defines the common structure for the forecasting
 * models of the library. It ensures a consistent API for fitting models,
 * generating predictions and inspecting the in-sample fit.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The time series data to train the model on.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates forecasts for a specified number of steps into the future.
	 * @param horizon The number of future time steps to predict.
	 * @return A Forecast object containing the point predictions.
	 */
	virtual core::Forecast predict(int horizon) = 0;

	/**
	 * @brief Generates forecasts with a symmetric prediction interval.
	 *
	 * The interval is `point ± z * sigma * sqrt(h)`, where sigma is the root
	 * mean square of the in-sample residuals and z the two-sided standard
	 * normal quantile of @p confidence.
	 *
	 * @param confidence Coverage probability in (0, 1).
	 * @throws std::invalid_argument if @p confidence is outside (0, 1).
	 */
	virtual core::Forecast predictWithConfidence(int horizon, double confidence);

	/**
	 * @brief In-sample fitted values aligned with the training observations.
	 */
	virtual const std::vector<double> &fittedValues() const = 0;

	/**
	 * @brief Training observations minus fitted values.
	 */
	std::vector<double> residuals() const;

	/**
	 * @brief Goodness of fit of the fitted values against the training observations.
	 */
	utils::AccuracyMetrics score() const;

	/**
	 * @brief Gets the name of the forecasting model.
	 * @return A string representing the model's name (e.g., "LinearTrend").
	 */
	virtual std::string getName() const = 0;

protected:
	/// Training observations, kept by fit() for residual based diagnostics.
	virtual const std::vector<double> &history() const = 0;
};

} // namespace rowcast::models
