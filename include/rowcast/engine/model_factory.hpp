#pragma once

#include "rowcast/engine/forecast_types.hpp"
#include "rowcast/models/iforecaster.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace rowcast::engine {

class ModelFactory {
public:
	struct Selection {
		std::unique_ptr<models::IForecaster> model;
		/// Model actually created; differs from the request after a fallback.
		ForecastModel resolved = ForecastModel::Linear;
	};

	/**
	 * @brief Creates the forecaster for @p requested over @p observations points.
	 *
	 * Exponential smoothing falls back to the linear model when the series is
	 * too short to support seasonality.
	 */
	static Selection create(ForecastModel requested, std::size_t observations,
	                        const models::HoltWinters::Params &smoothing = {});

	/// Canonical tags of all models.
	static std::vector<std::string> supportedModels();
};

} // namespace rowcast::engine
