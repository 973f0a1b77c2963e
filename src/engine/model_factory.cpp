#include "rowcast/engine/model_factory.hpp"
#include "rowcast/models/holt_winters.hpp"
#include "rowcast/models/linear_trend.hpp"
#include "rowcast/models/seasonal_decomposition.hpp"
#include "rowcast/utils/logging.hpp"

namespace rowcast::engine {

ModelFactory::Selection ModelFactory::create(ForecastModel requested, std::size_t observations,
                                             const models::HoltWinters::Params &smoothing) {
	Selection selection;
	selection.resolved = requested;

	switch (requested) {
	case ForecastModel::Linear:
		selection.model = std::make_unique<models::LinearTrend>();
		break;
	case ForecastModel::ExponentialSmoothing: {
		const auto season_length = models::HoltWinters::seasonLengthFor(observations);
		if (!season_length || observations < 2 * static_cast<std::size_t>(*season_length)) {
			ROWCAST_INFO("Series of {} points is too short for seasonal smoothing, falling back to linear.",
			             observations);
			selection.model = std::make_unique<models::LinearTrend>();
			selection.resolved = ForecastModel::Linear;
			break;
		}
		selection.model =
		    models::HoltWintersBuilder().withSeasonalPeriod(*season_length).withParams(smoothing).build();
		break;
	}
	case ForecastModel::Decomposition:
		selection.model = std::make_unique<models::SeasonalDecomposition>();
		break;
	}

	return selection;
}

std::vector<std::string> ModelFactory::supportedModels() {
	return {toString(ForecastModel::Linear), toString(ForecastModel::ExponentialSmoothing),
	        toString(ForecastModel::Decomposition)};
}

} // namespace rowcast::engine
