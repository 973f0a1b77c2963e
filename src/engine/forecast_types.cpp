#include "rowcast/engine/forecast_types.hpp"
#include "rowcast/utils/logging.hpp"
#include "rowcast/utils/tags.hpp"

namespace rowcast::engine {

std::string toString(ForecastModel model) {
	switch (model) {
	case ForecastModel::Linear:
		return "linear";
	case ForecastModel::ExponentialSmoothing:
		return "exponential_smoothing";
	case ForecastModel::Decomposition:
		return "decomposition";
	}
	return "linear";
}

std::optional<ForecastModel> parseForecastModel(std::string_view name) {
	const auto tag = utils::normalizeTag(name);
	if (tag == "linear") {
		return ForecastModel::Linear;
	}
	if (tag == "exponential_smoothing" || tag == "holt_winters" || tag == "exponential") {
		return ForecastModel::ExponentialSmoothing;
	}
	if (tag == "decomposition") {
		return ForecastModel::Decomposition;
	}
	return std::nullopt;
}

ForecastModel forecastModelOrDefault(std::string_view name) {
	const auto model = parseForecastModel(name);
	if (!model) {
		ROWCAST_DEBUG("Unrecognized forecast model '{}', using linear.", std::string(name));
		return ForecastModel::Linear;
	}
	return *model;
}

} // namespace rowcast::engine
