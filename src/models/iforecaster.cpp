#include "rowcast/models/iforecaster.hpp"
#include "rowcast/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>

namespace rowcast::models {

std::vector<double> IForecaster::residuals() const {
	const auto &actual = history();
	const auto &fitted = fittedValues();
	if (actual.size() != fitted.size()) {
		throw std::runtime_error("Residuals requested before fit.");
	}
	std::vector<double> result(actual.size());
	for (std::size_t i = 0; i < actual.size(); ++i) {
		result[i] = actual[i] - fitted[i];
	}
	return result;
}

utils::AccuracyMetrics IForecaster::score() const {
	return utils::Metrics::evaluate(history(), fittedValues());
}

core::Forecast IForecaster::predictWithConfidence(int horizon, double confidence) {
	if (!(confidence > 0.0 && confidence < 1.0)) {
		throw std::invalid_argument("Confidence level must be between 0 and 1");
	}

	auto forecast = predict(horizon);
	if (forecast.empty()) {
		return forecast;
	}

	const auto errors = residuals();
	double sum_sq = 0.0;
	for (double e : errors) {
		sum_sq += e * e;
	}
	const double sigma = errors.empty() ? 0.0 : std::sqrt(sum_sq / static_cast<double>(errors.size()));
	const double z = utils::Statistics::normalQuantile(1.0 - (1.0 - confidence) / 2.0);

	auto &lower = forecast.lowerSeries();
	auto &upper = forecast.upperSeries();
	lower.resize(forecast.horizon());
	upper.resize(forecast.horizon());

	// Uncertainty grows with the square root of the horizon
	for (std::size_t h = 0; h < forecast.horizon(); ++h) {
		const double half_width = z * sigma * std::sqrt(static_cast<double>(h + 1));
		lower[h] = forecast.point[h] - half_width;
		upper[h] = forecast.point[h] + half_width;
	}

	return forecast;
}

} // namespace rowcast::models
