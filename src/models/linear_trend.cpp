#include "rowcast/models/linear_trend.hpp"
#include "rowcast/utils/logging.hpp"

#include <stdexcept>

namespace rowcast::models {

void LinearTrend::fit(const core::TimeSeries &ts) {
	if (ts.size() < 2) {
		throw std::invalid_argument("LinearTrend requires at least two observations.");
	}
	history_ = ts.getValues();
	line_ = utils::LinearRegression::fitTrend(history_);

	fitted_.resize(history_.size());
	for (std::size_t i = 0; i < history_.size(); ++i) {
		fitted_[i] = line_.at(static_cast<double>(i));
	}
	is_fitted_ = true;

	ROWCAST_INFO("LinearTrend fitted on {} points: slope={}, intercept={}", history_.size(), line_.slope,
	             line_.intercept);
}

core::Forecast LinearTrend::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("LinearTrend::predict called before fit");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}

	core::Forecast forecast;
	auto &series = forecast.primary();
	series.reserve(static_cast<std::size_t>(horizon));

	const auto last_index = static_cast<double>(history_.size() - 1);
	for (int h = 1; h <= horizon; ++h) {
		series.push_back(line_.at(last_index + h));
	}
	return forecast;
}

} // namespace rowcast::models
