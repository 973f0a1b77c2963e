#include "rowcast/models/seasonal_decomposition.hpp"
#include "rowcast/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace rowcast::models {

int SeasonalDecomposition::seasonLengthFor(std::size_t observations) {
	if (observations > 20) {
		return std::max(7, static_cast<int>(observations / 4));
	}
	return 7;
}

void SeasonalDecomposition::fit(const core::TimeSeries &ts) {
	if (ts.size() < 2) {
		throw std::invalid_argument("SeasonalDecomposition requires at least two observations.");
	}
	history_ = ts.getValues();
	const auto n = history_.size();

	// 1. Global trend
	trend_ = utils::LinearRegression::fitTrend(history_);

	// 2. Average the detrended series by phase
	const auto season_length = static_cast<std::size_t>(seasonLengthFor(n));
	std::vector<double> sums(season_length, 0.0);
	std::vector<std::size_t> counts(season_length, 0);
	for (std::size_t i = 0; i < n; ++i) {
		const auto phase = i % season_length;
		sums[phase] += history_[i] - trend_.at(static_cast<double>(i));
		++counts[phase];
	}
	pattern_.assign(season_length, 0.0);
	for (std::size_t p = 0; p < season_length; ++p) {
		if (counts[p] > 0) {
			pattern_[p] = sums[p] / static_cast<double>(counts[p]);
		}
	}

	fitted_.resize(n);
	for (std::size_t i = 0; i < n; ++i) {
		fitted_[i] = valueAt(i);
	}
	is_fitted_ = true;

	ROWCAST_INFO("SeasonalDecomposition fitted on {} points with season length {}.", n, season_length);
}

core::Forecast SeasonalDecomposition::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("SeasonalDecomposition::predict called before fit");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}

	core::Forecast forecast;
	auto &series = forecast.primary();
	series.reserve(static_cast<std::size_t>(horizon));

	const auto last_index = history_.size() - 1;
	for (int h = 1; h <= horizon; ++h) {
		series.push_back(valueAt(last_index + static_cast<std::size_t>(h)));
	}
	return forecast;
}

} // namespace rowcast::models
