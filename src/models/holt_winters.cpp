#include "rowcast/models/holt_winters.hpp"
#include "rowcast/utils/logging.hpp"
#include <stdexcept>

namespace rowcast::models {

namespace {

void validateSmoothing(double value, const char *name) {
	if (!(value >= 0.0 && value <= 1.0)) {
		throw std::invalid_argument(std::string("HoltWinters ") + name + " must be in [0, 1].");
	}
}

} // namespace

HoltWinters::HoltWinters(int seasonal_period, Params params)
    : seasonal_period_(seasonal_period), params_(params) {
	if (seasonal_period_ < 2) {
		throw std::invalid_argument("Seasonal period must be >= 2 for Holt-Winters");
	}
	validateSmoothing(params_.alpha, "alpha");
	validateSmoothing(params_.beta, "beta");
	validateSmoothing(params_.gamma, "gamma");
}

std::optional<int> HoltWinters::seasonLengthFor(std::size_t observations) {
	if (observations >= 24) {
		return 12;
	}
	if (observations >= 14) {
		return 7;
	}
	return std::nullopt;
}

HoltWinters::State HoltWinters::initialState(const std::vector<double> &values, int season_length) {
	const auto s = static_cast<std::size_t>(season_length);
	if (season_length < 2 || values.size() < s) {
		throw std::invalid_argument("Initial Holt-Winters state needs one full season of data.");
	}

	State state;
	state.level = values[0];
	state.trend = values[1] - values[0];

	double season_mean = 0.0;
	for (std::size_t i = 0; i < s; ++i) {
		season_mean += values[i];
	}
	season_mean /= static_cast<double>(s);

	state.seasonal.reserve(s);
	for (std::size_t i = 0; i < s; ++i) {
		state.seasonal.push_back(values[i] - season_mean);
	}
	return state;
}

HoltWinters::State HoltWinters::step(const State &previous, double observation, const Params &params) {
	const std::size_t phase = previous.observed % previous.seasonal.size();
	const double seasonal = previous.seasonal[phase];

	State next = previous;
	next.level = params.alpha * (observation - seasonal) + (1.0 - params.alpha) * (previous.level + previous.trend);
	next.trend = params.beta * (next.level - previous.level) + (1.0 - params.beta) * previous.trend;
	next.seasonal[phase] = params.gamma * (observation - next.level) + (1.0 - params.gamma) * seasonal;
	next.observed = previous.observed + 1;
	return next;
}

void HoltWinters::fit(const core::TimeSeries &ts) {
	const auto required = 2 * static_cast<std::size_t>(seasonal_period_);
	if (ts.size() < required) {
		throw std::invalid_argument("HoltWinters requires at least two full seasons of data.");
	}

	history_ = ts.getValues();
	fitted_.clear();
	fitted_.reserve(history_.size());

	State state = initialState(history_, seasonal_period_);
	for (double observation : history_) {
		fitted_.push_back(state.nextPrediction());
		state = step(state, observation, params_);
	}
	state_ = std::move(state);
	is_fitted_ = true;

	ROWCAST_INFO("HoltWinters model fitted with additive seasonality, period={}, alpha={}, beta={}, gamma={}",
	             seasonal_period_, params_.alpha, params_.beta, params_.gamma);
}

core::Forecast HoltWinters::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("HoltWinters::predict called before fit");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}

	core::Forecast forecast;
	auto &series = forecast.primary();
	series.reserve(static_cast<std::size_t>(horizon));

	const auto n = history_.size();
	const auto s = state_.seasonal.size();
	for (int h = 1; h <= horizon; ++h) {
		const std::size_t phase = (n + static_cast<std::size_t>(h) - 1) % s;
		series.push_back(state_.level + h * state_.trend + state_.seasonal[phase]);
	}
	return forecast;
}

const HoltWinters::State &HoltWinters::state() const {
	if (!is_fitted_) {
		throw std::runtime_error("HoltWinters::state called before fit");
	}
	return state_;
}

// --- Builder Implementation ---

HoltWintersBuilder &HoltWintersBuilder::withSeasonalPeriod(int period) {
	if (period < 2) {
		throw std::invalid_argument("Seasonal period must be >= 2 for Holt-Winters");
	}
	seasonal_period_ = period;
	return *this;
}

HoltWintersBuilder &HoltWintersBuilder::withAlpha(double alpha) {
	validateSmoothing(alpha, "alpha");
	params_.alpha = alpha;
	return *this;
}

HoltWintersBuilder &HoltWintersBuilder::withBeta(double beta) {
	validateSmoothing(beta, "beta");
	params_.beta = beta;
	return *this;
}

HoltWintersBuilder &HoltWintersBuilder::withGamma(double gamma) {
	validateSmoothing(gamma, "gamma");
	params_.gamma = gamma;
	return *this;
}

HoltWintersBuilder &HoltWintersBuilder::withParams(const HoltWinters::Params &params) {
	validateSmoothing(params.alpha, "alpha");
	validateSmoothing(params.beta, "beta");
	validateSmoothing(params.gamma, "gamma");
	params_ = params;
	return *this;
}

std::unique_ptr<HoltWinters> HoltWintersBuilder::build() const {
	ROWCAST_DEBUG("Building HoltWinters model with period {}.", seasonal_period_);
	return std::unique_ptr<HoltWinters>(new HoltWinters(seasonal_period_, params_));
}

} // namespace rowcast::models
