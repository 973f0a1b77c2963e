#pragma once

#include "rowcast/models/iforecaster.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rowcast::models {

class HoltWintersBuilder; // Forward declaration

/**
 * @brief Holt-Winters Seasonal Method (additive seasonality)
 *
 * Triple exponential smoothing with fixed smoothing constants. The state is
 * seeded from the first season (level = y0, trend = y1 - y0, seasonal indices
 * = first season minus its mean) and updated once per observation by step().
 *
 * Needs at least two full seasons of history.
 */
class HoltWinters final : public IForecaster {
public:
	friend class HoltWintersBuilder;

	struct Params {
		double alpha = 0.5; ///< level smoothing
		double beta = 0.4;  ///< trend smoothing
		double gamma = 0.6; ///< seasonal smoothing
	};

	/// Smoothing state after consuming `observed` observations.
	struct State {
		double level = 0.0;
		double trend = 0.0;
		std::vector<double> seasonal;
		std::size_t observed = 0;

		/// One-step-ahead prediction from this state.
		double nextPrediction() const {
			return level + trend + seasonal[observed % seasonal.size()];
		}
	};

	/**
	 * @brief Season length the heuristic picks for @p observations points.
	 *
	 * 12 (monthly cadence) from 24 points, 7 (weekly cadence) from 14 points,
	 * otherwise none: the series is too short to support seasonality.
	 */
	static std::optional<int> seasonLengthFor(std::size_t observations);

	/// Initial state seeded from the first season of @p values.
	static State initialState(const std::vector<double> &values, int season_length);

	/**
	 * @brief Applies the additive recurrences for one observation.
	 *
	 * The trend update reads the previous level, the seasonal update reads the
	 * freshly updated level.
	 */
	static State step(const State &previous, double observation, const Params &params);

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "HoltWinters";
	}

	const std::vector<double> &fittedValues() const override {
		return fitted_;
	}

	int seasonalPeriod() const {
		return seasonal_period_;
	}

	const Params &params() const {
		return params_;
	}

	/// Final smoothing state; throws before fit.
	const State &state() const;

protected:
	const std::vector<double> &history() const override {
		return history_;
	}

private:
	HoltWinters(int seasonal_period, Params params);

	int seasonal_period_;
	Params params_;
	State state_;
	std::vector<double> history_;
	std::vector<double> fitted_;
	bool is_fitted_ = false;
};

/**
 * @class HoltWintersBuilder
 * @brief A builder for fluently configuring and creating HoltWinters models.
 */
class HoltWintersBuilder {
public:
	/**
	 * @brief Sets the season length (observations per cycle).
	 * @throws std::invalid_argument if @p period < 2.
	 */
	HoltWintersBuilder &withSeasonalPeriod(int period);

	/// @throws std::invalid_argument if @p alpha is outside [0, 1].
	HoltWintersBuilder &withAlpha(double alpha);

	/// @throws std::invalid_argument if @p beta is outside [0, 1].
	HoltWintersBuilder &withBeta(double beta);

	/// @throws std::invalid_argument if @p gamma is outside [0, 1].
	HoltWintersBuilder &withGamma(double gamma);

	HoltWintersBuilder &withParams(const HoltWinters::Params &params);

	std::unique_ptr<HoltWinters> build() const;

private:
	int seasonal_period_ = 7;
	HoltWinters::Params params_;
};

} // namespace rowcast::models
