#pragma once

#include "rowcast/models/iforecaster.hpp"
#include "rowcast/utils/linear_regression.hpp"
#include <string>
#include <vector>

namespace rowcast::models {

/**
 * @brief Additive trend + seasonal decomposition forecaster
 *
 * y(t) = trend(t) + season(t mod s) + noise. The trend is one global least
 * squares line; the seasonal pattern is the per-phase mean of the detrended
 * series.
 */
class SeasonalDecomposition final : public IForecaster {
public:
	SeasonalDecomposition() = default;

	/**
	 * @brief Season length used for @p observations points.
	 *
	 * `max(7, n / 4)` for more than 20 points, otherwise 7.
	 */
	static int seasonLengthFor(std::size_t observations);

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "SeasonalDecomposition";
	}

	const std::vector<double> &fittedValues() const override {
		return fitted_;
	}

	const utils::LinearFit &trend() const {
		return trend_;
	}

	/// Mean detrended value per phase; phases without observations are 0.
	const std::vector<double> &seasonalPattern() const {
		return pattern_;
	}

protected:
	const std::vector<double> &history() const override {
		return history_;
	}

private:
	double valueAt(std::size_t index) const {
		return trend_.at(static_cast<double>(index)) + pattern_[index % pattern_.size()];
	}

	utils::LinearFit trend_;
	std::vector<double> pattern_;
	std::vector<double> history_;
	std::vector<double> fitted_;
	bool is_fitted_ = false;
};

} // namespace rowcast::models
