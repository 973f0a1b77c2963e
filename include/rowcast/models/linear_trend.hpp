#pragma once

#include "rowcast/models/iforecaster.hpp"
#include "rowcast/utils/linear_regression.hpp"
#include <string>
#include <vector>

namespace rowcast::models {

/**
 * @brief Ordinary least squares trend line
 *
 * Regresses the values on their position index and extrapolates the line:
 * step h ahead of a series of n observations is `slope * (n - 1 + h) + intercept`.
 */
class LinearTrend final : public IForecaster {
public:
	LinearTrend() = default;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "LinearTrend";
	}

	const std::vector<double> &fittedValues() const override {
		return fitted_;
	}

	double slope() const {
		return line_.slope;
	}

	double intercept() const {
		return line_.intercept;
	}

protected:
	const std::vector<double> &history() const override {
		return history_;
	}

private:
	utils::LinearFit line_;
	std::vector<double> history_;
	std::vector<double> fitted_;
	bool is_fitted_ = false;
};

} // namespace rowcast::models
