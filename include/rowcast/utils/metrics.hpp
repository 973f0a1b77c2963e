#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace rowcast::utils {

/// In-sample goodness of fit of a forecasting model.
struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	std::optional<double> r_squared;
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	/// Coefficient of determination; std::nullopt for a constant @p actual.
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);

	static AccuracyMetrics evaluate(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace rowcast::utils
