#include "rowcast/utils/linear_regression.hpp"

#include <Eigen/Dense>

#include <stdexcept>

namespace rowcast::utils {
namespace LinearRegression {

LinearFit fit(const std::vector<double> &x, const std::vector<double> &y) {
	if (x.size() != y.size()) {
		throw std::invalid_argument("Regression inputs must have the same length.");
	}
	const auto n = static_cast<Eigen::Index>(y.size());
	if (n < 2) {
		throw std::invalid_argument("Linear regression requires at least two observations.");
	}

	// Design matrix [1, x]
	Eigen::MatrixXd design(n, 2);
	Eigen::VectorXd target(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		design(i, 0) = 1.0;
		design(i, 1) = x[static_cast<std::size_t>(i)];
		target(i) = y[static_cast<std::size_t>(i)];
	}

	const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
	if (qr.rank() < 2) {
		throw std::invalid_argument("Regressor must not be constant.");
	}
	const Eigen::VectorXd beta = qr.solve(target);

	LinearFit result;
	result.intercept = beta(0);
	result.slope = beta(1);
	return result;
}

LinearFit fitTrend(const std::vector<double> &y) {
	std::vector<double> index(y.size());
	for (std::size_t i = 0; i < y.size(); ++i) {
		index[i] = static_cast<double>(i);
	}
	return fit(index, y);
}

} // namespace LinearRegression
} // namespace rowcast::utils
