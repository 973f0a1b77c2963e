#include "rowcast/transform/min_max_scaler.hpp"

#include <stdexcept>

namespace rowcast::transform {

void MinMaxScaler::fit(const Eigen::MatrixXd &data) {
	if (data.rows() == 0) {
		throw std::invalid_argument("MinMaxScaler cannot be fitted on an empty matrix");
	}
	min_ = data.colwise().minCoeff();
	max_ = data.colwise().maxCoeff();
	is_fitted_ = true;
}

Eigen::MatrixXd MinMaxScaler::transform(const Eigen::MatrixXd &data) const {
	ensureFitted();
	ensureColumns(data);

	Eigen::MatrixXd scaled(data.rows(), data.cols());
	for (Eigen::Index col = 0; col < data.cols(); ++col) {
		const double range = max_(col) - min_(col);
		if (range == 0.0) {
			scaled.col(col).setZero();
		} else {
			scaled.col(col) = (data.col(col).array() - min_(col)) / range;
		}
	}
	return scaled;
}

Eigen::MatrixXd MinMaxScaler::inverseTransform(const Eigen::MatrixXd &scaled) const {
	ensureFitted();
	ensureColumns(scaled);

	Eigen::MatrixXd data(scaled.rows(), scaled.cols());
	for (Eigen::Index col = 0; col < scaled.cols(); ++col) {
		const double range = max_(col) - min_(col);
		data.col(col) = scaled.col(col).array() * range + min_(col);
	}
	return data;
}

void MinMaxScaler::ensureFitted() const {
	if (!is_fitted_) {
		throw std::runtime_error("MinMaxScaler must be fitted before transform");
	}
}

void MinMaxScaler::ensureColumns(const Eigen::MatrixXd &data) const {
	if (data.cols() != min_.size()) {
		throw std::invalid_argument("MinMaxScaler column count does not match the fitted data");
	}
}

} // namespace rowcast::transform
