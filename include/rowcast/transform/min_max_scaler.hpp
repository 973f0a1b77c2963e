#pragma once

#include <Eigen/Dense>

namespace rowcast::transform {

/**
 * @class MinMaxScaler
 * @brief Column-wise rescaling of a feature matrix to [0, 1].
 *
 * Rows are observations and columns features. A column whose minimum equals
 * its maximum maps to 0 for every row.
 */
class MinMaxScaler {
public:
	MinMaxScaler() = default;

	/// Records the per-column minimum and maximum of @p data.
	void fit(const Eigen::MatrixXd &data);

	/// Rescales @p data with the fitted ranges.
	Eigen::MatrixXd transform(const Eigen::MatrixXd &data) const;

	/// Maps rescaled rows back to original units; constant columns map to their minimum.
	Eigen::MatrixXd inverseTransform(const Eigen::MatrixXd &scaled) const;

	Eigen::MatrixXd fitTransform(const Eigen::MatrixXd &data) {
		fit(data);
		return transform(data);
	}

	[[nodiscard]] bool isFitted() const noexcept {
		return is_fitted_;
	}

	const Eigen::RowVectorXd &minimum() const {
		return min_;
	}

	const Eigen::RowVectorXd &maximum() const {
		return max_;
	}

private:
	void ensureFitted() const;
	void ensureColumns(const Eigen::MatrixXd &data) const;

	Eigen::RowVectorXd min_;
	Eigen::RowVectorXd max_;
	bool is_fitted_ = false;
};

} // namespace rowcast::transform
