#pragma once

#include "rowcast/utils/logging.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <limits>
#include <memory>
#include <random>
#include <vector>

namespace rowcast::clustering {

/// Seedable random source used for centroid initialization and reseeding.
using RandomEngine = std::mt19937;

/**
 * @struct KMeansState
 * @brief Centroids and assignments between two Lloyd iterations.
 */
struct KMeansState {
	/// One centroid per row (k x dimensions).
	Eigen::MatrixXd centroids;
	/// Cluster of each point, assigned against the centroids of the previous state.
	std::vector<int> labels;
	/// Euclidean distance of each point to the centroid it was assigned to.
	std::vector<double> distances;
	/// Summed Euclidean movement of all centroids in the last iteration.
	double movement = std::numeric_limits<double>::infinity();
	int iteration = 0;
};

/**
 * @struct KMeansResult
 * @brief Final partition of a K-Means run.
 */
struct KMeansResult {
	/// Assignments and distances computed against the final centroids.
	std::vector<int> labels;
	std::vector<double> distances;
	Eigen::MatrixXd centroids;
	std::vector<std::size_t> cluster_sizes;
	int iterations = 0;
	bool converged = false;
};

/**
 * @class KMeansClusterer
 * @brief Lloyd's K-Means with random initialization.
 *
 * Initial centroids are k distinct points drawn uniformly without replacement.
 * A cluster left without points is reseeded at a uniformly drawn point so the
 * number of clusters stays k. Iteration stops when the summed centroid movement
 * drops below the tolerance or after the iteration budget.
 */
class KMeansClusterer {
public:
	friend class KMeansBuilder;

	KMeansClusterer(const KMeansClusterer &) = delete;
	KMeansClusterer &operator=(const KMeansClusterer &) = delete;
	KMeansClusterer(KMeansClusterer &&) noexcept = default;
	KMeansClusterer &operator=(KMeansClusterer &&) noexcept = default;

	/**
	 * @brief Partitions the rows of @p points.
	 * @throws std::invalid_argument if there are fewer points than clusters.
	 */
	[[nodiscard]] KMeansResult cluster(const Eigen::MatrixXd &points, RandomEngine &rng) const;

	/**
	 * @brief Picks k distinct points as initial centroids.
	 */
	[[nodiscard]] KMeansState initialState(const Eigen::MatrixXd &points, RandomEngine &rng) const;

	/**
	 * @brief One Lloyd iteration: assign, recompute means, reseed empty clusters.
	 */
	[[nodiscard]] KMeansState step(const KMeansState &previous, const Eigen::MatrixXd &points,
	                               RandomEngine &rng) const;

	/**
	 * @brief Assigns every point to its nearest centroid.
	 */
	static void assign(const Eigen::MatrixXd &points, const Eigen::MatrixXd &centroids, std::vector<int> &labels,
	                   std::vector<double> &distances);

	int k() const noexcept {
		return k_;
	}

	int maxIterations() const noexcept {
		return max_iterations_;
	}

	double tolerance() const noexcept {
		return tolerance_;
	}

private:
	KMeansClusterer(int k, int max_iterations, double tolerance);

	int k_;
	int max_iterations_;
	double tolerance_;
};

/**
 * @class KMeansBuilder
 * @brief Fluent builder for configuring K-Means.
 */
class KMeansBuilder {
public:
	KMeansBuilder &withClusters(int k);
	KMeansBuilder &withMaxIterations(int max_iterations);
	KMeansBuilder &withTolerance(double tolerance);

	std::unique_ptr<KMeansClusterer> build() const;

private:
	int k_ = 2;
	int max_iterations_ = 50;
	double tolerance_ = 1e-3;
};

} // namespace rowcast::clustering
