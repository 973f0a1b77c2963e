#pragma once

#include "rowcast/clustering/kmeans.hpp"
#include "rowcast/core/dataset.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace rowcast::engine {

struct ClusterOptions {
	/// Feature columns, in the order used for centroid coordinates.
	std::vector<std::string> features;
	/// Number of clusters; must be positive.
	int k = 3;
	int max_iterations = 50;
	/// Summed centroid movement below which iteration stops.
	double tolerance = 1e-3;
};

struct ClusterAssignment {
	std::size_t index = 0;
	int cluster_id = 0;
	/// Euclidean distance to the assigned centroid in normalized feature space.
	double distance = 0.0;
};

struct ClusterResult {
	std::vector<ClusterAssignment> clusters;
	/// Centroids in min-max normalized feature space, one per cluster.
	std::vector<std::vector<double>> centroids;
	/// The same centroids mapped back to the original feature units.
	std::vector<std::vector<double>> centroids_original;
	/// Number of rows assigned to each cluster.
	std::vector<std::size_t> cluster_sizes;
	int iterations = 0;
	bool converged = false;
};

/**
 * @brief Partitions the rows of @p dataset into @p options.k clusters with K-Means.
 *
 * Features are coerced to numbers (non-numeric reads as 0) and min-max
 * normalized per column. With fewer rows than clusters every row is assigned
 * to cluster 0 at distance 0 and no centroids are reported.
 *
 * @param rng Random source for centroid initialization; seed it for reproducible output.
 * @throws std::invalid_argument if k, max_iterations or tolerance are out of range.
 */
ClusterResult cluster(const core::Dataset &dataset, const ClusterOptions &options, clustering::RandomEngine &rng);

/// cluster() with a generator seeded from std::random_device.
ClusterResult cluster(const core::Dataset &dataset, const ClusterOptions &options);

} // namespace rowcast::engine
