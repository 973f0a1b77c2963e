#include "rowcast/engine/cluster_engine.hpp"
#include "rowcast/transform/min_max_scaler.hpp"
#include "rowcast/utils/logging.hpp"

namespace rowcast::engine {

namespace {

Eigen::MatrixXd toMatrix(const core::FeatureRows &rows, std::size_t dimensions) {
	Eigen::MatrixXd matrix(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(dimensions));
	for (std::size_t i = 0; i < rows.size(); ++i) {
		for (std::size_t j = 0; j < dimensions; ++j) {
			matrix(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
		}
	}
	return matrix;
}

std::vector<std::vector<double>> toRows(const Eigen::MatrixXd &matrix) {
	std::vector<std::vector<double>> rows(static_cast<std::size_t>(matrix.rows()));
	for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
		auto &row = rows[static_cast<std::size_t>(i)];
		row.resize(static_cast<std::size_t>(matrix.cols()));
		for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
			row[static_cast<std::size_t>(j)] = matrix(i, j);
		}
	}
	return rows;
}

} // namespace

ClusterResult cluster(const core::Dataset &dataset, const ClusterOptions &options, clustering::RandomEngine &rng) {
	// Validates k, max_iterations and tolerance before any data is touched
	const auto clusterer = clustering::KMeansBuilder()
	                           .withClusters(options.k)
	                           .withMaxIterations(options.max_iterations)
	                           .withTolerance(options.tolerance)
	                           .build();

	ClusterResult result;
	if (dataset.size() < static_cast<std::size_t>(options.k)) {
		ROWCAST_DEBUG("{} rows cannot form {} clusters. Assigning every row to cluster 0.", dataset.size(),
		              options.k);
		result.clusters.reserve(dataset.size());
		for (std::size_t i = 0; i < dataset.size(); ++i) {
			result.clusters.push_back({i, 0, 0.0});
		}
		return result;
	}

	const auto raw = toMatrix(core::featureMatrix(dataset, options.features), options.features.size());
	transform::MinMaxScaler scaler;
	const Eigen::MatrixXd normalized = scaler.fitTransform(raw);

	const auto partition = clusterer->cluster(normalized, rng);

	result.clusters.reserve(dataset.size());
	for (std::size_t i = 0; i < dataset.size(); ++i) {
		result.clusters.push_back({i, partition.labels[i], partition.distances[i]});
	}
	result.centroids = toRows(partition.centroids);
	result.centroids_original = toRows(scaler.inverseTransform(partition.centroids));
	result.cluster_sizes = partition.cluster_sizes;
	result.iterations = partition.iterations;
	result.converged = partition.converged;
	return result;
}

ClusterResult cluster(const core::Dataset &dataset, const ClusterOptions &options) {
	std::random_device device;
	clustering::RandomEngine rng(device());
	return cluster(dataset, options, rng);
}

} // namespace rowcast::engine
