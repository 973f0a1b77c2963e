#include "rowcast/clustering/kmeans.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

using rowcast::utils::Logging;

namespace rowcast::clustering {

namespace {

Eigen::Index drawRow(Eigen::Index rows, RandomEngine &rng) {
	std::uniform_int_distribution<Eigen::Index> pick(0, rows - 1);
	return pick(rng);
}

} // namespace

KMeansClusterer::KMeansClusterer(int k, int max_iterations, double tolerance)
    : k_(k), max_iterations_(max_iterations), tolerance_(tolerance) {}

void KMeansClusterer::assign(const Eigen::MatrixXd &points, const Eigen::MatrixXd &centroids,
                             std::vector<int> &labels, std::vector<double> &distances) {
	const auto n = static_cast<std::size_t>(points.rows());
	labels.assign(n, 0);
	distances.assign(n, 0.0);
	for (Eigen::Index i = 0; i < points.rows(); ++i) {
		double best = std::numeric_limits<double>::infinity();
		int best_cluster = 0;
		for (Eigen::Index c = 0; c < centroids.rows(); ++c) {
			const double dist = (points.row(i) - centroids.row(c)).norm();
			if (dist < best) {
				best = dist;
				best_cluster = static_cast<int>(c);
			}
		}
		labels[static_cast<std::size_t>(i)] = best_cluster;
		distances[static_cast<std::size_t>(i)] = best;
	}
}

KMeansState KMeansClusterer::initialState(const Eigen::MatrixXd &points, RandomEngine &rng) const {
	const auto n = static_cast<std::size_t>(points.rows());
	const auto k = static_cast<std::size_t>(k_);
	if (n < k) {
		throw std::invalid_argument("K-Means requires at least as many points as clusters");
	}

	// Partial Fisher-Yates shuffle: the first k slots become a uniform sample without replacement
	std::vector<std::size_t> order(n);
	std::iota(order.begin(), order.end(), std::size_t{0});
	for (std::size_t i = 0; i < k; ++i) {
		std::uniform_int_distribution<std::size_t> pick(i, n - 1);
		std::swap(order[i], order[pick(rng)]);
	}

	KMeansState state;
	state.centroids.resize(k_, points.cols());
	for (std::size_t c = 0; c < k; ++c) {
		state.centroids.row(static_cast<Eigen::Index>(c)) = points.row(static_cast<Eigen::Index>(order[c]));
	}
	return state;
}

KMeansState KMeansClusterer::step(const KMeansState &previous, const Eigen::MatrixXd &points,
                                  RandomEngine &rng) const {
	KMeansState next;
	assign(points, previous.centroids, next.labels, next.distances);

	Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(k_, points.cols());
	std::vector<std::size_t> counts(static_cast<std::size_t>(k_), 0);
	for (Eigen::Index i = 0; i < points.rows(); ++i) {
		const int label = next.labels[static_cast<std::size_t>(i)];
		sums.row(label) += points.row(i);
		++counts[static_cast<std::size_t>(label)];
	}

	next.centroids.resize(k_, points.cols());
	for (int c = 0; c < k_; ++c) {
		const auto count = counts[static_cast<std::size_t>(c)];
		if (count > 0) {
			next.centroids.row(c) = sums.row(c) / static_cast<double>(count);
		} else {
			const auto row = drawRow(points.rows(), rng);
			next.centroids.row(c) = points.row(row);
			ROWCAST_DEBUG("K-Means cluster {} is empty, reseeded at point {}", c, row);
		}
	}

	next.movement = 0.0;
	for (int c = 0; c < k_; ++c) {
		next.movement += (next.centroids.row(c) - previous.centroids.row(c)).norm();
	}
	next.iteration = previous.iteration + 1;
	return next;
}

KMeansResult KMeansClusterer::cluster(const Eigen::MatrixXd &points, RandomEngine &rng) const {
#ifndef ROWCAST_NO_LOGGING
	auto logger = Logging::getLogger();
	if (logger->should_log(spdlog::level::trace)) {
		logger->trace("K-Means start: k={} max_iterations={} tolerance={} points={} dimensions={}", k_,
		              max_iterations_, tolerance_, points.rows(), points.cols());
	}
#endif

	KMeansState state = initialState(points, rng);
	KMeansResult result;
	while (state.iteration < max_iterations_) {
		state = step(state, points, rng);
#ifndef ROWCAST_NO_LOGGING
		if (logger->should_log(spdlog::level::trace)) {
			logger->trace("K-Means iteration {}: centroid movement {}", state.iteration, state.movement);
		}
#endif
		if (state.movement < tolerance_) {
			result.converged = true;
			break;
		}
	}

	result.iterations = state.iteration;
	result.centroids = std::move(state.centroids);
	assign(points, result.centroids, result.labels, result.distances);

	result.cluster_sizes.assign(static_cast<std::size_t>(k_), 0);
	for (int label : result.labels) {
		++result.cluster_sizes[static_cast<std::size_t>(label)];
	}

	ROWCAST_INFO("K-Means finished after {} iterations ({}).", result.iterations,
	             result.converged ? "converged" : "iteration limit reached");
	return result;
}

KMeansBuilder &KMeansBuilder::withClusters(int k) {
	if (k < 1) {
		throw std::invalid_argument("k must be at least 1");
	}
	k_ = k;
	return *this;
}

KMeansBuilder &KMeansBuilder::withMaxIterations(int max_iterations) {
	if (max_iterations < 1) {
		throw std::invalid_argument("max_iterations must be at least 1");
	}
	max_iterations_ = max_iterations;
	return *this;
}

KMeansBuilder &KMeansBuilder::withTolerance(double tolerance) {
	if (!(tolerance >= 0.0) || !std::isfinite(tolerance)) {
		throw std::invalid_argument("tolerance must be non-negative");
	}
	tolerance_ = tolerance;
	return *this;
}

std::unique_ptr<KMeansClusterer> KMeansBuilder::build() const {
	ROWCAST_DEBUG("Building K-Means with k={} max_iterations={} tolerance={}.", k_, max_iterations_, tolerance_);
	return std::unique_ptr<KMeansClusterer>(new KMeansClusterer(k_, max_iterations_, tolerance_));
}

} // namespace rowcast::clustering
