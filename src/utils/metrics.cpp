#include "rowcast/utils/metrics.hpp"
#include <numeric>

namespace rowcast::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);

	const double mean_actual = std::accumulate(actual.begin(), actual.end(), 0.0) / static_cast<double>(actual.size());

	double ss_res = 0.0;
	double ss_tot = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff_res = actual[i] - predicted[i];
		ss_res += diff_res * diff_res;

		const double diff_tot = actual[i] - mean_actual;
		ss_tot += diff_tot * diff_tot;
	}

	if (std::abs(ss_tot) < std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}

	return 1.0 - (ss_res / ss_tot);
}

AccuracyMetrics Metrics::evaluate(const std::vector<double> &actual, const std::vector<double> &predicted) {
	AccuracyMetrics metrics;
	metrics.n = actual.size();
	metrics.mae = mae(actual, predicted);
	metrics.mse = mse(actual, predicted);
	metrics.rmse = std::sqrt(metrics.mse);
	metrics.r_squared = r2(actual, predicted);
	return metrics;
}

} // namespace rowcast::utils
