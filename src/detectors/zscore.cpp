#include "rowcast/detectors/zscore.hpp"
#include "rowcast/utils/logging.hpp"
#include "rowcast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rowcast::detectors {

ZScoreDetector::ZScoreDetector(double threshold) : threshold_(threshold) {
	if (!(threshold_ > 0.0) || !std::isfinite(threshold_)) {
		throw std::invalid_argument("Threshold must be positive.");
	}
}

AnomalyReport ZScoreDetector::detect(const std::vector<double> &values) const {
	AnomalyReport report;
	report.threshold = threshold_;
	if (values.empty()) {
		return report;
	}

	const double mean = utils::Statistics::mean(values);
	// A constant column is decided on the values, its computed deviation may be a rounding residue
	const auto range = std::minmax_element(values.begin(), values.end());
	const bool degenerate = *range.first == *range.second;
	const double std_dev = degenerate ? 0.0 : utils::Statistics::populationStdDev(values);
	if (degenerate) {
		ROWCAST_DEBUG("Values are constant. No anomalies will be detected.");
	}

	report.verdicts.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		ObservationVerdict verdict;
		verdict.value = values[i];
		verdict.lower_bound = mean - threshold_ * std_dev;
		verdict.upper_bound = mean + threshold_ * std_dev;
		if (!degenerate) {
			verdict.score = std::abs(values[i] - mean) / std_dev;
			verdict.is_anomaly = verdict.score > threshold_;
		}
		if (verdict.is_anomaly) {
			report.anomaly_indices.push_back(i);
		}
		report.verdicts.push_back(verdict);
	}

	ROWCAST_INFO("ZScoreDetector found {} anomalies.", report.anomaly_indices.size());
	return report;
}

// --- Builder Implementation ---

ZScoreDetectorBuilder &ZScoreDetectorBuilder::withThreshold(double threshold) {
	if (!(threshold > 0.0) || !std::isfinite(threshold)) {
		throw std::invalid_argument("Threshold must be positive.");
	}
	threshold_ = threshold;
	return *this;
}

ZScoreDetectorBuilder &ZScoreDetectorBuilder::withSensitivity(double sensitivity) {
	if (!(sensitivity > 0.0) || !std::isfinite(sensitivity)) {
		throw std::invalid_argument("Sensitivity must be positive.");
	}
	threshold_ = ZScoreDetector::kDefaultThreshold / sensitivity;
	return *this;
}

std::unique_ptr<ZScoreDetector> ZScoreDetectorBuilder::build() const {
	ROWCAST_DEBUG("Building ZScoreDetector with threshold {}.", threshold_);
	return std::unique_ptr<ZScoreDetector>(new ZScoreDetector(threshold_));
}

} // namespace rowcast::detectors
