#include "rowcast/detectors/iqr.hpp"
#include "rowcast/utils/logging.hpp"
#include "rowcast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace rowcast::detectors {

IqrDetector::IqrDetector(double multiplier) : multiplier_(multiplier) {
	if (!(multiplier_ > 0.0) || !std::isfinite(multiplier_)) {
		throw std::invalid_argument("Fence multiplier must be positive.");
	}
}

IqrDetector::Quartiles IqrDetector::quartiles(const std::vector<double> &values) {
	std::vector<double> sorted = values;
	std::sort(sorted.begin(), sorted.end());
	Quartiles result;
	result.q1 = utils::Statistics::sortedQuantile(sorted, 0.25);
	result.q3 = utils::Statistics::sortedQuantile(sorted, 0.75);
	return result;
}

AnomalyReport IqrDetector::detect(const std::vector<double> &values) const {
	AnomalyReport report;
	report.threshold = multiplier_;
	if (values.empty()) {
		return report;
	}

	const auto q = quartiles(values);
	const double iqr = q.range();
	const double lower = q.q1 - multiplier_ * iqr;
	const double upper = q.q3 + multiplier_ * iqr;

	report.verdicts.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		const double value = values[i];
		ObservationVerdict verdict;
		verdict.value = value;
		verdict.lower_bound = lower;
		verdict.upper_bound = upper;
		verdict.is_anomaly = value < lower || value > upper;

		double beyond = 0.0;
		if (value < q.q1) {
			beyond = q.q1 - value;
		} else if (value > q.q3) {
			beyond = value - q.q3;
		}
		if (iqr > 0.0) {
			verdict.score = beyond / iqr;
		} else if (beyond > 0.0) {
			verdict.score = std::numeric_limits<double>::infinity();
		}

		if (verdict.is_anomaly) {
			report.anomaly_indices.push_back(i);
		}
		report.verdicts.push_back(verdict);
	}

	ROWCAST_INFO("IqrDetector found {} anomalies (Q1={}, Q3={}).", report.anomaly_indices.size(), q.q1, q.q3);
	return report;
}

// --- Builder Implementation ---

IqrDetectorBuilder &IqrDetectorBuilder::withMultiplier(double multiplier) {
	if (!(multiplier > 0.0) || !std::isfinite(multiplier)) {
		throw std::invalid_argument("Fence multiplier must be positive.");
	}
	multiplier_ = multiplier;
	return *this;
}

std::unique_ptr<IqrDetector> IqrDetectorBuilder::build() const {
	ROWCAST_DEBUG("Building IqrDetector with multiplier {}.", multiplier_);
	return std::unique_ptr<IqrDetector>(new IqrDetector(multiplier_));
}

} // namespace rowcast::detectors
