#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rowcast::detectors {

/**
 * @struct ObservationVerdict
 * @brief Classification of a single observation.
 */
struct ObservationVerdict {
	double value = 0.0;
	/// How far the value lies from the bulk of the data, in the detector's own units.
	double score = 0.0;
	/// Values strictly outside [lower_bound, upper_bound] are anomalous.
	double lower_bound = 0.0;
	double upper_bound = 0.0;
	bool is_anomaly = false;
};

/**
 * @struct AnomalyReport
 * @brief Holds the results of an anomaly detection operation.
 */
struct AnomalyReport {
	/// One verdict per input observation, in input order.
	std::vector<ObservationVerdict> verdicts;

	/// Positions of the anomalous observations in the original series.
	std::vector<std::size_t> anomaly_indices;

	/// Score above which an observation is anomalous.
	double threshold = 0.0;
};

/**
 * @class IAnomalyDetector
 * @brief An interface for all anomaly detection algorithms.
 */
class IAnomalyDetector {
public:
	virtual ~IAnomalyDetector() = default;

	/**
	 * @brief Classifies every observation of @p values.
	 * @return A report with one verdict per observation.
	 */
	virtual AnomalyReport detect(const std::vector<double> &values) const = 0;

	/**
	 * @brief Gets the name of the detector.
	 */
	virtual std::string getName() const = 0;
};

} // namespace rowcast::detectors
