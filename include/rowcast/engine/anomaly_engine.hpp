#pragma once

#include "rowcast/core/dataset.hpp"
#include "rowcast/detectors/ianomaly_detector.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rowcast::engine {

enum class AnomalyMethod {
	ZScore,
	Iqr
};

/// Canonical tag of @p method: "z-score" or "iqr".
std::string toString(AnomalyMethod method);

/// Parses "z-score" (also "zscore", "z_score") or "iqr", ignoring case.
std::optional<AnomalyMethod> parseAnomalyMethod(std::string_view name);

/// parseAnomalyMethod() falling back to AnomalyMethod::Iqr.
AnomalyMethod anomalyMethodOrDefault(std::string_view name);

enum class AnomalySeverity {
	None,
	Low,
	Medium,
	High
};

std::string toString(AnomalySeverity severity);

/**
 * @brief Grades a score against the detector threshold.
 *
 * Above twice the threshold is high, above 1.5 times is medium, above the
 * threshold is low.
 */
AnomalySeverity classifySeverity(double score, double threshold);

struct AnomalyOptions {
	std::string value_column;
	AnomalyMethod method = AnomalyMethod::Iqr;
	/**
	 * Scales both methods the same way: above 1 flags more rows, below 1 fewer.
	 * Z-score threshold becomes 3 / sensitivity, IQR fence multiplier becomes
	 * 1.5 / sensitivity. Ignored unless positive and finite.
	 */
	std::optional<double> sensitivity;
};

struct AnomalyResult {
	std::size_t index = 0;
	bool is_anomaly = false;
	double value = 0.0;
	double score = 0.0;
	double lower_bound = 0.0;
	double upper_bound = 0.0;
	AnomalySeverity severity = AnomalySeverity::None;
};

/**
 * @brief Builds the detector configured by @p options.
 */
std::unique_ptr<detectors::IAnomalyDetector> makeDetector(const AnomalyOptions &options);

/**
 * @brief Classifies every row of @p dataset, in row order.
 *
 * Non-numeric values read as 0. An empty dataset yields an empty result.
 */
std::vector<AnomalyResult> detectAnomalies(const core::Dataset &dataset, const AnomalyOptions &options);

} // namespace rowcast::engine
