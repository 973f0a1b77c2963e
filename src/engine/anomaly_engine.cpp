#include "rowcast/engine/anomaly_engine.hpp"
#include "rowcast/detectors/iqr.hpp"
#include "rowcast/detectors/zscore.hpp"
#include "rowcast/utils/logging.hpp"
#include "rowcast/utils/tags.hpp"

#include <cmath>
#include <stdexcept>

namespace rowcast::engine {

namespace {

bool usableSensitivity(const std::optional<double> &sensitivity) {
	return sensitivity && std::isfinite(*sensitivity) && *sensitivity > 0.0;
}

} // namespace

std::string toString(AnomalyMethod method) {
	switch (method) {
	case AnomalyMethod::ZScore:
		return "z-score";
	case AnomalyMethod::Iqr:
		return "iqr";
	}
	return "iqr";
}

std::optional<AnomalyMethod> parseAnomalyMethod(std::string_view name) {
	const auto tag = utils::normalizeTag(name);
	if (tag == "z_score" || tag == "zscore") {
		return AnomalyMethod::ZScore;
	}
	if (tag == "iqr") {
		return AnomalyMethod::Iqr;
	}
	return std::nullopt;
}

AnomalyMethod anomalyMethodOrDefault(std::string_view name) {
	const auto method = parseAnomalyMethod(name);
	if (!method) {
		ROWCAST_DEBUG("Unrecognized anomaly method '{}', using iqr.", std::string(name));
		return AnomalyMethod::Iqr;
	}
	return *method;
}

std::string toString(AnomalySeverity severity) {
	switch (severity) {
	case AnomalySeverity::None:
		return "none";
	case AnomalySeverity::Low:
		return "low";
	case AnomalySeverity::Medium:
		return "medium";
	case AnomalySeverity::High:
		return "high";
	}
	return "none";
}

AnomalySeverity classifySeverity(double score, double threshold) {
	if (score > threshold * 2.0) {
		return AnomalySeverity::High;
	}
	if (score > threshold * 1.5) {
		return AnomalySeverity::Medium;
	}
	if (score > threshold) {
		return AnomalySeverity::Low;
	}
	return AnomalySeverity::None;
}

std::unique_ptr<detectors::IAnomalyDetector> makeDetector(const AnomalyOptions &options) {
	const bool tuned = usableSensitivity(options.sensitivity);
	if (options.sensitivity && !tuned) {
		ROWCAST_DEBUG("Ignoring sensitivity {}, it must be positive.", *options.sensitivity);
	}

	switch (options.method) {
	case AnomalyMethod::ZScore: {
		detectors::ZScoreDetectorBuilder builder;
		if (tuned) {
			builder.withSensitivity(*options.sensitivity);
		}
		return builder.build();
	}
	case AnomalyMethod::Iqr: {
		detectors::IqrDetectorBuilder builder;
		if (tuned) {
			builder.withMultiplier(detectors::IqrDetector::kDefaultMultiplier / *options.sensitivity);
		}
		return builder.build();
	}
	}
	throw std::logic_error("Unhandled anomaly method");
}

std::vector<AnomalyResult> detectAnomalies(const core::Dataset &dataset, const AnomalyOptions &options) {
	std::vector<AnomalyResult> results;
	if (dataset.empty()) {
		return results;
	}

	const auto detector = makeDetector(options);
	const auto report = detector->detect(core::numericColumn(dataset, options.value_column));

	results.reserve(report.verdicts.size());
	for (std::size_t i = 0; i < report.verdicts.size(); ++i) {
		const auto &verdict = report.verdicts[i];
		AnomalyResult result;
		result.index = i;
		result.is_anomaly = verdict.is_anomaly;
		result.value = verdict.value;
		result.score = verdict.score;
		result.lower_bound = verdict.lower_bound;
		result.upper_bound = verdict.upper_bound;
		result.severity =
		    verdict.is_anomaly ? classifySeverity(verdict.score, report.threshold) : AnomalySeverity::None;
		// IQR flags strictly outside the fences; a flagged value always grades at least low
		if (verdict.is_anomaly && result.severity == AnomalySeverity::None) {
			result.severity = AnomalySeverity::Low;
		}
		results.push_back(result);
	}

	ROWCAST_DEBUG("{} detection over {} rows flagged {} anomalies.", toString(options.method), dataset.size(),
	              report.anomaly_indices.size());
	return results;
}

} // namespace rowcast::engine
