#pragma once

#include "rowcast/detectors/ianomaly_detector.hpp"
#include <memory>

namespace rowcast::detectors {

class ZScoreDetectorBuilder; // Forward declaration

/**
 * @class ZScoreDetector
 * @brief Flags values more than `threshold` population standard deviations from the mean.
 *
 * A constant series has zero deviation and never produces anomalies.
 */
class ZScoreDetector final : public IAnomalyDetector {
public:
	friend class ZScoreDetectorBuilder;

	static constexpr double kDefaultThreshold = 3.0;

	AnomalyReport detect(const std::vector<double> &values) const override;
	std::string getName() const override {
		return "ZScoreDetector";
	}

	double threshold() const {
		return threshold_;
	}

private:
	explicit ZScoreDetector(double threshold);

	double threshold_;
};

/**
 * @class ZScoreDetectorBuilder
 * @brief A builder for fluently configuring and creating ZScoreDetector instances.
 */
class ZScoreDetectorBuilder {
public:
	/**
	 * @brief Sets the z-score above which a value is anomalous.
	 * @throws std::invalid_argument if @p threshold is not positive and finite.
	 */
	ZScoreDetectorBuilder &withThreshold(double threshold);

	/**
	 * @brief Derives the threshold from a sensitivity factor: `3 / sensitivity`.
	 *
	 * Higher sensitivity lowers the threshold and flags more values.
	 * @throws std::invalid_argument if @p sensitivity is not positive and finite.
	 */
	ZScoreDetectorBuilder &withSensitivity(double sensitivity);

	std::unique_ptr<ZScoreDetector> build() const;

private:
	double threshold_ = ZScoreDetector::kDefaultThreshold;
};

} // namespace rowcast::detectors
