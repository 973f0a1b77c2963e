#pragma once

#include "rowcast/detectors/ianomaly_detector.hpp"
#include <memory>

namespace rowcast::detectors {

class IqrDetectorBuilder; // Forward declaration

/**
 * @class IqrDetector
 * @brief Tukey fences: flags values outside `[Q1 - k*IQR, Q3 + k*IQR]`.
 *
 * Quartiles interpolate linearly between order statistics of a sorted copy;
 * the verdicts keep the input order. The score is the distance beyond the
 * nearest quartile in IQR units, so a value is anomalous when its score
 * exceeds k.
 */
class IqrDetector final : public IAnomalyDetector {
public:
	friend class IqrDetectorBuilder;

	static constexpr double kDefaultMultiplier = 1.5;

	struct Quartiles {
		double q1 = 0.0;
		double q3 = 0.0;

		double range() const {
			return q3 - q1;
		}
	};

	/// First and third quartile of @p values (any order).
	static Quartiles quartiles(const std::vector<double> &values);

	AnomalyReport detect(const std::vector<double> &values) const override;
	std::string getName() const override {
		return "IqrDetector";
	}

	double multiplier() const {
		return multiplier_;
	}

private:
	explicit IqrDetector(double multiplier);

	double multiplier_;
};

/**
 * @class IqrDetectorBuilder
 * @brief A builder for fluently configuring and creating IqrDetector instances.
 */
class IqrDetectorBuilder {
public:
	/**
	 * @brief Sets the fence multiplier k.
	 * @throws std::invalid_argument if @p multiplier is not positive and finite.
	 */
	IqrDetectorBuilder &withMultiplier(double multiplier);

	std::unique_ptr<IqrDetector> build() const;

private:
	double multiplier_ = IqrDetector::kDefaultMultiplier;
};

} // namespace rowcast::detectors
