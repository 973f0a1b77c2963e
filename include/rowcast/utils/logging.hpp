#pragma once

#ifndef ROWCAST_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace rowcast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every engine and model logs through one logger named "rowcast". An
 * application that registers its own spdlog logger under that name before
 * the first call keeps it; otherwise a colored stdout logger is created.
 *
 * What rowcast reports per level:
 * - info: one line per fitted model (LinearTrend, HoltWinters,
 *   SeasonalDecomposition) and per detector run with its anomaly count,
 *   the forecast summary, finished K-Means runs, and the Holt-Winters
 *   fallback to a linear model on short histories.
 * - debug: builder settings, unknown model or method tags replaced by their
 *   default, ignored sensitivities, cells coerced to zero or to the epoch,
 *   constant columns, the anomaly summary per method, reseeded empty
 *   clusters, datasets with fewer rows than clusters and forecasts skipped
 *   for lack of rows.
 * - trace: K-Means initialization and per-iteration centroid movement.
 *
 * Errors are thrown, never logged, so warn and above stay quiet.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace rowcast::utils

#define ROWCAST_TRACE(...)    rowcast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define ROWCAST_DEBUG(...)    rowcast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define ROWCAST_INFO(...)     rowcast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define ROWCAST_WARN(...)     rowcast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define ROWCAST_ERROR(...)    rowcast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define ROWCAST_CRITICAL(...) rowcast::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is disabled

namespace rowcast::utils {

class Logging {
public:
	static void init() {}
};

} // namespace rowcast::utils

#define ROWCAST_TRACE(...)    do {} while(0)
#define ROWCAST_DEBUG(...)    do {} while(0)
#define ROWCAST_INFO(...)     do {} while(0)
#define ROWCAST_WARN(...)     do {} while(0)
#define ROWCAST_ERROR(...)    do {} while(0)
#define ROWCAST_CRITICAL(...) do {} while(0)

#endif // ROWCAST_NO_LOGGING
