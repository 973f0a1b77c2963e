#include "rowcast/utils/logging.hpp"

#ifndef ROWCAST_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rowcast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("rowcast");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("rowcast");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace rowcast::utils

#endif // ROWCAST_NO_LOGGING
