#include "event-stack/utils/logging.hpp"

#ifndef EVENTSTACK_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace eventstack::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("event-stack");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("event-stack");
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

} // namespace eventstack::utils

#endif // EVENTSTACK_NO_LOGGING
