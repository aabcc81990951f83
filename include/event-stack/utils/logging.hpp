#pragma once

#ifndef EVENTSTACK_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace eventstack::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every engine instance shares the same logger so advisories from several
 * charts end up in one stream, which can be configured at startup.
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

} // namespace eventstack::utils

#define EVENTSTACK_TRACE(...)    eventstack::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define EVENTSTACK_DEBUG(...)    eventstack::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define EVENTSTACK_INFO(...)     eventstack::utils::Logging::getLogger()->info(__VA_ARGS__)
#define EVENTSTACK_WARN(...)     eventstack::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define EVENTSTACK_ERROR(...)    eventstack::utils::Logging::getLogger()->error(__VA_ARGS__)
#define EVENTSTACK_CRITICAL(...) eventstack::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is not available

namespace eventstack::utils {

class Logging {
public:
	static void init() {}
};

} // namespace eventstack::utils

#define EVENTSTACK_TRACE(...)    do {} while(0)
#define EVENTSTACK_DEBUG(...)    do {} while(0)
#define EVENTSTACK_INFO(...)     do {} while(0)
#define EVENTSTACK_WARN(...)     do {} while(0)
#define EVENTSTACK_ERROR(...)    do {} while(0)
#define EVENTSTACK_CRITICAL(...) do {} while(0)

#endif // EVENTSTACK_NO_LOGGING
