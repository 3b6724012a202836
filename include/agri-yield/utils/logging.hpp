#pragma once

#ifndef AGRIYIELD_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace agriyield::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the spdlog logger used by the pipeline.
 *
 * Every component logs through the same named logger so that a host process
 * can configure the level once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it on first use. Safe to call
	 *        from several threads at once.
	 * @return A reference to the shared pointer holding the logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static void create();

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace agriyield::utils

#define AGRIYIELD_TRACE(...)    agriyield::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define AGRIYIELD_DEBUG(...)    agriyield::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define AGRIYIELD_INFO(...)     agriyield::utils::Logging::getLogger()->info(__VA_ARGS__)
#define AGRIYIELD_WARN(...)     agriyield::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define AGRIYIELD_ERROR(...)    agriyield::utils::Logging::getLogger()->error(__VA_ARGS__)
#define AGRIYIELD_CRITICAL(...) agriyield::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when built without spdlog

namespace agriyield::utils {

class Logging {
public:
	static void init() {}
};

} // namespace agriyield::utils

#define AGRIYIELD_TRACE(...)    do {} while(0)
#define AGRIYIELD_DEBUG(...)    do {} while(0)
#define AGRIYIELD_INFO(...)     do {} while(0)
#define AGRIYIELD_WARN(...)     do {} while(0)
#define AGRIYIELD_ERROR(...)    do {} while(0)
#define AGRIYIELD_CRITICAL(...) do {} while(0)

#endif // AGRIYIELD_NO_LOGGING
