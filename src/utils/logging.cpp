#include "agri-yield/utils/logging.hpp"

#ifndef AGRIYIELD_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace agriyield::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {

std::once_flag logger_created;

} // namespace

void Logging::create() {
	std::call_once(logger_created, [] {
		logger_ = spdlog::get("agri-yield");
		if (!logger_) {
			logger_ = spdlog::stderr_color_mt("agri-yield");
			logger_->set_level(spdlog::level::info);
		}
		logger_->flush_on(spdlog::level::warn);
	});
}

void Logging::init(spdlog::level::level_enum level) {
	create();
	logger_->set_level(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	create();
	return logger_;
}

} // namespace agriyield::utils

#endif // AGRIYIELD_NO_LOGGING
