#include "timecast/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace timecast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;
std::once_flag Logging::once_;

void Logging::create() {
	logger_ = spdlog::get("timecast");
	if (!logger_) {
		logger_ = spdlog::stdout_color_mt("timecast");
	}
	logger_->set_level(spdlog::level::info);
	logger_->flush_on(spdlog::level::info);
}

void Logging::init(spdlog::level::level_enum level) {
	auto &logger = getLogger();
	logger->set_level(level);
	logger->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	std::call_once(once_, &Logging::create);
	return logger_;
}

} // namespace timecast::utils
