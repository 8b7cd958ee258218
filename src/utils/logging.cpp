#include "quant-forecast/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace quantforecast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("quant-forecast");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("quant-forecast");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// Initialize with default level if not already done.
		init();
	}
	return logger_;
}

} // namespace quantforecast::utils
