#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace quantforecast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every component of the forecasting pipeline logs through the same logger,
 * which can be configured once at startup by the embedding application.
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

} // namespace quantforecast::utils

// --- Logger Macros for convenient access ---
#define QUANT_TRACE(...)    quantforecast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define QUANT_DEBUG(...)    quantforecast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define QUANT_INFO(...)     quantforecast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define QUANT_WARN(...)     quantforecast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define QUANT_ERROR(...)    quantforecast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define QUANT_CRITICAL(...) quantforecast::utils::Logging::getLogger()->critical(__VA_ARGS__)
