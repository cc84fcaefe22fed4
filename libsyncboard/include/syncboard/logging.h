/**
 * @file logging.h
 * @brief Logger setup for SyncBoard
 *
 * All components log through spdlog's default logger; this header only
 * configures it.
 */

#ifndef SYNCBOARD_LOGGING_H
#define SYNCBOARD_LOGGING_H

#include "error.h"
#include "platform.h"
#include <string>

namespace syncboard {

/// Pattern used for every log line
constexpr const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

/**
 * @brief Check whether a level name is one spdlog understands
 *
 * Accepted: trace, debug, info, warn, error, critical, off.
 */
SYNCBOARD_API bool is_valid_log_level(const std::string &level);

/**
 * @brief Configure the default logger (colored stdout, pattern, level)
 * @param level One of the names accepted by is_valid_log_level()
 */
SYNCBOARD_API Result<void> init_logging(const std::string &level);

} // namespace syncboard

#endif // SYNCBOARD_LOGGING_H
