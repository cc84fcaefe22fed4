/**
 * @file logging.cpp
 * @brief spdlog configuration
 */

#include "syncboard/logging.h"
#include <array>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace syncboard {

bool is_valid_log_level(const std::string &level) {
  static const std::array<const char *, 7> names = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  for (const char *name : names) {
    if (level == name) {
      return true;
    }
  }
  return false;
}

Result<void> init_logging(const std::string &level) {
  if (!is_valid_log_level(level)) {
    return Error(ErrorCode::ConfigError, "Unknown log level", level);
  }

  try {
    auto logger = spdlog::stdout_color_mt("syncboard");
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex &) {
    // Already registered by an earlier call; keep using it
    auto existing = spdlog::get("syncboard");
    if (existing) {
      spdlog::set_default_logger(existing);
    }
  }

  spdlog::set_pattern(LOG_PATTERN);
  spdlog::set_level(spdlog::level::from_str(level));
  return Result<void>::ok();
}

} // namespace syncboard
