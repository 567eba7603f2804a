#pragma once

#include <spdlog/logger.h>
#include <memory>
#include <string_view>

namespace deductly::core::log {

/// Name of the shared spdlog logger.
inline constexpr const char* kLoggerName = "deductly";

/// Shared "deductly" logger (colored stderr). Registered on first use;
/// safe to call from any thread.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Set the level from a spdlog level name ("trace", "debug", "info", "warn",
/// "error", "critical", "off"). Unknown names leave the level unchanged and
/// return false.
bool set_level(std::string_view level_name);

}  // namespace deductly::core::log
