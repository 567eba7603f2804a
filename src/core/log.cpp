#include <deductly/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <mutex>
#include <string>

namespace deductly::core::log {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (spdlog::get(kLoggerName) == nullptr) {
      auto created = spdlog::stderr_color_mt(kLoggerName);
      created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
  });
  return spdlog::get(kLoggerName);
}

bool set_level(std::string_view level_name) {
  const std::string name(level_name);
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"; only accept an explicit "off".
  if (level == spdlog::level::off && name != "off") {
    return false;
  }
  logger()->set_level(level);
  return true;
}

}  // namespace deductly::core::log
