#include <tdr/log.hpp>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tdr::log {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> lg;
  std::call_once(once, [] {
    lg = spdlog::get("tdr");
    if (!lg) {
      lg = spdlog::stdout_color_mt("tdr");
      lg->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
      lg->set_level(spdlog::level::info);
    }
  });
  return lg;
}

bool set_level(std::string_view name) {
  if (name == "trace")      logger()->set_level(spdlog::level::trace);
  else if (name == "debug") logger()->set_level(spdlog::level::debug);
  else if (name == "info")  logger()->set_level(spdlog::level::info);
  else if (name == "warn")  logger()->set_level(spdlog::level::warn);
  else if (name == "error") logger()->set_level(spdlog::level::err);
  else if (name == "off")   logger()->set_level(spdlog::level::off);
  else return false;
  return true;
}

} // namespace tdr::log
