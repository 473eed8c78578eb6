#pragma once
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace tdr::log {

// Shared "tdr" logger (stdout, colour). Created on first use.
std::shared_ptr<spdlog::logger> logger();

// "trace", "debug", "info", "warn", "error", "off". Unknown names are ignored
// and return false.
bool set_level(std::string_view name);

} // namespace tdr::log
