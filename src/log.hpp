#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace api::log {

// Shared library logger. Created on first use; the level comes from
// API_LOG_LEVEL (trace, debug, info, warn, error, critical, off).
std::shared_ptr<spdlog::logger> get();

void set_level(spdlog::level::level_enum level);

} // namespace api::log

#define API_LOG_TRACE(...) ::api::log::get()->trace(__VA_ARGS__)
#define API_LOG_DEBUG(...) ::api::log::get()->debug(__VA_ARGS__)
#define API_LOG_WARN(...) ::api::log::get()->warn(__VA_ARGS__)
