#include "log.hpp"
#include "utils.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace api::log {

namespace {
std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get("api")) {
        return existing;
    }

    auto logger = spdlog::stdout_color_mt("api");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(spdlog::level::from_str(get_env("API_LOG_LEVEL", "warn")));
    logger->flush_on(spdlog::level::warn);
    return logger;
}
} // namespace

std::shared_ptr<spdlog::logger> get() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] { logger = make_logger(); });
    return logger;
}

void set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

} // namespace api::log
