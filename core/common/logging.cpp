#include "common/logging.hpp"
#include "common/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace ctxguard::log {

namespace {

std::shared_ptr<spdlog::logger> createLogger() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) return existing;

    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] { instance = createLogger(); });
    return instance;
}

void setLevel(const std::string& level_name) {
    auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && level_name != "off") {
        throw InvalidParameter("Unknown log level: " + level_name);
    }
    setLevel(level);
}

void setLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace ctxguard::log
