#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace ctxguard::log {

/// Name of the logger every engine module writes to.
inline constexpr const char* kLoggerName = "ctxguard";

/// Shared engine logger. Created on first use with a stderr colour sink
/// at `warn` level; later calls return the same instance.
std::shared_ptr<spdlog::logger> logger();

/// Set the engine log level ("trace", "debug", "info", "warn", "error",
/// "critical", "off"). Unknown names throw InvalidParameter.
void setLevel(const std::string& level_name);
void setLevel(spdlog::level::level_enum level);

} // namespace ctxguard::log
