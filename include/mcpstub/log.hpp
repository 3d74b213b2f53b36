#pragma once
#include <memory>
#include <string>
#include <spdlog/logger.h>

#define MCPSTUB_LOG_TRACE(...)    ::mcpstub::log::logger()->trace(__VA_ARGS__)
#define MCPSTUB_LOG_DEBUG(...)    ::mcpstub::log::logger()->debug(__VA_ARGS__)
#define MCPSTUB_LOG_INFO(...)     ::mcpstub::log::logger()->info(__VA_ARGS__)
#define MCPSTUB_LOG_WARN(...)     ::mcpstub::log::logger()->warn(__VA_ARGS__)
#define MCPSTUB_LOG_ERROR(...)    ::mcpstub::log::logger()->error(__VA_ARGS__)
#define MCPSTUB_LOG_CRITICAL(...) ::mcpstub::log::logger()->critical(__VA_ARGS__)

namespace mcpstub {
namespace log {

/// Shared "mcpstub" logger. Always writes to stderr: stdout is the protocol channel.
/// Created lazily with level "info" if init() was never called.
std::shared_ptr<spdlog::logger> logger();

/// (Re)configure the logger. Level is one of trace, debug, info, warn, error, critical, off.
/// Throws ConfigError for an unknown level name.
void init(const std::string& level = "info");

void set_level(const std::string& level);

/// True if `level` names a valid log level.
bool is_valid_level(const std::string& level);

} // namespace log
} // namespace mcpstub
