#include "mcpstub/log.hpp"
#include "mcpstub/error.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace mcpstub {
namespace log {

namespace {

constexpr const char* kLoggerName = "mcpstub";

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

spdlog::level::level_enum to_level(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off")      return spdlog::level::off;
    throw ConfigError("Unknown log level: " + level);
}

std::shared_ptr<spdlog::logger> make_logger() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) return existing;
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto lg = std::make_shared<spdlog::logger>(kLoggerName, sink);
    lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    lg->set_level(spdlog::level::info);
    spdlog::register_logger(lg);
    return lg;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) g_logger = make_logger();
    return g_logger;
}

void init(const std::string& level) {
    auto lvl = to_level(level);
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) g_logger = make_logger();
    g_logger->set_level(lvl);
    g_logger->flush_on(spdlog::level::warn);
}

void set_level(const std::string& level) {
    auto lvl = to_level(level);
    logger()->set_level(lvl);
}

bool is_valid_level(const std::string& level) {
    try {
        to_level(level);
        return true;
    } catch (const ConfigError&) {
        return false;
    }
}

} // namespace log
} // namespace mcpstub
