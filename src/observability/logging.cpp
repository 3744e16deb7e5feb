#include "edgexfer/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace edgexfer::observability {
namespace {

constexpr const char* kLoggerName = "edgexfer";

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("EDGEXFER_LOG_LEVEL")) {
        return level;
    }
    if (!config.level.empty()) {
        return config.level;
    }
    return "info";
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("EDGEXFER_LOG_PATTERN")) {
        return pattern;
    }
    if (!config.pattern.empty()) {
        return config.pattern;
    }
    return "[%H:%M:%S] [%^%l%$] %v";
}

} // namespace

void init_logging(const LoggingConfig& config) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
    }
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace edgexfer::observability
