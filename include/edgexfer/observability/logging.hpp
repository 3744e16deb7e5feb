#pragma once

#include <string>

namespace edgexfer::observability {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

/// Installs the colored stdout logger "edgexfer" as spdlog's default.
/// EDGEXFER_LOG_LEVEL and EDGEXFER_LOG_PATTERN override `config`.
void init_logging(const LoggingConfig& config);

void shutdown_logging();

} // namespace edgexfer::observability
