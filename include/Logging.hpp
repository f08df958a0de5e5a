#pragma once

#include "Config.hpp"
#include <spdlog/common.h>
#include <string>

namespace mcpperf {

// Install the default spdlog logger: colored console sink plus an optional file sink.
// Returns false (and keeps the previous logger) if the sinks could not be created.
bool setupLogging(const LoggingConfig& config);

// Map a config level name ("debug", "warn", ...) to spdlog; unknown names map to info
spdlog::level::level_enum parseLogLevel(const std::string& level);

}  // namespace mcpperf
