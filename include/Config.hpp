#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace mcpperf {

struct PoolConfig {
    size_t min_connections = 0;           // per endpoint
    size_t max_connections = 10;          // per endpoint
    size_t max_total_connections = 50;    // across all endpoints
    std::chrono::milliseconds idle_timeout{60000};
    std::chrono::milliseconds acquire_timeout{30000};
    std::chrono::milliseconds health_check_interval{30000};
    std::chrono::milliseconds max_connection_age{300000};
    bool validate_on_acquire = true;
};

struct BatcherConfig {
    size_t max_batch_size = 10;
    std::chrono::milliseconds max_wait{50};
    bool execute_on_full = true;
};

struct CacherConfig {
    std::chrono::milliseconds ttl{300000};
    bool auto_refresh = false;
    std::chrono::milliseconds auto_refresh_before_expiry{30000};
    std::string storage_directory;  // empty: memory only
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct Config {
    PoolConfig pool;
    BatcherConfig batcher;
    CacherConfig cacher;
    LoggingConfig logging;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Validate configuration
    bool validate() const;
};

}  // namespace mcpperf
