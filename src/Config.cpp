#include "Config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

namespace mcpperf {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::chrono::milliseconds parseMillis(const std::string& value) {
    return std::chrono::milliseconds(std::stoll(value));
}

size_t parseSize(const std::string& value) {
    return static_cast<size_t>(std::stoul(value));
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "pool") {
                if (key == "min_connections") config.pool.min_connections = parseSize(value);
                else if (key == "max_connections") config.pool.max_connections = parseSize(value);
                else if (key == "max_total_connections")
                    config.pool.max_total_connections = parseSize(value);
                else if (key == "idle_timeout_ms") config.pool.idle_timeout = parseMillis(value);
                else if (key == "acquire_timeout_ms")
                    config.pool.acquire_timeout = parseMillis(value);
                else if (key == "health_check_interval_ms")
                    config.pool.health_check_interval = parseMillis(value);
                else if (key == "max_connection_age_ms")
                    config.pool.max_connection_age = parseMillis(value);
                else if (key == "validate_on_acquire")
                    config.pool.validate_on_acquire = parseBool(value);
            }
            else if (current_section == "batcher") {
                if (key == "max_batch_size") config.batcher.max_batch_size = parseSize(value);
                else if (key == "max_wait_ms") config.batcher.max_wait = parseMillis(value);
                else if (key == "execute_on_full")
                    config.batcher.execute_on_full = parseBool(value);
            }
            else if (current_section == "cacher") {
                if (key == "ttl_ms") config.cacher.ttl = parseMillis(value);
                else if (key == "auto_refresh") config.cacher.auto_refresh = parseBool(value);
                else if (key == "auto_refresh_before_expiry_ms")
                    config.cacher.auto_refresh_before_expiry = parseMillis(value);
                else if (key == "storage_directory") config.cacher.storage_directory = value;
            }
            else if (current_section == "logging") {
                if (key == "level") config.logging.level = value;
                else if (key == "file") config.logging.file = value;
                else if (key == "pattern") config.logging.pattern = value;
            }
        } catch (const std::logic_error& e) {
            // std::invalid_argument and std::out_of_range from the numeric parsers
            spdlog::warn("{}:{}: ignoring invalid value '{}' for '{}' ({})",
                         path.string(), line_number, value, key, e.what());
        }
    }

    return config;
}

bool Config::validate() const {
    if (pool.max_connections == 0) {
        spdlog::error("pool.max_connections must be greater than zero");
        return false;
    }

    if (pool.max_total_connections == 0) {
        spdlog::error("pool.max_total_connections must be greater than zero");
        return false;
    }

    if (pool.min_connections > pool.max_connections) {
        spdlog::error("pool.min_connections ({}) exceeds pool.max_connections ({})",
                      pool.min_connections, pool.max_connections);
        return false;
    }

    if (pool.max_connections > pool.max_total_connections) {
        spdlog::error("pool.max_connections ({}) exceeds pool.max_total_connections ({})",
                      pool.max_connections, pool.max_total_connections);
        return false;
    }

    if (pool.idle_timeout.count() <= 0 || pool.acquire_timeout.count() <= 0 ||
        pool.health_check_interval.count() <= 0 || pool.max_connection_age.count() <= 0) {
        spdlog::error("pool timeouts and intervals must be positive");
        return false;
    }

    if (batcher.max_batch_size == 0) {
        spdlog::error("batcher.max_batch_size must be greater than zero");
        return false;
    }

    if (batcher.max_wait.count() < 0) {
        spdlog::error("batcher.max_wait_ms must not be negative");
        return false;
    }

    if (cacher.ttl.count() <= 0) {
        spdlog::error("cacher.ttl_ms must be positive");
        return false;
    }

    if (!cacher.storage_directory.empty() &&
        std::filesystem::exists(cacher.storage_directory) &&
        !std::filesystem::is_directory(cacher.storage_directory)) {
        spdlog::error("cacher.storage_directory is not a directory: {}",
                      cacher.storage_directory);
        return false;
    }

    return true;
}

}  // namespace mcpperf
