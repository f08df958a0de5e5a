#pragma once

/**
 * @file StorageAdapter.hpp
 * @brief Persistent key-value backend for DefinitionCacher.
 */

#include "Types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace mcpperf {

/**
 * @class StorageAdapter
 * @brief Abstract JSON key-value store with optional per-value expiry.
 *
 * Implementations must be thread-safe. Any method may throw; the cacher
 * treats storage as a best-effort mirror and logs failures.
 */
class StorageAdapter {
public:
    virtual ~StorageAdapter() = default;

    /**
     * @brief Stored value, or std::nullopt if absent or expired.
     */
    virtual std::optional<Json> get(const std::string& key) = 0;

    /**
     * @brief Store a value.
     * @param ttl Lifetime of the value; zero keeps it until removed.
     */
    virtual void set(const std::string& key, const Json& value, std::chrono::milliseconds ttl) = 0;

    virtual void remove(const std::string& key) = 0;
    virtual void clear() = 0;
};

}  // namespace mcpperf
