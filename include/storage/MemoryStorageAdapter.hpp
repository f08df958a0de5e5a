#pragma once

#include "StorageAdapter.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcpperf {

// In-process StorageAdapter; mostly useful in tests and as a reference implementation
class MemoryStorageAdapter : public StorageAdapter {
public:
    std::optional<Json> get(const std::string& key) override;
    void set(const std::string& key, const Json& value, std::chrono::milliseconds ttl) override;
    void remove(const std::string& key) override;
    void clear() override;

    // Stored values, expired ones included until they are read
    size_t size() const;

private:
    struct StoredValue {
        Json value;
        std::optional<std::chrono::steady_clock::time_point> expiresAt;
    };

    std::map<std::string, StoredValue> m_values;
    mutable std::mutex m_mutex;
};

}  // namespace mcpperf
