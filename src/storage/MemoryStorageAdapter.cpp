#include "MemoryStorageAdapter.hpp"

namespace mcpperf {

std::optional<Json> MemoryStorageAdapter::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }

    if (it->second.expiresAt && std::chrono::steady_clock::now() >= *it->second.expiresAt) {
        m_values.erase(it);
        return std::nullopt;
    }

    return it->second.value;
}

void MemoryStorageAdapter::set(const std::string& key, const Json& value,
                               std::chrono::milliseconds ttl) {
    StoredValue stored{value, std::nullopt};
    if (ttl.count() > 0) {
        stored.expiresAt = std::chrono::steady_clock::now() + ttl;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_values[key] = std::move(stored);
}

void MemoryStorageAdapter::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values.erase(key);
}

void MemoryStorageAdapter::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values.clear();
}

size_t MemoryStorageAdapter::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values.size();
}

}  // namespace mcpperf
