#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace mcpperf {

/**
 * @class LoadBalancer
 * @brief Round-robin selection over a set of endpoint urls.
 *
 * Typically used to pick the url passed to ConnectionPool::acquire() when the
 * same server is reachable at several addresses. Thread-safe.
 */
class LoadBalancer {
public:
    LoadBalancer() = default;
    explicit LoadBalancer(std::vector<std::string> urls);

    /**
     * @brief Next url in rotation.
     * @throws ConfigurationError if no urls are registered.
     */
    std::string next();

    // Adding a url that is already present is a no-op
    void add(const std::string& url);

    // Returns false if the url was not registered
    bool remove(const std::string& url);

    std::vector<std::string> urls() const;
    size_t size() const;

private:
    std::vector<std::string> m_urls;
    size_t m_index = 0;
    mutable std::mutex m_mutex;
};

}  // namespace mcpperf
