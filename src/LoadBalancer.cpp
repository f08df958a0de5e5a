#include "LoadBalancer.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>

namespace mcpperf {

LoadBalancer::LoadBalancer(std::vector<std::string> urls) {
    for (auto& url : urls) {
        add(url);
    }
}

std::string LoadBalancer::next() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_urls.empty()) {
        throw ConfigurationError("No URLs available");
    }

    if (m_index >= m_urls.size()) {
        m_index = 0;
    }
    return m_urls[m_index++];
}

void LoadBalancer::add(const std::string& url) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (std::find(m_urls.begin(), m_urls.end(), url) == m_urls.end()) {
        m_urls.push_back(url);
    }
}

bool LoadBalancer::remove(const std::string& url) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = std::find(m_urls.begin(), m_urls.end(), url);
    if (it == m_urls.end()) {
        return false;
    }

    size_t pos = static_cast<size_t>(it - m_urls.begin());
    m_urls.erase(it);
    // Keep the rotation pointing at the url that would have come next
    if (pos < m_index && m_index > 0) {
        --m_index;
    }
    return true;
}

std::vector<std::string> LoadBalancer::urls() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_urls;
}

size_t LoadBalancer::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_urls.size();
}

}  // namespace mcpperf
