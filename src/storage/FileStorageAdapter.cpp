#include "FileStorageAdapter.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

namespace mcpperf {

namespace {
constexpr const char* kDocumentName = "definitions.json";
}

FileStorageAdapter::FileStorageAdapter(std::filesystem::path directory)
    : m_directory(std::move(directory))
    , m_file(m_directory / kDocumentName) {

    std::filesystem::create_directories(m_directory);
    load();
}

std::optional<Json> FileStorageAdapter::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_document.find(key);
    if (it == m_document.end()) {
        return std::nullopt;
    }

    const Json& stored = *it;
    if (!stored.is_object() || !stored.contains("value")) {
        spdlog::warn("Dropping malformed entry '{}' from {}", key, m_file.string());
        m_document.erase(key);
        saveLocked();
        return std::nullopt;
    }

    auto expires = stored.find("expiresAt");
    if (expires != stored.end() && expires->is_number_integer() &&
        nowMillis() >= expires->get<int64_t>()) {
        spdlog::debug("Entry '{}' in {} has expired", key, m_file.string());
        m_document.erase(key);
        saveLocked();
        return std::nullopt;
    }

    return stored["value"];
}

void FileStorageAdapter::set(const std::string& key, const Json& value,
                             std::chrono::milliseconds ttl) {
    Json stored = {
        {"value", value},
        {"expiresAt", nullptr}
    };
    if (ttl.count() > 0) {
        stored["expiresAt"] = nowMillis() + ttl.count();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_document[key] = std::move(stored);
    saveLocked();
}

void FileStorageAdapter::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_document.erase(key) > 0) {
        saveLocked();
    }
}

void FileStorageAdapter::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_document = Json::object();
    saveLocked();
}

int64_t FileStorageAdapter::nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void FileStorageAdapter::load() {
    std::ifstream file(m_file);
    if (!file) {
        spdlog::debug("{} does not exist, starting with an empty store", m_file.string());
        return;
    }

    try {
        Json loaded = Json::parse(file);
        if (!loaded.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }
        m_document = std::move(loaded);
        spdlog::info("Loaded {} cached definition set(s) from {}", m_document.size(),
                     m_file.string());
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse {}: {} - starting with an empty store",
                      m_file.string(), e.what());
        m_document = Json::object();
    }
}

void FileStorageAdapter::saveLocked() const {
    std::filesystem::path temp = m_file;
    temp += ".tmp";

    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to open " + temp.string() + " for writing");
        }
        file << m_document.dump(2, ' ', false, Json::error_handler_t::replace);
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed to write " + temp.string());
        }
    }

    std::filesystem::rename(temp, m_file);
}

}  // namespace mcpperf
