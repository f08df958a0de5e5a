#pragma once

/**
 * @file FileStorageAdapter.hpp
 * @brief StorageAdapter persisted as a single JSON document on disk.
 */

#include "StorageAdapter.hpp"
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace mcpperf {

/**
 * @class FileStorageAdapter
 * @brief Keeps every key in <directory>/definitions.json.
 *
 * The document is loaded once at construction and rewritten after every
 * change: the new content goes to a temporary file that is then renamed over
 * the old one, so a crash never leaves a half-written document behind.
 * Expiry is stored as wall-clock time and survives restarts; expired values
 * are dropped when read.
 *
 * Layout:
 * @code
 *   {
 *     "tools": {"value": {...}, "expiresAt": 1767225600000},
 *     "prompts": {"value": {...}, "expiresAt": null}
 *   }
 * @endcode
 */
class FileStorageAdapter : public StorageAdapter {
public:
    /**
     * @brief Open (creating if needed) the store in directory.
     * @throws std::filesystem::filesystem_error if the directory cannot be created.
     *
     * An unreadable or corrupt document is logged and replaced by an empty one.
     */
    explicit FileStorageAdapter(std::filesystem::path directory);

    std::optional<Json> get(const std::string& key) override;
    void set(const std::string& key, const Json& value, std::chrono::milliseconds ttl) override;
    void remove(const std::string& key) override;
    void clear() override;

    const std::filesystem::path& path() const { return m_file; }

private:
    static int64_t nowMillis();

    void load();
    void saveLocked() const;

    std::filesystem::path m_directory;
    std::filesystem::path m_file;
    Json m_document = Json::object();
    mutable std::mutex m_mutex;
};

}  // namespace mcpperf
