#pragma once

/**
 * @file DefinitionCacher.hpp
 * @brief TTL cache for tool, resource and prompt definitions.
 *
 * Definitions change rarely but are requested on every session start. The
 * cacher keeps one entry per definition kind in memory, mirrors it to an
 * optional StorageAdapter, deduplicates concurrent fetches and can refresh
 * entries in the background before they expire.
 */

#include "Config.hpp"
#include "StorageAdapter.hpp"
#include "TimerQueue.hpp"
#include "Types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcpperf {

enum class CacheKind {
    Tools,
    Resources,
    Prompts
};

// Fixed cache/storage key for a kind: "tools", "resources" or "prompts"
const char* cacheKey(CacheKind kind);

struct FetchOptions {
    bool forceRefresh = false;          // ignore cached data
    bool staleWhileRevalidate = false;  // serve expired data and refresh in the background
};

struct CacheEntry {
    using Clock = std::chrono::system_clock;

    Json payload;
    Clock::time_point fetchedAt;
    Clock::time_point expiresAt;
    size_t size = 0;  // estimated bytes
};

// Timestamps are stored as milliseconds since the epoch
void to_json(Json& j, const CacheEntry& entry);
void from_json(const Json& j, CacheEntry& entry);

/**
 * @class DefinitionCacher
 * @brief Single-flight TTL cache in front of the list operations of a server.
 *
 * Lookup order for getTools()/getResources()/getPrompts():
 * 1. Fresh memory entry (hit)
 * 2. Expired memory entry with staleWhileRevalidate (hit, refreshed in the background)
 * 3. Unexpired entry in the storage adapter, promoted to memory (hit)
 * 4. Fetch (miss); concurrent misses for the same kind share one fetch
 *
 * Thread Safety:
 * - All public methods are thread-safe.
 * - Fetchers and the storage adapter are called without the cacher's mutex held.
 * - Background refreshes run on the cacher's own timer thread.
 *
 * Usage:
 * @code
 *   DefinitionCacher cacher({.tools = [&] { return pool.withConnection(opts,
 *       [](Connection& c) { return c.listTools(); }); }});
 *   auto tools = cacher.getTools();
 *   auto search = cacher.getTool("search");
 * @endcode
 */
class DefinitionCacher {
public:
    using Clock = CacheEntry::Clock;

    using ToolsFetcher = std::function<std::vector<ToolDefinition>()>;
    using ResourcesFetcher = std::function<std::vector<ResourceDefinition>()>;
    using PromptsFetcher = std::function<std::vector<PromptDefinition>()>;
    using UpdateCallback = std::function<void(CacheKind)>;

    /**
     * @brief Sources of truth; a kind without a fetcher cannot be requested.
     */
    struct Fetchers {
        ToolsFetcher tools;
        ResourcesFetcher resources;
        PromptsFetcher prompts;
    };

    /**
     * @param fetchers Functions that load each kind from the server.
     * @param config TTL and auto-refresh settings.
     * @param storage Persistent mirror. When null and config.storage_directory
     *        is set, a FileStorageAdapter on that directory is used.
     */
    explicit DefinitionCacher(Fetchers fetchers, const CacherConfig& config = {},
                              std::shared_ptr<StorageAdapter> storage = nullptr);

    ~DefinitionCacher();

    DefinitionCacher(const DefinitionCacher&) = delete;
    DefinitionCacher& operator=(const DefinitionCacher&) = delete;

    /**
     * @throws ConfigurationError if no tools fetcher is configured.
     * @throws TransportError if the fetch fails.
     * @throws ShutdownError after dispose().
     */
    std::vector<ToolDefinition> getTools(const FetchOptions& options = {});
    std::vector<ResourceDefinition> getResources(const FetchOptions& options = {});
    std::vector<PromptDefinition> getPrompts(const FetchOptions& options = {});

    std::optional<ToolDefinition> getTool(const std::string& name,
                                          const FetchOptions& options = {});
    std::optional<ResourceDefinition> getResource(const std::string& uri,
                                                  const FetchOptions& options = {});
    std::optional<PromptDefinition> getPrompt(const std::string& name,
                                              const FetchOptions& options = {});

    /**
     * @brief Load every kind that has a fetcher. The first failure propagates.
     */
    void preload();

    /**
     * @brief Drop a kind from memory and storage and cancel its auto-refresh.
     */
    void invalidate(CacheKind kind);
    void invalidateAll();

    CacheStats getStats() const;
    void resetStats();

    // True if an unexpired entry is in memory
    bool isValid(CacheKind kind) const;
    std::optional<Clock::time_point> getExpiry(CacheKind kind) const;

    // Called after each successful fetch, outside the cacher's lock
    void onUpdate(UpdateCallback callback);

    /**
     * @brief Stop background refreshes and clear memory. Storage is untouched.
     *
     * Later get*() calls throw ShutdownError. Idempotent.
     */
    void dispose();

    const CacherConfig& config() const { return m_config; }

private:
    using Fetch = std::function<Json()>;

    Json get(CacheKind kind, const FetchOptions& options);
    Json fetchShared(CacheKind kind, const Fetch& fetch, Clock::time_point since);
    void storeEntry(CacheKind kind, const Json& payload);
    std::optional<CacheEntry> loadFromStorage(CacheKind kind);
    void backgroundRefresh(CacheKind kind);

    Fetch fetcherFor(CacheKind kind) const;
    void scheduleBackgroundRefreshLocked(CacheKind kind);
    void scheduleRefreshLocked(CacheKind kind, Clock::time_point expiresAt);
    void cancelRefreshLocked(CacheKind kind);
    void throwIfDisposedLocked() const;

    Fetchers m_fetchers;
    CacherConfig m_config;
    std::shared_ptr<StorageAdapter> m_storage;
    UpdateCallback m_onUpdate;

    std::map<CacheKind, CacheEntry> m_entries;
    std::map<CacheKind, std::shared_future<Json>> m_pending;  ///< In-flight fetches
    std::map<CacheKind, TimerQueue::TimerId> m_refreshTimers;
    std::set<CacheKind> m_refreshQueued;  ///< Stale refreshes waiting for the timer thread
    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    bool m_disposed = false;

    mutable std::mutex m_mutex;
    TimerQueue m_timers;
};

}  // namespace mcpperf
