#include "DefinitionCacher.hpp"
#include "ErrorHandler.hpp"
#include "FileStorageAdapter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace mcpperf {

namespace {

const CacheKind kAllKinds[] = {CacheKind::Tools, CacheKind::Resources, CacheKind::Prompts};

int64_t toMillis(CacheEntry::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

CacheEntry::Clock::time_point fromMillis(int64_t ms) {
    return CacheEntry::Clock::time_point(
        std::chrono::duration_cast<CacheEntry::Clock::duration>(std::chrono::milliseconds(ms)));
}

template<typename T, typename Pred>
std::optional<T> findFirst(const std::vector<T>& items, Pred pred) {
    auto it = std::find_if(items.begin(), items.end(), pred);
    if (it == items.end()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace

const char* cacheKey(CacheKind kind) {
    switch (kind) {
        case CacheKind::Tools:
            return "tools";
        case CacheKind::Resources:
            return "resources";
        case CacheKind::Prompts:
            return "prompts";
    }
    return "unknown";
}

void to_json(Json& j, const CacheEntry& entry) {
    j = Json{
        {"payload", entry.payload},
        {"fetchedAt", toMillis(entry.fetchedAt)},
        {"expiresAt", toMillis(entry.expiresAt)},
        {"size", entry.size}
    };
}

void from_json(const Json& j, CacheEntry& entry) {
    entry.payload = j.at("payload");
    entry.fetchedAt = fromMillis(j.at("fetchedAt").get<int64_t>());
    entry.expiresAt = fromMillis(j.at("expiresAt").get<int64_t>());
    entry.size = j.value("size", static_cast<size_t>(0));
}

// ============================================================================
// Construction and Destruction
// ============================================================================

DefinitionCacher::DefinitionCacher(Fetchers fetchers, const CacherConfig& config,
                                   std::shared_ptr<StorageAdapter> storage)
    : m_fetchers(std::move(fetchers))
    , m_config(config)
    , m_storage(std::move(storage))
    , m_timers("definition-cacher") {

    if (m_config.ttl.count() <= 0) {
        throw ConfigurationError("Cache ttl must be positive");
    }

    if (!m_storage && !m_config.storage_directory.empty()) {
        m_storage = std::make_shared<FileStorageAdapter>(m_config.storage_directory);
    }

    spdlog::debug("Definition cacher initialized (ttl {}ms, auto-refresh {}, storage {})",
                  m_config.ttl.count(), m_config.auto_refresh ? "on" : "off",
                  m_storage ? "on" : "off");
}

DefinitionCacher::~DefinitionCacher() {
    dispose();
}

// ============================================================================
// Lookups
// ============================================================================

std::vector<ToolDefinition> DefinitionCacher::getTools(const FetchOptions& options) {
    return get(CacheKind::Tools, options).get<std::vector<ToolDefinition>>();
}

std::vector<ResourceDefinition> DefinitionCacher::getResources(const FetchOptions& options) {
    return get(CacheKind::Resources, options).get<std::vector<ResourceDefinition>>();
}

std::vector<PromptDefinition> DefinitionCacher::getPrompts(const FetchOptions& options) {
    return get(CacheKind::Prompts, options).get<std::vector<PromptDefinition>>();
}

std::optional<ToolDefinition> DefinitionCacher::getTool(const std::string& name,
                                                        const FetchOptions& options) {
    return findFirst(getTools(options), [&name](const ToolDefinition& def) {
        return def.name == name;
    });
}

std::optional<ResourceDefinition> DefinitionCacher::getResource(const std::string& uri,
                                                                const FetchOptions& options) {
    return findFirst(getResources(options), [&uri](const ResourceDefinition& def) {
        return def.uri == uri;
    });
}

std::optional<PromptDefinition> DefinitionCacher::getPrompt(const std::string& name,
                                                            const FetchOptions& options) {
    return findFirst(getPrompts(options), [&name](const PromptDefinition& def) {
        return def.name == name;
    });
}

void DefinitionCacher::preload() {
    if (m_fetchers.tools) {
        getTools();
    }
    if (m_fetchers.resources) {
        getResources();
    }
    if (m_fetchers.prompts) {
        getPrompts();
    }
}

Json DefinitionCacher::get(CacheKind kind, const FetchOptions& options) {
    Fetch fetch = fetcherFor(kind);
    auto now = Clock::now();
    bool inMemory = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        throwIfDisposedLocked();

        auto it = m_entries.find(kind);
        inMemory = it != m_entries.end();

        if (inMemory && !options.forceRefresh) {
            if (now < it->second.expiresAt) {
                ++m_hits;
                return it->second.payload;
            }

            if (options.staleWhileRevalidate) {
                ++m_hits;
                scheduleBackgroundRefreshLocked(kind);
                return it->second.payload;
            }
        }
    }

    if (!inMemory && !options.forceRefresh && m_storage) {
        auto stored = loadFromStorage(kind);
        if (stored && now < stored->expiresAt) {
            std::lock_guard<std::mutex> lock(m_mutex);
            throwIfDisposedLocked();

            ++m_hits;
            auto expiresAt = stored->expiresAt;
            Json payload = stored->payload;
            m_entries[kind] = std::move(*stored);
            scheduleRefreshLocked(kind, expiresAt);
            spdlog::debug("Promoted cached {} from storage", cacheKey(kind));
            return payload;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_misses;
    }

    return fetchShared(kind, fetch, now);
}

// ============================================================================
// Fetching
// ============================================================================

Json DefinitionCacher::fetchShared(CacheKind kind, const Fetch& fetch, Clock::time_point since) {
    std::promise<Json> promise;
    std::shared_future<Json> pending;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // A fetch that completed after this request started is as good as our own
        auto entry = m_entries.find(kind);
        if (entry != m_entries.end() && entry->second.fetchedAt >= since) {
            return entry->second.payload;
        }

        auto it = m_pending.find(kind);
        if (it != m_pending.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            m_pending[kind] = pending;
            leader = true;
        }
    }

    if (!leader) {
        spdlog::debug("Joining in-flight fetch of {}", cacheKey(kind));
        return pending.get();
    }

    // Clears the in-flight record and settles the shared future on every exit path
    struct PendingFetch {
        DefinitionCacher& cacher;
        CacheKind kind;
        std::promise<Json>& promise;
        bool settled = false;

        ~PendingFetch() {
            {
                std::lock_guard<std::mutex> lock(cacher.m_mutex);
                cacher.m_pending.erase(kind);
            }
            if (!settled) {
                promise.set_exception(std::make_exception_ptr(TransportError(
                    std::string("Fetch of ") + cacheKey(kind) + " did not complete")));
            }
        }
    } inFlight{*this, kind, promise};

    Json payload;
    try {
        payload = fetch();
        storeEntry(kind, payload);
    } catch (...) {
        auto error = ErrorHandler::asTransportError(
            std::current_exception(), std::string("Failed to fetch ") + cacheKey(kind));
        promise.set_exception(error);
        inFlight.settled = true;
        std::rethrow_exception(error);
    }

    promise.set_value(payload);
    inFlight.settled = true;
    return payload;
}

void DefinitionCacher::storeEntry(CacheKind kind, const Json& payload) {
    CacheEntry entry;
    entry.payload = payload;
    entry.fetchedAt = Clock::now();
    entry.expiresAt = entry.fetchedAt + m_config.ttl;
    // Rough estimate, two bytes per serialized character
    entry.size = payload.dump(-1, ' ', false, Json::error_handler_t::replace).size() * 2;

    UpdateCallback onUpdate;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disposed) {
            return;
        }
        m_entries[kind] = entry;
        scheduleRefreshLocked(kind, entry.expiresAt);
        onUpdate = m_onUpdate;
    }

    if (m_storage) {
        try {
            m_storage->set(cacheKey(kind), Json(entry), m_config.ttl);
        } catch (...) {
            spdlog::warn("Failed to persist cached {}: {}", cacheKey(kind),
                         ErrorHandler::describe(std::current_exception()));
        }
    }

    spdlog::debug("Cached {} ({} bytes, expires in {}ms)", cacheKey(kind), entry.size,
                  m_config.ttl.count());

    if (onUpdate) {
        try {
            onUpdate(kind);
        } catch (...) {
            spdlog::warn("onUpdate callback failed: {}",
                         ErrorHandler::describe(std::current_exception()));
        }
    }
}

std::optional<CacheEntry> DefinitionCacher::loadFromStorage(CacheKind kind) {
    try {
        auto stored = m_storage->get(cacheKey(kind));
        if (!stored) {
            return std::nullopt;
        }
        return stored->get<CacheEntry>();
    } catch (...) {
        spdlog::warn("Failed to read cached {} from storage: {}", cacheKey(kind),
                     ErrorHandler::describe(std::current_exception()));
        return std::nullopt;
    }
}

void DefinitionCacher::backgroundRefresh(CacheKind kind) {
    ErrorContext context(std::string("refresh ") + cacheKey(kind));

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_refreshQueued.erase(kind);
        if (m_disposed || m_pending.count(kind) > 0) {
            return;
        }
    }

    try {
        fetchShared(kind, fetcherFor(kind), Clock::now());
    } catch (...) {
        spdlog::warn("{}: background refresh failed: {}", ErrorContext::current(),
                     ErrorHandler::describe(std::current_exception()));
    }
}

// ============================================================================
// Invalidation and Statistics
// ============================================================================

void DefinitionCacher::invalidate(CacheKind kind) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.erase(kind);
        cancelRefreshLocked(kind);
    }

    if (m_storage) {
        try {
            m_storage->remove(cacheKey(kind));
        } catch (...) {
            spdlog::warn("Failed to remove cached {} from storage: {}", cacheKey(kind),
                         ErrorHandler::describe(std::current_exception()));
        }
    }
}

void DefinitionCacher::invalidateAll() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
        for (CacheKind kind : kAllKinds) {
            cancelRefreshLocked(kind);
        }
    }

    if (m_storage) {
        try {
            m_storage->clear();
        } catch (...) {
            spdlog::warn("Failed to clear cache storage: {}",
                         ErrorHandler::describe(std::current_exception()));
        }
    }
}

CacheStats DefinitionCacher::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    CacheStats stats;
    stats.hits = m_hits;
    stats.misses = m_misses;
    uint64_t total = m_hits + m_misses;
    stats.hitRate = total > 0 ? static_cast<double>(m_hits) / static_cast<double>(total) : 0.0;
    stats.entries = m_entries.size();
    for (const auto& [kind, entry] : m_entries) {
        stats.bytesUsed += entry.size;
    }
    return stats;
}

void DefinitionCacher::resetStats() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hits = 0;
    m_misses = 0;
}

bool DefinitionCacher::isValid(CacheKind kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(kind);
    return it != m_entries.end() && Clock::now() < it->second.expiresAt;
}

std::optional<DefinitionCacher::Clock::time_point> DefinitionCacher::getExpiry(CacheKind kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(kind);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.expiresAt;
}

void DefinitionCacher::onUpdate(UpdateCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_onUpdate = std::move(callback);
}

void DefinitionCacher::dispose() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disposed) {
            return;
        }
        m_disposed = true;
        m_refreshTimers.clear();
    }

    // Waits for a running background refresh
    m_timers.stop();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

// ============================================================================
// Internal Helpers
// ============================================================================

DefinitionCacher::Fetch DefinitionCacher::fetcherFor(CacheKind kind) const {
    switch (kind) {
        case CacheKind::Tools:
            if (m_fetchers.tools) {
                return [fn = m_fetchers.tools] { return Json(fn()); };
            }
            break;
        case CacheKind::Resources:
            if (m_fetchers.resources) {
                return [fn = m_fetchers.resources] { return Json(fn()); };
            }
            break;
        case CacheKind::Prompts:
            if (m_fetchers.prompts) {
                return [fn = m_fetchers.prompts] { return Json(fn()); };
            }
            break;
    }
    throw ConfigurationError(std::string("No fetcher configured for ") + cacheKey(kind));
}

void DefinitionCacher::scheduleBackgroundRefreshLocked(CacheKind kind) {
    if (m_pending.count(kind) > 0 || m_refreshQueued.count(kind) > 0) {
        return;
    }
    if (m_timers.scheduleAfter(std::chrono::milliseconds(0),
                               [this, kind] { backgroundRefresh(kind); }) != 0) {
        m_refreshQueued.insert(kind);
    }
}

void DefinitionCacher::scheduleRefreshLocked(CacheKind kind, Clock::time_point expiresAt) {
    if (!m_config.auto_refresh) {
        return;
    }

    cancelRefreshLocked(kind);

    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
        expiresAt - m_config.auto_refresh_before_expiry - Clock::now());
    if (delay.count() <= 0) {
        return;
    }

    // A fired timer's id stays in the map; cancelling it later is a no-op
    TimerQueue::TimerId id = m_timers.scheduleAfter(delay, [this, kind] { backgroundRefresh(kind); });
    if (id != 0) {
        m_refreshTimers[kind] = id;
    }
}

void DefinitionCacher::cancelRefreshLocked(CacheKind kind) {
    auto it = m_refreshTimers.find(kind);
    if (it != m_refreshTimers.end()) {
        m_timers.cancel(it->second);
        m_refreshTimers.erase(it);
    }
}

void DefinitionCacher::throwIfDisposedLocked() const {
    if (m_disposed) {
        throw ShutdownError("Definition cacher has been disposed");
    }
}

}  // namespace mcpperf
