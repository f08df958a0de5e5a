/**
 * @file ConnectionPool.cpp
 * @brief Implementation of the endpoint-partitioned connection pool.
 *
 * Bookkeeping is done under m_mutex; every call into a Connection (create,
 * ping, close) happens with the mutex released. Slots for connections being
 * created or pinged stay counted in their endpoint so the caps hold while the
 * lock is dropped.
 */

#include "ConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mcpperf {

// ============================================================================
// Construction and Destruction
// ============================================================================

ConnectionPool::ConnectionPool(ConnectionFactory factory, const PoolConfig& config,
                               Callbacks callbacks)
    : m_factory(std::move(factory))
    , m_config(config)
    , m_callbacks(std::move(callbacks))
    , m_timers("connection-pool") {

    if (!m_factory) {
        throw ConfigurationError("ConnectionPool requires a connection factory");
    }
    if (m_config.max_connections == 0 || m_config.max_total_connections == 0) {
        throw ConfigurationError("ConnectionPool limits must be greater than zero");
    }

    m_timers.scheduleEvery(m_config.health_check_interval, [this] { runHealthCheck(); });

    auto idleInterval = std::max(m_config.idle_timeout / 2, std::chrono::milliseconds(1));
    m_timers.scheduleEvery(idleInterval, [this] { runIdleCheck(); });

    spdlog::info("Connection pool initialized (per-endpoint {}, total {}, min {})",
                 m_config.max_connections, m_config.max_total_connections,
                 m_config.min_connections);
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

// ============================================================================
// Connection Acquisition and Release
// ============================================================================

std::shared_ptr<Connection> ConnectionPool::acquire(const ConnectionOptions& options) {
    if (options.url.empty()) {
        throw ConfigurationError("Connection url is required");
    }

    const auto deadline = Clock::now() + m_config.acquire_timeout;

    std::unique_lock<std::mutex> lock(m_mutex);
    throwIfShutdownLocked();
    endpointLocked(options);

    for (;;) {
        Endpoint& ep = endpointLocked(options.url);

        if (!ep.idle.empty()) {
            PooledPtr pooled = ep.idle.front();
            ep.idle.pop_front();

            if (isExpired(*pooled, Clock::now())) {
                spdlog::debug("Discarding connection {} to {}: exceeded max age",
                              pooled->connection->id(), pooled->url);
                grantSlotsLocked();
                lock.unlock();
                destroyConnection(pooled);
                lock.lock();
                throwIfShutdownLocked();
                continue;
            }

            if (!m_config.validate_on_acquire) {
                activateLocked(ep, pooled, true);
                return pooled->connection;
            }

            ++ep.checking;
            lock.unlock();
            bool healthy = pingConnection(*pooled);
            lock.lock();

            Endpoint& current = endpointLocked(options.url);
            --current.checking;

            if (m_shutdown) {
                lock.unlock();
                destroyConnection(pooled);
                throw ShutdownError("Connection pool is shutting down");
            }

            if (!healthy) {
                spdlog::debug("Discarding connection {} to {}: validation failed",
                              pooled->connection->id(), pooled->url);
                pooled->healthy = false;
                grantSlotsLocked();
                lock.unlock();
                destroyConnection(pooled);
                lock.lock();
                throwIfShutdownLocked();
                continue;
            }

            activateLocked(current, pooled, true);
            return pooled->connection;
        }

        if (hasCapacityLocked(ep)) {
            ++ep.creating;
            return createReserved(lock, options);
        }

        // At capacity - wait for a release, a freed slot or the deadline
        auto waiter = std::make_shared<Waiter>();
        waiter->url = options.url;
        waiter->enqueuedAt = Clock::now();
        m_waiters.push_back(waiter);

        spdlog::debug("Waiting for connection to {} ({} waiting)", options.url, m_waiters.size());

        bool ready = waiter->cv.wait_until(lock, deadline, [&waiter] {
            return waiter->handoff || waiter->slotGranted || waiter->cancelled;
        });

        if (!ready) {
            m_waiters.remove(waiter);
            ++m_acquireTimeouts;
            throw AcquireTimeoutError("Timeout waiting for connection to " + options.url);
        }

        if (waiter->cancelled) {
            throw ShutdownError("Connection pool is shutting down");
        }

        if (waiter->handoff) {
            return waiter->handoff->connection;
        }

        // A slot was reserved for us (creating already counted)
        return createReserved(lock, options);
    }
}

void ConnectionPool::release(const std::shared_ptr<Connection>& connection) {
    if (!connection) return;

    std::vector<PooledPtr> toDestroy;
    bool untracked = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_active.find(connection.get());
        if (it == m_active.end()) {
            if (m_shutdown) {
                // Already closed by shutdown()
                spdlog::debug("Connection {} released after shutdown", connection->id());
                return;
            }
            untracked = true;
        } else {
            PooledPtr pooled = it->second;
            m_active.erase(it);

            Endpoint& ep = endpointLocked(pooled->url);
            --ep.active;
            pooled->lastUsedAt = Clock::now();

            if (!pooled->healthy || pooled->generation != ep.generation ||
                isExpired(*pooled, pooled->lastUsedAt)) {
                toDestroy.push_back(pooled);
                grantSlotsLocked();
            } else {
                returnToPoolLocked(pooled, toDestroy);
            }
        }
    }

    if (untracked) {
        spdlog::warn("Released connection {} is not tracked by this pool; closing it",
                     connection->id());
        try {
            connection->close();
        } catch (...) {
            reportError(std::current_exception(), connection.get());
        }
        return;
    }

    destroyAll(toDestroy);
}

ConnectionLease ConnectionPool::lease(const ConnectionOptions& options) {
    return ConnectionLease(this, acquire(options));
}

// ============================================================================
// Pool Management
// ============================================================================

void ConnectionPool::warmup(const std::vector<std::string>& urls) {
    ErrorContext context("warmup");

    for (const auto& url : urls) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            throwIfShutdownLocked();
            endpointLocked(ConnectionOptions{url});
        }
        topUp(url);
    }
}

void ConnectionPool::removeEndpoint(const std::string& url) {
    std::vector<PooledPtr> toDestroy;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_endpoints.find(url);
        if (it == m_endpoints.end()) {
            return;
        }

        Endpoint& ep = it->second;
        ++ep.generation;
        ep.retired = true;
        toDestroy.assign(ep.idle.begin(), ep.idle.end());
        ep.idle.clear();
        grantSlotsLocked();
    }

    destroyAll(toDestroy);
    spdlog::info("Removed endpoint {} ({} idle connections closed)", url, toDestroy.size());
}

void ConnectionPool::shutdown() {
    // Joins a running maintenance pass, unless called from inside one
    m_timers.stop();

    std::vector<PooledPtr> toDestroy;
    size_t failedWaiters = 0;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;

        for (auto& waiter : m_waiters) {
            waiter->cancelled = true;
            waiter->cv.notify_one();
        }
        failedWaiters = m_waiters.size();
        m_waiters.clear();

        for (auto& [url, ep] : m_endpoints) {
            toDestroy.insert(toDestroy.end(), ep.idle.begin(), ep.idle.end());
            ep.idle.clear();
            ep.active = 0;
        }

        for (auto& [conn, pooled] : m_active) {
            toDestroy.push_back(pooled);
        }
        m_active.clear();
    }

    destroyAll(toDestroy);
    spdlog::info("Connection pool shut down ({} connections closed, {} waiters failed)",
                 toDestroy.size(), failedWaiters);
}

bool ConnectionPool::isShutdown() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shutdown;
}

// ============================================================================
// Pool Statistics
// ============================================================================

PoolStats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    PoolStats stats;
    for (const auto& [url, ep] : m_endpoints) {
        stats.idleConnections += ep.idle.size();
    }
    stats.activeConnections = m_active.size();
    stats.totalConnections = stats.activeConnections + stats.idleConnections;
    stats.waitingRequests = m_waiters.size();
    stats.totalCreated = m_totalCreated.load();
    stats.totalReused = m_totalReused.load();
    stats.totalDestroyed = m_totalDestroyed.load();
    stats.acquireTimeouts = m_acquireTimeouts.load();
    stats.healthCheckFailures = m_healthCheckFailures.load();
    return stats;
}

DetailedPoolStats ConnectionPool::getDetailedStats() const {
    DetailedPoolStats detailed;
    static_cast<PoolStats&>(detailed) = getStats();

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [url, ep] : m_endpoints) {
        detailed.byEndpoint[url] = EndpointStats{ep.idle.size(), ep.active};
    }
    return detailed;
}

// ============================================================================
// Background Maintenance
// ============================================================================

void ConnectionPool::runHealthCheck() {
    ErrorContext context("health-check");

    std::vector<PooledPtr> checking;
    std::vector<std::string> urls;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }

        for (auto& [url, ep] : m_endpoints) {
            if (!ep.retired) {
                urls.push_back(url);
            }
            checking.insert(checking.end(), ep.idle.begin(), ep.idle.end());
            ep.checking += ep.idle.size();
            ep.idle.clear();
        }
    }

    size_t failures = 0;
    for (auto& pooled : checking) {
        // Not reachable by other threads while counted as checking
        pooled->healthy = pingConnection(*pooled);
        if (!pooled->healthy) {
            ++failures;
            ++m_healthCheckFailures;
        }
    }

    std::vector<PooledPtr> toDestroy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        for (auto& pooled : checking) {
            Endpoint& ep = endpointLocked(pooled->url);
            --ep.checking;

            if (m_shutdown || !pooled->healthy || pooled->generation != ep.generation) {
                toDestroy.push_back(pooled);
            } else {
                returnToPoolLocked(pooled, toDestroy);
            }
        }
        grantSlotsLocked();
    }

    if (failures > 0) {
        spdlog::warn("Health check found {} unhealthy connection(s) out of {}",
                     failures, checking.size());
    }
    destroyAll(toDestroy);

    for (const auto& url : urls) {
        topUp(url);
    }
}

void ConnectionPool::runIdleCheck() {
    std::vector<PooledPtr> toDestroy;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }

        auto now = Clock::now();
        for (auto& [url, ep] : m_endpoints) {
            for (auto it = ep.idle.begin(); it != ep.idle.end();) {
                // Keep minimum connections, counting the ones lent out
                if (ep.total() <= m_config.min_connections) {
                    break;
                }

                if (now - (*it)->lastUsedAt > m_config.idle_timeout) {
                    toDestroy.push_back(*it);
                    it = ep.idle.erase(it);
                } else {
                    ++it;
                }
            }
        }

        if (!toDestroy.empty()) {
            grantSlotsLocked();
        }
    }

    if (!toDestroy.empty()) {
        spdlog::debug("Idle check closing {} connection(s)", toDestroy.size());
    }
    destroyAll(toDestroy);
}

void ConnectionPool::topUp(const std::string& url) {
    if (m_config.min_connections == 0) {
        return;
    }

    ErrorContext context(url);
    ConnectionOptions options;
    size_t reserved = 0;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }

        Endpoint& ep = endpointLocked(url);
        options = ep.options;
        // creating counts the reservations made here
        while (ep.total() < m_config.min_connections && hasCapacityLocked(ep)) {
            ++ep.creating;
            ++reserved;
        }
    }

    for (size_t i = 0; i < reserved; ++i) {
        PooledPtr pooled;
        try {
            pooled = createConnection(options);
        } catch (...) {
            reportError(std::current_exception(), nullptr);
            std::lock_guard<std::mutex> lock(m_mutex);
            --endpointLocked(url).creating;
            grantSlotsLocked();
            continue;
        }

        std::vector<PooledPtr> toDestroy;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            Endpoint& ep = endpointLocked(url);
            --ep.creating;
            pooled->generation = ep.generation;

            if (m_shutdown) {
                toDestroy.push_back(pooled);
            } else {
                returnToPoolLocked(pooled, toDestroy);
            }
        }
        destroyAll(toDestroy);
    }
}

// ============================================================================
// Internal Helpers (m_mutex held)
// ============================================================================

ConnectionPool::Endpoint& ConnectionPool::endpointLocked(const ConnectionOptions& options) {
    Endpoint& ep = m_endpoints[options.url];
    ep.options = options;
    ep.retired = false;
    return ep;
}

ConnectionPool::Endpoint& ConnectionPool::endpointLocked(const std::string& url) {
    auto it = m_endpoints.find(url);
    if (it != m_endpoints.end()) {
        return it->second;
    }
    Endpoint& ep = m_endpoints[url];
    ep.options.url = url;
    return ep;
}

size_t ConnectionPool::totalLocked() const {
    size_t total = 0;
    for (const auto& [url, ep] : m_endpoints) {
        total += ep.total();
    }
    return total;
}

bool ConnectionPool::hasEndpointRoom(const Endpoint& ep) const {
    return ep.total() < m_config.max_connections;
}

bool ConnectionPool::hasCapacityLocked(const Endpoint& ep) const {
    return hasEndpointRoom(ep) && totalLocked() < m_config.max_total_connections;
}

bool ConnectionPool::isExpired(const PooledConnection& pooled, Clock::time_point now) const {
    return now - pooled.createdAt > m_config.max_connection_age;
}

void ConnectionPool::activateLocked(Endpoint& ep, const PooledPtr& pooled, bool reused) {
    ++pooled->useCount;
    pooled->lastUsedAt = Clock::now();
    m_active[pooled->connection.get()] = pooled;
    ++ep.active;
    if (reused) {
        ++m_totalReused;
    }
}

void ConnectionPool::returnToPoolLocked(const PooledPtr& pooled,
                                        std::vector<PooledPtr>& toDestroy) {
    Endpoint& ep = endpointLocked(pooled->url);

    // Oldest waiter for this endpoint gets the connection directly
    for (auto it = m_waiters.begin(); it != m_waiters.end(); ++it) {
        if ((*it)->url == pooled->url) {
            WaiterPtr waiter = *it;
            m_waiters.erase(it);
            activateLocked(ep, pooled, true);
            waiter->handoff = pooled;
            waiter->cv.notify_one();
            return;
        }
    }

    // Parking it idle would keep another endpoint's waiter blocked on the global cap
    if (!m_waiters.empty() && totalLocked() + 1 >= m_config.max_total_connections) {
        for (const auto& waiter : m_waiters) {
            if (hasEndpointRoom(endpointLocked(waiter->url))) {
                toDestroy.push_back(pooled);
                grantSlotsLocked();
                return;
            }
        }
    }

    ep.idle.push_back(pooled);
}

void ConnectionPool::grantSlotsLocked() {
    for (auto it = m_waiters.begin(); it != m_waiters.end();) {
        WaiterPtr waiter = *it;
        Endpoint& ep = endpointLocked(waiter->url);

        if (!ep.idle.empty()) {
            PooledPtr pooled = ep.idle.front();
            ep.idle.pop_front();
            activateLocked(ep, pooled, true);
            waiter->handoff = pooled;
        } else if (hasCapacityLocked(ep)) {
            ++ep.creating;
            waiter->slotGranted = true;
        } else {
            ++it;
            continue;
        }

        waiter->cv.notify_one();
        it = m_waiters.erase(it);
    }
}

void ConnectionPool::throwIfShutdownLocked() const {
    if (m_shutdown) {
        throw ShutdownError("Connection pool is shutting down");
    }
}

// ============================================================================
// Connection Creation and Destruction (m_mutex not held)
// ============================================================================

std::shared_ptr<Connection> ConnectionPool::createReserved(std::unique_lock<std::mutex>& lock,
                                                           const ConnectionOptions& options) {
    lock.unlock();

    PooledPtr pooled;
    try {
        pooled = createConnection(options);
    } catch (...) {
        auto error = ErrorHandler::asTransportError(
            std::current_exception(), "Failed to create connection to " + options.url);
        lock.lock();
        --endpointLocked(options.url).creating;
        grantSlotsLocked();
        std::rethrow_exception(error);
    }

    lock.lock();
    Endpoint& ep = endpointLocked(options.url);
    --ep.creating;

    if (m_shutdown) {
        lock.unlock();
        destroyConnection(pooled);
        throw ShutdownError("Connection pool is shutting down");
    }

    pooled->generation = ep.generation;
    activateLocked(ep, pooled, false);
    return pooled->connection;
}

ConnectionPool::PooledPtr ConnectionPool::createConnection(const ConnectionOptions& options) {
    std::shared_ptr<Connection> connection = m_factory(options);
    if (!connection) {
        throw TransportError("Connection factory returned no connection for " + options.url);
    }

    auto pooled = std::make_shared<PooledConnection>();
    pooled->connection = std::move(connection);
    pooled->url = options.url;
    pooled->createdAt = Clock::now();
    pooled->lastUsedAt = pooled->createdAt;

    ++m_totalCreated;
    spdlog::debug("Created connection {} to {} (total created: {})",
                  pooled->connection->id(), options.url, m_totalCreated.load());

    if (m_callbacks.onCreate) {
        try {
            m_callbacks.onCreate(*pooled->connection);
        } catch (...) {
            spdlog::warn("onCreate callback failed: {}",
                         ErrorHandler::describe(std::current_exception()));
        }
    }

    return pooled;
}

bool ConnectionPool::pingConnection(const PooledConnection& pooled) {
    try {
        return pooled.connection->ping();
    } catch (...) {
        spdlog::debug("Ping failed for connection {}: {}", pooled.connection->id(),
                      ErrorHandler::describe(std::current_exception()));
        return false;
    }
}

void ConnectionPool::destroyConnection(const PooledPtr& pooled) {
    try {
        pooled->connection->close();
    } catch (...) {
        reportError(std::current_exception(), pooled->connection.get());
    }

    ++m_totalDestroyed;
    spdlog::debug("Destroyed connection {} to {} (used {} times)",
                  pooled->connection->id(), pooled->url, pooled->useCount);

    if (m_callbacks.onDestroy) {
        try {
            m_callbacks.onDestroy(*pooled->connection);
        } catch (...) {
            spdlog::warn("onDestroy callback failed: {}",
                         ErrorHandler::describe(std::current_exception()));
        }
    }
}

void ConnectionPool::destroyAll(const std::vector<PooledPtr>& connections) {
    for (const auto& pooled : connections) {
        destroyConnection(pooled);
    }
}

void ConnectionPool::reportError(std::exception_ptr error, Connection* conn) {
    std::string context = ErrorContext::current();
    spdlog::warn("{}{}{}",
                 context.empty() ? std::string() : context + ": ",
                 ErrorHandler::describe(error),
                 conn ? " (connection " + conn->id() + ")" : std::string());

    if (m_callbacks.onError) {
        try {
            m_callbacks.onError(error, conn);
        } catch (...) {
            spdlog::warn("onError callback failed: {}",
                         ErrorHandler::describe(std::current_exception()));
        }
    }
}

}  // namespace mcpperf
