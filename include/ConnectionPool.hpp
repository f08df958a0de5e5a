#pragma once

/**
 * @file ConnectionPool.hpp
 * @brief Thread-safe, per-endpoint bounded pool of Connection objects.
 *
 * Connections are created lazily through a ConnectionFactory, reused across
 * callers, validated on acquire and maintained by two background loops
 * (health check and idle eviction) running on the pool's TimerQueue.
 */

#include "Config.hpp"
#include "Connection.hpp"
#include "ConnectionLease.hpp"
#include "TimerQueue.hpp"
#include "Types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mcpperf {

/**
 * @class ConnectionPool
 * @brief Bounded pool of reusable connections, partitioned by endpoint url.
 *
 * Key features:
 * - Per-endpoint (max_connections) and global (max_total_connections) caps
 * - Ping validation and max-age rotation on acquire
 * - FIFO hand-off of released connections to blocked acquirers
 * - Acquire deadline (AcquireTimeoutError) and shutdown (ShutdownError)
 * - Background health checking with top-up to min_connections
 * - Background idle eviction that never drops below min_connections
 *
 * Thread Safety:
 * - All public methods are thread-safe.
 * - The factory, ping() and close() are always invoked without the pool mutex
 *   held, so a slow endpoint never blocks bookkeeping for other callers.
 * - A connection is lent to exactly one caller at a time.
 *
 * @see ConnectionLease for scoped borrowing
 */
class ConnectionPool {
public:
    using CreateCallback = std::function<void(Connection&)>;
    using DestroyCallback = std::function<void(Connection&)>;
    using ErrorCallback = std::function<void(std::exception_ptr, Connection*)>;

    /**
     * @brief Optional lifecycle notifications. All run outside the pool mutex.
     */
    struct Callbacks {
        CreateCallback onCreate;
        DestroyCallback onDestroy;
        ErrorCallback onError;  ///< Background and close failures
    };

    /**
     * @brief Create a pool and start its background loops.
     * @param factory Function producing live connections.
     * @param config Pool limits and timings.
     * @param callbacks Lifecycle notifications.
     * @throws ConfigurationError if factory is empty.
     */
    ConnectionPool(ConnectionFactory factory, const PoolConfig& config,
                   Callbacks callbacks = {});

    /**
     * @brief Destructor - equivalent to shutdown().
     */
    ~ConnectionPool();

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Borrow a connection for the given endpoint, blocking if necessary.
     * @return A connection that must be handed back with release().
     * @throws AcquireTimeoutError if none became available within acquire_timeout.
     * @throws ShutdownError if the pool is (or becomes) shut down.
     * @throws TransportError if the factory failed to create a connection.
     *
     * Search order: idle connections (oldest first, validated), then a new
     * connection if both caps allow it, then a FIFO wait.
     */
    std::shared_ptr<Connection> acquire(const ConnectionOptions& options);

    std::shared_ptr<Connection> acquire(const std::string& url) {
        return acquire(ConnectionOptions{url});
    }

    /**
     * @brief Return a borrowed connection.
     *
     * The oldest waiter for the same endpoint receives it directly. A connection
     * the pool does not track is closed and never pooled.
     */
    void release(const std::shared_ptr<Connection>& connection);

    /**
     * @brief acquire() wrapped in an RAII lease.
     */
    ConnectionLease lease(const ConnectionOptions& options);

    /**
     * @brief Run fn with a borrowed connection, releasing it on every exit path.
     * @return Whatever fn returns; exceptions from fn propagate.
     */
    template<typename Func>
    auto withConnection(const ConnectionOptions& options, Func&& fn)
        -> std::invoke_result_t<Func&, Connection&> {
        ConnectionLease held = lease(options);
        return fn(*held);
    }

    /**
     * @brief Pre-create idle connections up to min_connections per endpoint.
     *
     * Factory failures are reported through onError and do not stop warmup.
     */
    void warmup(const std::vector<std::string>& urls);

    /**
     * @brief Close the idle connections of an endpoint.
     *
     * Connections currently lent out for that endpoint are closed when released.
     */
    void removeEndpoint(const std::string& url);

    /**
     * @brief Stop background loops, fail waiters and close every tracked connection.
     *
     * After shutdown, acquire() throws ShutdownError. Idempotent.
     */
    void shutdown();

    bool isShutdown() const;

    PoolStats getStats() const;
    DetailedPoolStats getDetailedStats() const;

    const PoolConfig& config() const { return m_config; }

    /**
     * @brief One pass of the health loop: ping idle connections, drop failures,
     *        top endpoints back up to min_connections.
     */
    void runHealthCheck();

    /**
     * @brief One pass of the idle loop: close connections idle past idle_timeout.
     */
    void runIdleCheck();

private:
    using Clock = std::chrono::steady_clock;

    struct PooledConnection {
        std::shared_ptr<Connection> connection;
        std::string url;
        Clock::time_point createdAt;
        Clock::time_point lastUsedAt;
        uint64_t useCount = 0;
        uint64_t generation = 0;    ///< Endpoint generation at creation
        bool healthy = true;
    };
    using PooledPtr = std::shared_ptr<PooledConnection>;

    struct Waiter {
        std::string url;
        Clock::time_point enqueuedAt;
        PooledPtr handoff;          ///< Connection handed over directly
        bool slotGranted = false;   ///< Creation slot reserved on our behalf
        bool cancelled = false;     ///< Pool shut down while waiting
        std::condition_variable cv;
    };
    using WaiterPtr = std::shared_ptr<Waiter>;

    struct Endpoint {
        ConnectionOptions options;
        std::list<PooledPtr> idle;  ///< Oldest released first
        size_t active = 0;
        size_t checking = 0;        ///< Being pinged outside the lock
        size_t creating = 0;        ///< Reserved slots for in-flight creations
        uint64_t generation = 0;    ///< Bumped by removeEndpoint()
        bool retired = false;       ///< Removed and not acquired since

        size_t total() const { return idle.size() + active + checking + creating; }
    };

    Endpoint& endpointLocked(const ConnectionOptions& options);
    Endpoint& endpointLocked(const std::string& url);
    size_t totalLocked() const;
    bool hasEndpointRoom(const Endpoint& ep) const;
    bool hasCapacityLocked(const Endpoint& ep) const;
    bool isExpired(const PooledConnection& pooled, Clock::time_point now) const;

    void activateLocked(Endpoint& ep, const PooledPtr& pooled, bool reused);
    void returnToPoolLocked(const PooledPtr& pooled, std::vector<PooledPtr>& toDestroy);
    void grantSlotsLocked();
    void throwIfShutdownLocked() const;

    std::shared_ptr<Connection> createReserved(std::unique_lock<std::mutex>& lock,
                                               const ConnectionOptions& options);
    PooledPtr createConnection(const ConnectionOptions& options);
    bool pingConnection(const PooledConnection& pooled);
    void destroyConnection(const PooledPtr& pooled);
    void destroyAll(const std::vector<PooledPtr>& connections);
    void topUp(const std::string& url);
    void reportError(std::exception_ptr error, Connection* conn);

    ConnectionFactory m_factory;
    PoolConfig m_config;
    Callbacks m_callbacks;

    std::map<std::string, Endpoint> m_endpoints;
    std::unordered_map<const Connection*, PooledPtr> m_active;
    std::list<WaiterPtr> m_waiters;  ///< Global FIFO across endpoints
    bool m_shutdown = false;

    std::atomic<uint64_t> m_totalCreated{0};
    std::atomic<uint64_t> m_totalReused{0};
    std::atomic<uint64_t> m_totalDestroyed{0};
    std::atomic<uint64_t> m_acquireTimeouts{0};
    std::atomic<uint64_t> m_healthCheckFailures{0};

    mutable std::mutex m_mutex;
    TimerQueue m_timers;
};

}  // namespace mcpperf
