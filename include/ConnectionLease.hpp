#pragma once

/**
 * @file ConnectionLease.hpp
 * @brief RAII handle for a connection borrowed from ConnectionPool.
 */

#include "Connection.hpp"
#include <memory>

namespace mcpperf {

class ConnectionPool;

/**
 * @class ConnectionLease
 * @brief Returns its connection to the pool when it goes out of scope.
 *
 * Usage:
 * @code
 *   {
 *       auto lease = pool.lease({"http://localhost:50051"});
 *       auto result = lease->callTool("search", {{"q", "pool"}});
 *   }  // connection released here
 * @endcode
 */
class ConnectionLease {
public:
    ConnectionLease() = default;

    /**
     * @note Normally only constructed by ConnectionPool::lease().
     */
    ConnectionLease(ConnectionPool* pool, std::shared_ptr<Connection> conn);

    ~ConnectionLease();

    // Non-copyable to prevent double-release
    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;

    Connection* get() const { return m_conn.get(); }
    Connection* operator->() const { return m_conn.get(); }
    Connection& operator*() const { return *m_conn; }

    explicit operator bool() const { return m_conn != nullptr; }

    const std::shared_ptr<Connection>& connection() const { return m_conn; }

    /**
     * @brief Return the connection early. Safe to call more than once.
     */
    void release();

private:
    ConnectionPool* m_pool = nullptr;   ///< Owning pool
    std::shared_ptr<Connection> m_conn; ///< Borrowed connection
};

}  // namespace mcpperf
