#include "ConnectionLease.hpp"
#include "ConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace mcpperf {

ConnectionLease::ConnectionLease(ConnectionPool* pool, std::shared_ptr<Connection> conn)
    : m_pool(pool), m_conn(std::move(conn)) {
}

ConnectionLease::~ConnectionLease() {
    release();
}

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : m_pool(other.m_pool), m_conn(std::move(other.m_conn)) {
    other.m_pool = nullptr;
}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        release();
        m_pool = other.m_pool;
        m_conn = std::move(other.m_conn);
        other.m_pool = nullptr;
    }
    return *this;
}

void ConnectionLease::release() {
    if (!m_conn) {
        return;
    }

    auto conn = std::move(m_conn);
    m_conn.reset();

    if (m_pool) {
        try {
            m_pool->release(conn);
        } catch (...) {
            // Runs from destructors; the pool reports its own failures
            spdlog::error("Failed to release connection {}: {}", conn->id(),
                          ErrorHandler::describe(std::current_exception()));
        }
    }
    m_pool = nullptr;
}

}  // namespace mcpperf
