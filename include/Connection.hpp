#pragma once

/**
 * @file Connection.hpp
 * @brief Transport-agnostic connection contract used by the pool.
 *
 * The toolkit never talks to the wire itself. Applications wrap their own
 * client (JSON-RPC, gRPC, stdio, ...) in a Connection subclass and hand the
 * pool a ConnectionFactory that produces them.
 */

#include "Types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mcpperf {

/**
 * @brief Options describing the endpoint a connection should target.
 *
 * The url doubles as the pool's partition key for per-endpoint limits.
 */
struct ConnectionOptions {
    std::string url;
    Json extra = Json::object();  ///< Transport specific settings, passed through untouched
};

/**
 * @class Connection
 * @brief A live connection to one remote server.
 *
 * Every operation may block on I/O and may throw. Implementations need not be
 * thread-safe: the pool lends a connection to at most one caller at a time.
 */
class Connection {
public:
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Unique identifier assigned at construction.
     */
    const std::string& id() const { return m_id; }

    /**
     * @brief Time the connection object was created.
     */
    std::chrono::steady_clock::time_point createdAt() const { return m_createdAt; }

    /**
     * @brief Invoke a tool on the remote server.
     * @param name Tool name.
     * @param args Structured arguments.
     * @return The tool's content; protocol-level tool failures set isError.
     */
    virtual ToolCallResult callTool(const std::string& name, const Json& args) = 0;

    virtual std::vector<ToolDefinition> listTools() = 0;
    virtual std::vector<ResourceDefinition> listResources() = 0;
    virtual std::vector<PromptDefinition> listPrompts() = 0;

    /**
     * @brief Check that the remote end is still responsive.
     * @return false (or an exception) marks the connection unhealthy.
     */
    virtual bool ping() = 0;

    /**
     * @brief Close the underlying transport.
     */
    virtual void close() = 0;

protected:
    explicit Connection(std::string id);

private:
    std::string m_id;
    std::chrono::steady_clock::time_point m_createdAt;
};

/**
 * @brief Creates a live connection for the given endpoint; may throw.
 */
using ConnectionFactory = std::function<std::shared_ptr<Connection>(const ConnectionOptions&)>;

// Generate a process-unique id of the form "conn-<sequence>-<random>"
std::string generateConnectionId();

}  // namespace mcpperf
