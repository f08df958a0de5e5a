#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpperf {

using Json = nlohmann::json;

struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    Json inputSchema = Json::object();
};

struct ResourceDefinition {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;
};

struct PromptDefinition {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;
};

// Content returned from a tool call
struct ContentItem {
    enum class Type {
        Text,
        Image,
        Audio,
        Resource
    };

    Type type = Type::Text;
    std::optional<std::string> text;
    std::optional<std::vector<uint8_t>> data;
    std::optional<std::string> mimeType;
    std::optional<std::string> uri;
};

struct ToolCallResult {
    std::vector<ContentItem> content;
    bool isError = false;
};

// One element of an executor batch
struct ToolCall {
    std::string name;
    Json args = Json::object();
};

struct EndpointStats {
    size_t idle = 0;
    size_t active = 0;
};

struct PoolStats {
    size_t totalConnections = 0;
    size_t activeConnections = 0;
    size_t idleConnections = 0;
    size_t waitingRequests = 0;
    uint64_t totalCreated = 0;
    uint64_t totalReused = 0;
    uint64_t totalDestroyed = 0;
    uint64_t acquireTimeouts = 0;
    uint64_t healthCheckFailures = 0;
};

struct DetailedPoolStats : PoolStats {
    std::map<std::string, EndpointStats> byEndpoint;
};

struct BatcherStats {
    uint64_t totalCalls = 0;
    uint64_t totalBatches = 0;
    double averageBatchSize = 0.0;
    uint64_t callsSaved = 0;  // round trips avoided by batching
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hitRate = 0.0;
    size_t entries = 0;
    size_t bytesUsed = 0;
};

// JSON conversions, used by the cacher and the storage adapters
void to_json(Json& j, const ToolDefinition& def);
void from_json(const Json& j, ToolDefinition& def);
void to_json(Json& j, const ResourceDefinition& def);
void from_json(const Json& j, ResourceDefinition& def);
void to_json(Json& j, const PromptArgument& arg);
void from_json(const Json& j, PromptArgument& arg);
void to_json(Json& j, const PromptDefinition& def);
void from_json(const Json& j, PromptDefinition& def);
void to_json(Json& j, const ContentItem& item);
void from_json(const Json& j, ContentItem& item);
void to_json(Json& j, const ToolCallResult& result);
void from_json(const Json& j, ToolCallResult& result);

std::string contentTypeName(ContentItem::Type type);
ContentItem::Type parseContentType(const std::string& name);

// Convenience for the common single-text result
ToolCallResult makeTextResult(std::string text, bool isError = false);

}  // namespace mcpperf
