#include "Types.hpp"
#include "ErrorHandler.hpp"

namespace mcpperf {

namespace {

template<typename T>
void putOptional(Json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template<typename T>
void getOptional(const Json& j, const char* key, std::optional<T>& value) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        value = it->get<T>();
    } else {
        value.reset();
    }
}

}  // namespace

void to_json(Json& j, const ToolDefinition& def) {
    j = Json{{"name", def.name}, {"inputSchema", def.inputSchema}};
    putOptional(j, "description", def.description);
}

void from_json(const Json& j, ToolDefinition& def) {
    j.at("name").get_to(def.name);
    getOptional(j, "description", def.description);
    def.inputSchema = j.value("inputSchema", Json::object());
}

void to_json(Json& j, const ResourceDefinition& def) {
    j = Json{{"uri", def.uri}, {"name", def.name}};
    putOptional(j, "description", def.description);
    putOptional(j, "mimeType", def.mimeType);
}

void from_json(const Json& j, ResourceDefinition& def) {
    j.at("uri").get_to(def.uri);
    j.at("name").get_to(def.name);
    getOptional(j, "description", def.description);
    getOptional(j, "mimeType", def.mimeType);
}

void to_json(Json& j, const PromptArgument& arg) {
    j = Json{{"name", arg.name}, {"required", arg.required}};
    putOptional(j, "description", arg.description);
}

void from_json(const Json& j, PromptArgument& arg) {
    j.at("name").get_to(arg.name);
    getOptional(j, "description", arg.description);
    arg.required = j.value("required", false);
}

void to_json(Json& j, const PromptDefinition& def) {
    j = Json{{"name", def.name}, {"arguments", def.arguments}};
    putOptional(j, "description", def.description);
}

void from_json(const Json& j, PromptDefinition& def) {
    j.at("name").get_to(def.name);
    getOptional(j, "description", def.description);
    def.arguments = j.value("arguments", std::vector<PromptArgument>{});
}

void to_json(Json& j, const ContentItem& item) {
    j = Json{{"type", contentTypeName(item.type)}};
    putOptional(j, "text", item.text);
    putOptional(j, "data", item.data);
    putOptional(j, "mimeType", item.mimeType);
    putOptional(j, "uri", item.uri);
}

void from_json(const Json& j, ContentItem& item) {
    item.type = parseContentType(j.at("type").get<std::string>());
    getOptional(j, "text", item.text);
    getOptional(j, "data", item.data);
    getOptional(j, "mimeType", item.mimeType);
    getOptional(j, "uri", item.uri);
}

void to_json(Json& j, const ToolCallResult& result) {
    j = Json{{"content", result.content}, {"isError", result.isError}};
}

void from_json(const Json& j, ToolCallResult& result) {
    result.content = j.value("content", std::vector<ContentItem>{});
    result.isError = j.value("isError", false);
}

std::string contentTypeName(ContentItem::Type type) {
    switch (type) {
        case ContentItem::Type::Text:
            return "text";
        case ContentItem::Type::Image:
            return "image";
        case ContentItem::Type::Audio:
            return "audio";
        case ContentItem::Type::Resource:
            return "resource";
    }
    return "text";
}

ContentItem::Type parseContentType(const std::string& name) {
    if (name == "text") return ContentItem::Type::Text;
    if (name == "image") return ContentItem::Type::Image;
    if (name == "audio") return ContentItem::Type::Audio;
    if (name == "resource") return ContentItem::Type::Resource;
    throw TransportError("Unknown content type: " + name);
}

ToolCallResult makeTextResult(std::string text, bool isError) {
    ToolCallResult result;
    ContentItem item;
    item.type = ContentItem::Type::Text;
    item.text = std::move(text);
    result.content.push_back(std::move(item));
    result.isError = isError;
    return result;
}

}  // namespace mcpperf
