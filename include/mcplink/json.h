#ifndef MCPLINK_JSON_H
#define MCPLINK_JSON_H

// JSON serialization for mcplink types. The free functions follow the
// nlohmann/json ADL conventions so values convert with j.get<T>() and
// json(value).

#include <nlohmann/json.hpp>

#include "mcplink/types.h"

namespace mcplink {

using json = nlohmann::json;

// Content types
void to_json(json& j, const TextContent& content);
void from_json(const json& j, TextContent& content);

void to_json(json& j, const ImageContent& content);
void from_json(const json& j, ImageContent& content);

void to_json(json& j, const ResourceContent& content);
void from_json(const json& j, ResourceContent& content);

void to_json(json& j, const ContentBlock& block);
void from_json(const json& j, ContentBlock& block);

// Tool types
void to_json(json& j, const ToolDescriptor& tool);
void from_json(const json& j, ToolDescriptor& tool);

void to_json(json& j, const CallToolResult& result);
void from_json(const json& j, CallToolResult& result);

// Errors are written in JSON-RPC error object shape plus the context fields
void to_json(json& j, const Error& error);

}  // namespace mcplink

#endif  // MCPLINK_JSON_H
