#include "mcplink/json.h"

#include <stdexcept>

namespace mcplink {

// TextContent
void to_json(json& j, const TextContent& content) {
  j = json{{"type", content.type}, {"text", content.text}};
}

void from_json(const json& j, TextContent& content) {
  if (j.contains("type")) {
    content.type = j.at("type").get<std::string>();
  }
  content.text = j.at("text").get<std::string>();
}

// ImageContent
void to_json(json& j, const ImageContent& content) {
  j = json{{"type", content.type},
           {"data", content.data},
           {"mimeType", content.mimeType}};
}

void from_json(const json& j, ImageContent& content) {
  if (j.contains("type")) {
    content.type = j.at("type").get<std::string>();
  }
  content.data = j.at("data").get<std::string>();
  content.mimeType = j.at("mimeType").get<std::string>();
}

// ResourceContent keeps the whole part so resource links survive a round
// trip unchanged
void to_json(json& j, const ResourceContent& content) {
  j = content.resource;
  j["type"] = content.type;
}

void from_json(const json& j, ResourceContent& content) {
  content.type = j.value("type", std::string("resource"));
  content.resource = j;
  content.resource.erase("type");
}

// ContentBlock
void to_json(json& j, const ContentBlock& block) {
  match(
      block, [&j](const TextContent& text) { to_json(j, text); },
      [&j](const ImageContent& image) { to_json(j, image); },
      [&j](const ResourceContent& resource) { to_json(j, resource); });
}

void from_json(const json& j, ContentBlock& block) {
  if (!j.is_object()) {
    throw std::invalid_argument("content block must be an object");
  }
  const std::string type = j.value("type", std::string());
  if (type == "text") {
    block = j.get<TextContent>();
  } else if (type == "image") {
    block = j.get<ImageContent>();
  } else if (type == "resource" || type == "resource_link") {
    block = j.get<ResourceContent>();
  } else {
    throw std::invalid_argument("unsupported content type: '" + type + "'");
  }
}

// ToolDescriptor
void to_json(json& j, const ToolDescriptor& tool) {
  j = json{{"name", tool.name}, {"inputSchema", tool.input_schema}};
  if (tool.description.has_value()) {
    j["description"] = tool.description.value();
  }
}

void from_json(const json& j, ToolDescriptor& tool) {
  tool.name = j.at("name").get<std::string>();
  if (j.contains("description") && j.at("description").is_string()) {
    tool.description = j.at("description").get<std::string>();
  } else {
    tool.description.reset();
  }
  if (j.contains("inputSchema")) {
    tool.input_schema = j.at("inputSchema");
  } else {
    tool.input_schema = json::object();
  }
}

// CallToolResult
void to_json(json& j, const CallToolResult& result) {
  json content = json::array();
  for (const auto& block : result.content) {
    json part;
    to_json(part, block);
    content.push_back(std::move(part));
  }
  j = json{{"content", std::move(content)}, {"isError", result.isError}};
}

void from_json(const json& j, CallToolResult& result) {
  result.content.clear();
  if (j.contains("content")) {
    for (const auto& part : j.at("content")) {
      ContentBlock block;
      from_json(part, block);
      result.content.push_back(std::move(block));
    }
  }
  result.isError = j.contains("isError") && j.at("isError").is_boolean() &&
                   j.at("isError").get<bool>();
}

// Error
void to_json(json& j, const Error& error) {
  j = json{{"code", error.code},
           {"message", error.message},
           {"kind", errorKindToString(error.kind)}};
  if (!error.server_id.empty()) {
    j["serverId"] = error.server_id;
  }
  if (!error.tool_name.empty()) {
    j["toolName"] = error.tool_name;
  }
  if (!error.method.empty()) {
    j["method"] = error.method;
  }
  if (error.timeout.count() > 0) {
    j["timeoutMs"] = error.timeout.count();
  }
}

}  // namespace mcplink
