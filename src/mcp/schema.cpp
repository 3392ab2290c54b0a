#include "mcp/schema.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace clipboard_mcp::mcp {

namespace {

SchemaRegistry build_clipboard_registry() {
  ToolDefinition get_clipboard{.name = "get_clipboard",
                               .description = "Get the current text contents of the system clipboard.",
                               .input_schema = ToolSchema{}};

  ToolDefinition set_clipboard{
      .name = "set_clipboard",
      .description = "Set the system clipboard to the provided text.",
      .input_schema = ToolSchema{.properties = {PropertySchema{.name = "text",
                                                               .type = PropertyType::String,
                                                               .description = "The text to copy to the clipboard.",
                                                               .required = true,
                                                               .max_length = kMaxClipboardTextLength}}}};

  std::vector<ToolDefinition> tools;
  tools.push_back(std::move(get_clipboard));
  tools.push_back(std::move(set_clipboard));
  return SchemaRegistry(std::move(tools));
}

}  // namespace

const char* property_type_name(const PropertyType type) noexcept {
  switch (type) {
    case PropertyType::String:
      return "string";
    case PropertyType::Integer:
      return "integer";
    case PropertyType::Number:
      return "number";
    case PropertyType::Boolean:
      return "boolean";
    case PropertyType::Object:
      return "object";
    case PropertyType::Array:
      return "array";
  }
  return "unknown";
}

const PropertySchema* ToolSchema::find(const std::string& name) const noexcept {
  for (const auto& property : properties) {
    if (property.name == name) {
      return &property;
    }
  }
  return nullptr;
}

bool ToolSchema::has_required() const noexcept {
  for (const auto& property : properties) {
    if (property.required) {
      return true;
    }
  }
  return false;
}

nlohmann::json ToolSchema::to_json() const {
  nlohmann::json props = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();

  for (const auto& property : properties) {
    nlohmann::json entry{{"type", property_type_name(property.type)}};
    if (!property.description.empty()) {
      entry["description"] = property.description;
    }
    if (property.max_length.has_value()) {
      entry["maxLength"] = *property.max_length;
    }
    props[property.name] = std::move(entry);

    if (property.required) {
      required.push_back(property.name);
    }
  }

  return nlohmann::json{{"type", "object"},
                        {"properties", props},
                        {"required", required},
                        {"additionalProperties", false}};
}

nlohmann::json ToolDefinition::to_json() const {
  return nlohmann::json{{"name", name}, {"description", description}, {"inputSchema", input_schema.to_json()}};
}

SchemaRegistry::SchemaRegistry(std::vector<ToolDefinition> tools) : tools_(std::move(tools)) {
  std::unordered_set<std::string> seen;
  for (const auto& tool : tools_) {
    if (tool.name.empty()) {
      throw std::invalid_argument("tool name must not be empty");
    }
    if (!seen.insert(tool.name).second) {
      throw std::invalid_argument("duplicate tool name: " + tool.name);
    }
  }
}

const ToolDefinition* SchemaRegistry::find(const std::string& name) const noexcept {
  for (const auto& tool : tools_) {
    if (tool.name == name) {
      return &tool;
    }
  }
  return nullptr;
}

const std::vector<ToolDefinition>& SchemaRegistry::tools() const noexcept { return tools_; }

nlohmann::json SchemaRegistry::to_json() const {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& tool : tools_) {
    list.push_back(tool.to_json());
  }
  return list;
}

const SchemaRegistry& clipboard_schema_registry() {
  static const SchemaRegistry registry = build_clipboard_registry();
  return registry;
}

}  // namespace clipboard_mcp::mcp
