#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace clipboard_mcp::mcp {

constexpr std::size_t kMaxClipboardTextLength = 1048576;

enum class PropertyType {
  String,
  Integer,
  Number,
  Boolean,
  Object,
  Array,
};

const char* property_type_name(PropertyType type) noexcept;

struct PropertySchema {
  std::string name;
  PropertyType type{PropertyType::String};
  std::string description{};
  bool required{false};
  // Upper bound in Unicode code points; strings only.
  std::optional<std::size_t> max_length{};
};

struct ToolSchema {
  std::vector<PropertySchema> properties{};

  [[nodiscard]] const PropertySchema* find(const std::string& name) const noexcept;
  [[nodiscard]] bool has_required() const noexcept;
  [[nodiscard]] nlohmann::json to_json() const;
};

struct ToolDefinition {
  std::string name;
  std::string description;
  ToolSchema input_schema;

  [[nodiscard]] nlohmann::json to_json() const;
};

class SchemaRegistry {
 public:
  // Throws std::invalid_argument on an empty or duplicate tool name.
  explicit SchemaRegistry(std::vector<ToolDefinition> tools);

  [[nodiscard]] const ToolDefinition* find(const std::string& name) const noexcept;
  [[nodiscard]] const std::vector<ToolDefinition>& tools() const noexcept;
  [[nodiscard]] nlohmann::json to_json() const;

 private:
  std::vector<ToolDefinition> tools_;
};

// get_clipboard and set_clipboard, in that order.
const SchemaRegistry& clipboard_schema_registry();

}  // namespace clipboard_mcp::mcp
