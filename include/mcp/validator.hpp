#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mcp/errors.hpp"
#include "mcp/schema.hpp"

namespace clipboard_mcp::mcp {

struct ValidatedArguments {
  const ToolDefinition* tool{nullptr};
  // Object holding declared properties only.
  nlohmann::json values;
};

// Number of Unicode code points in a UTF-8 string.
std::size_t code_point_length(std::string_view utf8) noexcept;

// `arguments` may be null when the caller omitted it.
Result<ValidatedArguments> validate(const SchemaRegistry& registry, const std::string& tool_name,
                                    const nlohmann::json& arguments);

}  // namespace clipboard_mcp::mcp
