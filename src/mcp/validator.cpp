#include "mcp/validator.hpp"

#include <sstream>

namespace clipboard_mcp::mcp {

namespace {

bool matches_type(const nlohmann::json& value, const PropertyType type) {
  switch (type) {
    case PropertyType::String:
      return value.is_string();
    case PropertyType::Integer:
      return value.is_number_integer();
    case PropertyType::Number:
      return value.is_number();
    case PropertyType::Boolean:
      return value.is_boolean();
    case PropertyType::Object:
      return value.is_object();
    case PropertyType::Array:
      return value.is_array();
  }
  return false;
}

}  // namespace

std::size_t code_point_length(const std::string_view utf8) noexcept {
  std::size_t count = 0;
  for (const char c : utf8) {
    // Continuation bytes are 10xxxxxx.
    if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

Result<ValidatedArguments> validate(const SchemaRegistry& registry, const std::string& tool_name,
                                    const nlohmann::json& arguments) {
  const auto* tool = registry.find(tool_name);
  if (tool == nullptr) {
    return Error{.kind = ErrorKind::MethodNotFound, .details = "unknown tool: " + tool_name};
  }
  const auto& schema = tool->input_schema;

  nlohmann::json candidate = arguments;
  if (candidate.is_null()) {
    if (schema.has_required()) {
      return invalid_params(tool_name + " requires arguments");
    }
    candidate = nlohmann::json::object();
  }

  if (!candidate.is_object()) {
    return invalid_params("arguments must be an object");
  }

  for (const auto& property : schema.properties) {
    if (property.required && !candidate.contains(property.name)) {
      return invalid_params(tool_name + " requires '" + property.name + "' parameter");
    }
  }

  for (const auto& item : candidate.items()) {
    if (schema.find(item.key()) == nullptr) {
      return invalid_params("unexpected parameter '" + item.key() + "' for " + tool_name);
    }
  }

  for (const auto& property : schema.properties) {
    const auto it = candidate.find(property.name);
    if (it == candidate.end()) {
      continue;
    }

    if (!matches_type(*it, property.type)) {
      return invalid_params("'" + property.name + "' parameter must be of type " +
                            property_type_name(property.type));
    }

    if (property.max_length.has_value() && it->is_string()) {
      const auto length = code_point_length(it->get_ref<const std::string&>());
      if (length > *property.max_length) {
        std::ostringstream details;
        details << property.name << " exceeds size limit of " << *property.max_length << " characters (got "
                << length << ")";
        return invalid_params(details.str());
      }
    }
  }

  return ValidatedArguments{.tool = tool, .values = std::move(candidate)};
}

}  // namespace clipboard_mcp::mcp
