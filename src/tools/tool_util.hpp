#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace mcpgate {

// Parse JSON tool arguments. Empty input counts as {}.
// Returns error ToolResult on failure or when the arguments are not an object.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    if (args_json.empty()) {
        out = nlohmann::json::object();
        return std::nullopt;
    }
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (out.is_null()) out = nlohmann::json::object();
    if (!out.is_object()) {
        return ToolResult{false, "Arguments must be a JSON object"};
    }
    return std::nullopt;
}

// Read an optional string field; absent or null keeps `fallback`.
// Returns error ToolResult if present with another type.
inline std::optional<ToolResult> optional_string(const nlohmann::json& args, const char* field,
                                                 std::string& out, const std::string& fallback) {
    out = fallback;
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_string()) {
        return ToolResult{false, std::string("Parameter '") + field + "' must be a string"};
    }
    out = args[field].get<std::string>();
    return std::nullopt;
}

} // namespace mcpgate
