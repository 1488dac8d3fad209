#pragma once
#include "tool_util.hpp"
#include "../memory/memory_service.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace mcpgate {

// Base class for tools that need the memory service.
// The server wires this up after construction.
class MemoryAwareTool : public Tool {
public:
    void set_memory(MemoryService* service) { memory_ = service; }

protected:
    MemoryService* memory_ = nullptr;
};

// Common preamble for memory tool execute(): check memory and parse JSON args.
// Returns a ToolResult error on failure, or std::nullopt on success (args populated).
inline std::optional<ToolResult> parse_memory_tool_args(
    MemoryService* memory, const std::string& args_json, nlohmann::json& out) {
    if (!memory) return ToolResult{false, "Memory system is not enabled"};
    return parse_tool_json(args_json, out);
}

} // namespace mcpgate
