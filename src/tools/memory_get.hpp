#pragma once
#include "memory_tool_util.hpp"

namespace mcpgate {

class MemoryGetTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "memory_get"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace mcpgate
