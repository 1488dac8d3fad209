#pragma once
#include "memory_tool_util.hpp"

namespace mcpgate {

class MemoryWriteTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "memory_write"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace mcpgate
