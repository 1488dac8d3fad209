#include "memory_write.hpp"
#include "../plugin.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

static mcpgate::ToolRegistrar reg_memory_write("memory_write",
    []() { return std::make_unique<mcpgate::MemoryWriteTool>(); });

namespace mcpgate {

ToolResult MemoryWriteTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(memory_, args_json, args)) return *err;

    std::string ns;
    if (auto err = optional_string(args, "namespace", ns, kDefaultNamespace)) return *err;

    std::string mode_str;
    if (auto err = optional_string(args, "mode", mode_str, "append")) return *err;

    nlohmann::json data = nlohmann::json::object();
    if (args.contains("data") && !args["data"].is_null()) {
        if (!args["data"].is_object()) {
            return ToolResult{false, "Parameter 'data' must be an object"};
        }
        data = args["data"];
    }

    WriteResult result;
    try {
        result = memory_->write(ns, data, parse_write_mode(mode_str));
    } catch (const std::exception& e) {
        std::cerr << "[memory] " << e.what() << "\n";
        return ToolResult{false, std::string("Failed to write memory: ") + e.what()};
    }

    if (!result.ok()) return ToolResult{false, result.error};
    return ToolResult{true, document_to_json(result.document).dump(2)};
}

std::string MemoryWriteTool::description() const {
    return "Persist context memory entries (append, replace or clear a namespace)";
}

std::string MemoryWriteTool::parameters_json() const {
    return R"json({"type":"object","properties":{"namespace":{"type":"string","description":"Logical namespace for separating memories (default: default)"},"data":{"type":"object","description":"Entry payload to append or replace with"},"mode":{"type":"string","enum":["append","replace","clear"],"description":"Write mode (default: append)"}}})json";
}

} // namespace mcpgate
