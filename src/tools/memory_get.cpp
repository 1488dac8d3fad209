#include "memory_get.hpp"
#include "../plugin.hpp"
#include <algorithm>
#include <limits>
#include <nlohmann/json.hpp>

static mcpgate::ToolRegistrar reg_memory_get("memory_get",
    []() { return std::make_unique<mcpgate::MemoryGetTool>(); });

namespace mcpgate {

ToolResult MemoryGetTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(memory_, args_json, args)) return *err;

    std::string ns;
    if (auto err = optional_string(args, "namespace", ns, kDefaultNamespace)) return *err;

    std::optional<int64_t> limit;
    if (args.contains("limit") && !args["limit"].is_null()) {
        if (!args["limit"].is_number_integer()) {
            return ToolResult{false, "Parameter 'limit' must be an integer"};
        }
        if (args["limit"].is_number_unsigned()) {
            uint64_t requested = args["limit"].get<uint64_t>();
            uint64_t cap = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
            limit = static_cast<int64_t>(std::min(requested, cap));
        } else {
            limit = args["limit"].get<int64_t>();
        }
    }

    NamespaceDocument doc = memory_->get(ns, limit);
    nlohmann::json out = {
        {"updated_at", doc.updated_at},
        {"entries", entries_to_json(doc.entries)}
    };
    return ToolResult{true, out.dump(2)};
}

std::string MemoryGetTool::description() const {
    return "Get persisted context memory entries for a namespace";
}

std::string MemoryGetTool::parameters_json() const {
    return R"json({"type":"object","properties":{"namespace":{"type":"string","description":"Logical namespace for separating memories (default: default)"},"limit":{"type":"integer","description":"Optional limit for most recent entries"}}})json";
}

} // namespace mcpgate
