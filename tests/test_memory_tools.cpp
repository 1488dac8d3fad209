#include <catch2/catch.hpp>
#include "tools/memory_get.hpp"
#include "tools/memory_write.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace mcpgate;

static std::string tool_test_dir() {
    return "/tmp/mcpgate_test_tools_" + std::to_string(getpid());
}

static MemoryConfig policy(bool read_only, bool write_enabled) {
    MemoryConfig m;
    m.read_only = read_only;
    m.memory_write_enabled = write_enabled;
    return m;
}

struct ToolTestFixture {
    std::string dir = tool_test_dir();
    NamespaceStore store{dir};
    MemoryService service;
    MemoryGetTool get_tool;
    MemoryWriteTool write_tool;

    explicit ToolTestFixture(MemoryConfig m = policy(false, true)) : service(store, m) {
        get_tool.set_memory(&service);
        write_tool.set_memory(&service);
    }

    ~ToolTestFixture() {
        std::filesystem::remove_all(dir);
    }
};

// ── memory_write ─────────────────────────────────────────────────

TEST_CASE("MemoryWriteTool: appends to the default namespace", "[memory_tools]") {
    ToolTestFixture f;

    auto result = f.write_tool.execute(R"({"data":{"steps":12000}})");
    REQUIRE(result.success);

    auto out = nlohmann::json::parse(result.output);
    REQUIRE(out["entries"].size() == 1);
    REQUIRE(out["entries"][0]["data"]["steps"] == 12000);
    REQUIRE(std::filesystem::exists(f.store.path_for("default")));
}

TEST_CASE("MemoryWriteTool: output is pretty-printed", "[memory_tools]") {
    ToolTestFixture f;
    auto result = f.write_tool.execute(R"({"namespace":"p","data":{"a":1}})");
    REQUIRE(result.output.find("\n  \"entries\"") != std::string::npos);
}

TEST_CASE("MemoryWriteTool: replace and clear modes", "[memory_tools]") {
    ToolTestFixture f;
    f.write_tool.execute(R"({"namespace":"n","data":{"v":1}})");
    f.write_tool.execute(R"({"namespace":"n","data":{"v":2}})");

    auto replaced = f.write_tool.execute(R"({"namespace":"n","mode":"replace","data":{"v":3}})");
    REQUIRE(replaced.success);
    REQUIRE(nlohmann::json::parse(replaced.output)["entries"].size() == 1);

    auto cleared = f.write_tool.execute(R"({"namespace":"n","mode":"clear"})");
    REQUIRE(cleared.success);
    REQUIRE(nlohmann::json::parse(cleared.output)["entries"].empty());
}

TEST_CASE("MemoryWriteTool: missing data appends an empty object", "[memory_tools]") {
    ToolTestFixture f;
    auto result = f.write_tool.execute(R"({"namespace":"n"})");
    REQUIRE(result.success);
    REQUIRE(nlohmann::json::parse(result.output)["entries"][0]["data"] == nlohmann::json::object());
}

TEST_CASE("MemoryWriteTool: non-object data rejected", "[memory_tools]") {
    ToolTestFixture f;
    auto result = f.write_tool.execute(R"({"data":[1,2,3]})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("data") != std::string::npos);
}

TEST_CASE("MemoryWriteTool: non-string namespace rejected", "[memory_tools]") {
    ToolTestFixture f;
    auto result = f.write_tool.execute(R"({"namespace":7,"data":{}})");
    REQUIRE_FALSE(result.success);
}

TEST_CASE("MemoryWriteTool: disabled writes return the policy message", "[memory_tools]") {
    ToolTestFixture f(policy(true, false));
    auto result = f.write_tool.execute(R"({"data":{"a":1}})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Error: MCP_READ_ONLY is enabled. Writes are disabled.");
    REQUIRE_FALSE(std::filesystem::exists(f.store.path_for("default")));
}

TEST_CASE("MemoryWriteTool: storage failure reported as tool error", "[memory_tools]") {
    ToolTestFixture f;
    { std::ofstream blocker(f.dir); blocker << "x"; }

    auto result = f.write_tool.execute(R"({"data":{"a":1}})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("Failed to write memory") != std::string::npos);
    std::filesystem::remove(f.dir);
}

TEST_CASE("MemoryWriteTool: fails without memory", "[memory_tools]") {
    MemoryWriteTool tool;
    auto result = tool.execute(R"({"data":{}})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Memory system is not enabled");
}

TEST_CASE("MemoryWriteTool: invalid JSON arguments", "[memory_tools]") {
    ToolTestFixture f;
    auto result = f.write_tool.execute("{nope");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("Failed to parse arguments") != std::string::npos);
}

// ── memory_get ───────────────────────────────────────────────────

TEST_CASE("MemoryGetTool: empty namespace", "[memory_tools]") {
    ToolTestFixture f;
    auto result = f.get_tool.execute("{}");
    REQUIRE(result.success);
    auto out = nlohmann::json::parse(result.output);
    REQUIRE(out["entries"].empty());
    REQUIRE(out.contains("updated_at"));
}

TEST_CASE("MemoryGetTool: reads back written entries with limit", "[memory_tools]") {
    ToolTestFixture f;
    for (int i = 0; i < 4; ++i) {
        f.write_tool.execute(R"({"namespace":"runs","data":{"i":)" + std::to_string(i) + "}}");
    }

    auto all = nlohmann::json::parse(f.get_tool.execute(R"({"namespace":"runs"})").output);
    REQUIRE(all["entries"].size() == 4);

    auto last = nlohmann::json::parse(
        f.get_tool.execute(R"({"namespace":"runs","limit":1})").output);
    REQUIRE(last["entries"].size() == 1);
    REQUIRE(last["entries"][0]["data"]["i"] == 3);
}

TEST_CASE("MemoryGetTool: reads work while writes are disabled", "[memory_tools]") {
    ToolTestFixture f(policy(true, false));
    REQUIRE(f.get_tool.execute("").success);
}

TEST_CASE("MemoryGetTool: non-integer limit rejected", "[memory_tools]") {
    ToolTestFixture f;
    auto result = f.get_tool.execute(R"({"limit":"5"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("limit") != std::string::npos);
}

TEST_CASE("MemoryGetTool: limit beyond int64 returns every entry", "[memory_tools]") {
    ToolTestFixture f;
    f.write_tool.execute(R"({"namespace":"big","data":{"i":0}})");
    f.write_tool.execute(R"({"namespace":"big","data":{"i":1}})");

    auto result = f.get_tool.execute(R"({"namespace":"big","limit":18446744073709551615})");
    REQUIRE(result.success);
    auto out = nlohmann::json::parse(result.output);
    REQUIRE(out["entries"].size() == 2);
    REQUIRE(out["entries"][0]["data"]["i"] == 0);
}

TEST_CASE("MemoryGetTool: arguments must be an object", "[memory_tools]") {
    ToolTestFixture f;
    REQUIRE_FALSE(f.get_tool.execute("[1]").success);
}

// ── Specs ────────────────────────────────────────────────────────

TEST_CASE("Memory tools: parameter schemas parse", "[memory_tools]") {
    MemoryGetTool get_tool;
    MemoryWriteTool write_tool;
    auto g = nlohmann::json::parse(get_tool.parameters_json());
    auto w = nlohmann::json::parse(write_tool.parameters_json());
    REQUIRE(g["properties"].contains("limit"));
    REQUIRE(w["properties"]["mode"]["enum"].size() == 3);
    REQUIRE(get_tool.spec().name == "memory_get");
    REQUIRE(write_tool.spec().name == "memory_write");
}
