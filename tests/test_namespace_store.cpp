#include <catch2/catch.hpp>
#include "memory/namespace_store.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace mcpgate;

static std::string store_test_dir() {
    return "/tmp/mcpgate_test_store_" + std::to_string(getpid());
}

struct StoreFixture {
    std::string dir = store_test_dir();
    NamespaceStore store{dir};

    ~StoreFixture() {
        std::filesystem::remove_all(dir);
    }

    void write_raw(const std::string& ns, const std::string& content) {
        std::filesystem::create_directories(dir);
        std::ofstream f(store.path_for(ns));
        f << content;
    }

    std::string read_raw(const std::string& ns) const {
        std::ifstream f(store.path_for(ns));
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

// ── sanitize / path_for ──────────────────────────────────────────

TEST_CASE("NamespaceStore::sanitize: allowed characters kept", "[namespace_store]") {
    REQUIRE(NamespaceStore::sanitize("garmin.daily-log_2") == "garmin.daily-log_2");
}

TEST_CASE("NamespaceStore::sanitize: runs of other characters collapse to one underscore",
          "[namespace_store]") {
    REQUIRE(NamespaceStore::sanitize("a b") == "a_b");
    REQUIRE(NamespaceStore::sanitize("a / b") == "a_b");
    REQUIRE(NamespaceStore::sanitize("../etc/passwd") == ".._etc_passwd");
    REQUIRE(NamespaceStore::sanitize("caf\xc3\xa9") == "caf_");
}

TEST_CASE("NamespaceStore::sanitize: blank names map to default", "[namespace_store]") {
    REQUIRE(NamespaceStore::sanitize("") == "default");
    REQUIRE(NamespaceStore::sanitize("   ") == "default");
    REQUIRE(NamespaceStore::sanitize("  notes  ") == "notes");
}

TEST_CASE("NamespaceStore::path_for: stays inside the root", "[namespace_store]") {
    StoreFixture f;
    REQUIRE(f.store.path_for("notes") == f.dir + "/notes.json");
    REQUIRE(f.store.path_for("../x") == f.dir + "/.._x.json");
    REQUIRE(f.store.path_for("") == f.dir + "/default.json");
}

// ── load ─────────────────────────────────────────────────────────

TEST_CASE("NamespaceStore::load: missing file yields empty document", "[namespace_store]") {
    StoreFixture f;
    auto doc = f.store.load("nothing-here");
    REQUIRE(doc.entries.empty());
    REQUIRE_FALSE(doc.updated_at.empty());
    REQUIRE_FALSE(std::filesystem::exists(f.store.path_for("nothing-here")));
}

TEST_CASE("NamespaceStore::load: corrupt file yields empty document", "[namespace_store]") {
    StoreFixture f;
    f.write_raw("broken", "{\"entries\": [oops");
    REQUIRE(f.store.load("broken").entries.empty());

    f.write_raw("wrong-shape", R"({"entries": {"a": 1}})");
    REQUIRE(f.store.load("wrong-shape").entries.empty());
}

TEST_CASE("NamespaceStore::load: non-object entries kept as data", "[namespace_store]") {
    StoreFixture f;
    f.write_raw("mixed", R"({"updated_at": "2024-01-01T00:00:00Z",
                             "entries": [{"timestamp": "t1", "data": {"k": 1}}, "loose"]})");
    auto doc = f.store.load("mixed");
    REQUIRE(doc.updated_at == "2024-01-01T00:00:00Z");
    REQUIRE(doc.entries.size() == 2);
    REQUIRE(doc.entries[0].timestamp == "t1");
    REQUIRE(doc.entries[0].data["k"] == 1);
    REQUIRE(doc.entries[1].data == "loose");
    REQUIRE(entry_to_json(doc.entries[1]) == "loose");
}

TEST_CASE("NamespaceStore: loaded entries are saved back unchanged", "[namespace_store]") {
    StoreFixture f;
    f.write_raw("legacy", R"({"updated_at": "2024-01-01T00:00:00Z",
                              "entries": [{"timestamp": 1704067200, "data": {"b": 2}, "tag": "x"}]})");
    auto doc = f.store.load("legacy");
    REQUIRE(doc.entries[0].timestamp.empty());
    f.store.save("legacy", doc);

    auto reloaded = f.store.load("legacy");
    REQUIRE(entry_to_json(reloaded.entries[0]) ==
            nlohmann::json{{"timestamp", 1704067200}, {"data", {{"b", 2}}}, {"tag", "x"}});
}

// ── save ─────────────────────────────────────────────────────────

TEST_CASE("NamespaceStore: save then load round trip", "[namespace_store]") {
    StoreFixture f;
    NamespaceDocument doc;
    doc.updated_at = "2024-05-01T12:00:00Z";
    doc.entries.push_back(MemoryEntry{"2024-05-01T11:00:00Z", {{"steps", 9000}}});
    doc.entries.push_back(MemoryEntry{"2024-05-01T12:00:00Z", {{"sleep", "7h"}}});

    f.store.save("daily", doc);
    REQUIRE(f.store.load("daily") == doc);
}

TEST_CASE("NamespaceStore::save: pretty-printed with trailing newline", "[namespace_store]") {
    StoreFixture f;
    NamespaceDocument doc;
    doc.updated_at = "2024-05-01T12:00:00Z";
    f.store.save("fmt", doc);

    std::string raw = f.read_raw("fmt");
    REQUIRE(raw.back() == '\n');
    REQUIRE(raw.find("\n  \"entries\"") != std::string::npos);
    auto j = nlohmann::json::parse(raw);
    REQUIRE(j["entries"].is_array());
}

TEST_CASE("NamespaceStore::save: creates the root directory", "[namespace_store]") {
    StoreFixture f;
    REQUIRE_FALSE(std::filesystem::exists(f.dir));
    f.store.save("first", NamespaceDocument{});
    REQUIRE(std::filesystem::exists(f.store.path_for("first")));
}

TEST_CASE("NamespaceStore::save: leaves no temp files behind", "[namespace_store]") {
    StoreFixture f;
    f.store.save("clean", NamespaceDocument{});
    f.store.save("clean", NamespaceDocument{});
    int files = 0;
    for (const auto& e : std::filesystem::directory_iterator(f.dir)) {
        (void)e;
        ++files;
    }
    REQUIRE(files == 1);
}

TEST_CASE("NamespaceStore::save: unwritable root throws", "[namespace_store]") {
    StoreFixture f;
    // A regular file where the root directory should be.
    { std::ofstream blocker(f.dir); blocker << "x"; }
    REQUIRE_THROWS_AS(f.store.save("ns", NamespaceDocument{}), std::runtime_error);
    std::filesystem::remove(f.dir);
}
