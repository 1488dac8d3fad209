#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <unistd.h>

using namespace mcpgate;

// ── trim / to_lower ──────────────────────────────────────────────

TEST_CASE("trim: strips leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello \t\n") == "hello");
    REQUIRE(trim("inner space kept") == "inner space kept");
}

TEST_CASE("trim: all whitespace becomes empty", "[util]") {
    REQUIRE(trim(" \t\r\n ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("BeArEr") == "bearer");
    REQUIRE(to_lower("abc-123") == "abc-123");
}

// ── split ────────────────────────────────────────────────────────

TEST_CASE("split: keeps empty fields between delimiters", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[1].empty());
}

TEST_CASE("split_whitespace: collapses runs", "[util]") {
    auto parts = split_whitespace("  Bearer \t  tok  ");
    REQUIRE(parts.size() == 2);
    REQUIRE(parts[0] == "Bearer");
    REQUIRE(parts[1] == "tok");
}

TEST_CASE("split_whitespace: empty input yields nothing", "[util]") {
    REQUIRE(split_whitespace("   ").empty());
}

// ── starts_with ──────────────────────────────────────────────────

TEST_CASE("starts_with: prefix matching", "[util]") {
    REQUIRE(starts_with("/messages/", "/messages"));
    REQUIRE(starts_with("/sse", "/sse"));
    REQUIRE_FALSE(starts_with("/ss", "/sse"));
    REQUIRE(starts_with("anything", ""));
}

// ── parse_bool_like ──────────────────────────────────────────────

TEST_CASE("parse_bool_like: accepted truthy spellings", "[util]") {
    REQUIRE(parse_bool_like("1"));
    REQUIRE(parse_bool_like("true"));
    REQUIRE(parse_bool_like("TRUE"));
    REQUIRE(parse_bool_like(" Yes "));
}

TEST_CASE("parse_bool_like: everything else is false", "[util]") {
    REQUIRE_FALSE(parse_bool_like("0"));
    REQUIRE_FALSE(parse_bool_like("false"));
    REQUIRE_FALSE(parse_bool_like("on"));
    REQUIRE_FALSE(parse_bool_like(""));
}

// ── url_encode ───────────────────────────────────────────────────

TEST_CASE("url_encode: unreserved characters pass through", "[util]") {
    REQUIRE(url_encode("ya29.A-b_c~d") == "ya29.A-b_c~d");
}

TEST_CASE("url_encode: reserved characters are percent-encoded", "[util]") {
    REQUIRE(url_encode("a b/c+d=") == "a%20b%2Fc%2Bd%3D");
    REQUIRE(url_encode("&") == "%26");
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~/x/y") == std::string(home) + "/x/y");
}

TEST_CASE("expand_home: other paths unchanged", "[util]") {
    REQUIRE(expand_home("/abs/path") == "/abs/path");
    REQUIRE(expand_home("rel/~path") == "rel/~path");
}

// ── timestamp_now ────────────────────────────────────────────────

TEST_CASE("timestamp_now: ISO 8601 UTC shape", "[util]") {
    std::string ts = timestamp_now();
    REQUIRE(ts.size() == 20);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}

// ── atomic_write_file ────────────────────────────────────────────

static std::string util_test_dir() {
    return "/tmp/mcpgate_test_util_" + std::to_string(getpid());
}

struct UtilDirGuard {
    std::string dir = util_test_dir();
    ~UtilDirGuard() { std::filesystem::remove_all(dir); }
};

static std::string read_all(const std::string& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

TEST_CASE("atomic_write_file: creates parent directory and writes content", "[util]") {
    UtilDirGuard g;
    std::string path = g.dir + "/nested/file.json";
    std::string error;

    REQUIRE(atomic_write_file(path, "{}\n", error));
    REQUIRE(error.empty());
    REQUIRE(read_all(path) == "{}\n");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp-" + std::to_string(getpid())));
}

TEST_CASE("atomic_write_file: overwrites existing file", "[util]") {
    UtilDirGuard g;
    std::string path = g.dir + "/file.txt";
    std::string error;

    REQUIRE(atomic_write_file(path, "first", error));
    REQUIRE(atomic_write_file(path, "second", error));
    REQUIRE(read_all(path) == "second");
}

TEST_CASE("atomic_write_file: reports failure when parent is a file", "[util]") {
    UtilDirGuard g;
    std::filesystem::create_directories(g.dir);
    std::string blocker = g.dir + "/blocker";
    { std::ofstream f(blocker); f << "x"; }

    std::string error;
    REQUIRE_FALSE(atomic_write_file(blocker + "/file.txt", "data", error));
    REQUIRE_FALSE(error.empty());
}
