#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mcpgate {

constexpr const char* kDefaultIntrospectionUrl = "https://oauth2.googleapis.com/tokeninfo";
constexpr uint32_t kMinCacheTtlSeconds = 30;

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8000;
    uint32_t workers = 8;
    uint32_t max_body = 1048576;
    bool debug = false;
};

struct OAuthConfig {
    std::string client_id;                  // required before the gate can be built
    uint32_t cache_ttl_seconds = 600;       // floored at kMinCacheTtlSeconds
    std::string introspection_url = kDefaultIntrospectionUrl;
    uint32_t timeout_seconds = 5;
};

struct MemoryConfig {
    std::string credential_store_dir;       // empty = ~/.mcpgate/memory
    bool read_only = true;
    bool memory_write_enabled = true;

    // Writes are refused only when read-only is on and the override is off.
    bool writes_allowed() const { return !read_only || memory_write_enabled; }

    // Configured directory, or the per-user default, with ~ expanded.
    std::string store_dir() const;
};

struct Config {
    ServerConfig server;
    OAuthConfig oauth;
    MemoryConfig memory;

    // Load from ~/.mcpgate/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config JSON object; unknown or mistyped keys keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Apply environment variable overrides in place.
    void apply_env();

    // Cache TTL after applying the floor.
    uint32_t effective_cache_ttl() const;
};

} // namespace mcpgate
