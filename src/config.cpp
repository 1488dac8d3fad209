#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace mcpgate {

std::string MemoryConfig::store_dir() const {
    if (credential_store_dir.empty()) return expand_home("~/.mcpgate/memory");
    return expand_home(credential_store_dir);
}

nlohmann::json Config::defaults_json() {
    return {
        {"server", {
            {"host", "127.0.0.1"},
            {"port", 8000},
            {"workers", 8},
            {"max_body", 1048576},
            {"debug", false}
        }},
        {"oauth", {
            {"client_id", ""},
            {"cache_ttl_seconds", 600},
            {"introspection_url", kDefaultIntrospectionUrl},
            {"timeout_seconds", 5}
        }},
        {"memory", {
            {"credential_store_dir", "~/.mcpgate/memory"},
            {"read_only", true},
            {"memory_write_enabled", true}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void write_config_file(const std::string& path, const nlohmann::json& j,
                              const char* what) {
    std::string error;
    if (atomic_write_file(path, j.dump(4) + "\n", error)) {
        std::cerr << "[config] " << what << ": " << path << "\n";
    } else {
        std::cerr << "[config] Could not write " << path << ": " << error << "\n";
    }
}

Config Config::load() {
    std::string config_path = expand_home("~/.mcpgate/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                write_config_file(config_path, j, "Migrated config with new defaults");
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path
                      << ", using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        write_config_file(config_path, j, "Created default config");
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

// Read section[key] when it is an unsigned number in [min, max of T].
// Out-of-range values are logged and leave out untouched.
template <typename T>
static void read_uint(const nlohmann::json& section, const char* key, T& out, uint64_t min = 0) {
    if (!section.contains(key) || !section[key].is_number_unsigned()) return;
    uint64_t value = section[key].get<uint64_t>();
    if (value < min || value > std::numeric_limits<T>::max()) {
        std::cerr << "[config] Ignoring out-of-range " << key << ": " << value << "\n";
        return;
    }
    out = static_cast<T>(value);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("host") && s["host"].is_string())
            cfg.server.host = s["host"].get<std::string>();
        read_uint(s, "port", cfg.server.port, 1);
        read_uint(s, "workers", cfg.server.workers);
        read_uint(s, "max_body", cfg.server.max_body);
        if (s.contains("debug") && s["debug"].is_boolean())
            cfg.server.debug = s["debug"].get<bool>();
    }

    if (j.contains("oauth") && j["oauth"].is_object()) {
        auto& o = j["oauth"];
        if (o.contains("client_id") && o["client_id"].is_string())
            cfg.oauth.client_id = trim(o["client_id"].get<std::string>());
        read_uint(o, "cache_ttl_seconds", cfg.oauth.cache_ttl_seconds);
        if (o.contains("introspection_url") && o["introspection_url"].is_string())
            cfg.oauth.introspection_url = o["introspection_url"].get<std::string>();
        read_uint(o, "timeout_seconds", cfg.oauth.timeout_seconds);
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        if (m.contains("credential_store_dir") && m["credential_store_dir"].is_string())
            cfg.memory.credential_store_dir = m["credential_store_dir"].get<std::string>();
        if (m.contains("read_only") && m["read_only"].is_boolean())
            cfg.memory.read_only = m["read_only"].get<bool>();
        if (m.contains("memory_write_enabled") && m["memory_write_enabled"].is_boolean())
            cfg.memory.memory_write_enabled = m["memory_write_enabled"].get<bool>();
    }

    return cfg;
}

// Parse an unsigned env value; returns false (leaving out untouched) on garbage,
// a sign, or anything above UINT32_MAX.
static bool env_uint(const char* v, uint32_t& out) {
    std::string text = trim(v);
    if (text.empty()) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    try {
        unsigned long long parsed = std::stoull(text);
        if (parsed > std::numeric_limits<uint32_t>::max()) return false;
        out = static_cast<uint32_t>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("MCP_MEMORY_DIR"))
        memory.credential_store_dir = v;
    if (const char* v = std::getenv("MCP_READ_ONLY"))
        memory.read_only = parse_bool_like(v);
    if (const char* v = std::getenv("MCP_MEMORY_WRITE_ENABLED"))
        memory.memory_write_enabled = parse_bool_like(v);

    if (const char* v = std::getenv("GOOGLE_OAUTH_CLIENT_ID"))
        oauth.client_id = trim(v);
    if (const char* v = std::getenv("OAUTH_TOKENINFO_CACHE_SECONDS")) {
        if (!env_uint(v, oauth.cache_ttl_seconds))
            std::cerr << "[config] Ignoring invalid OAUTH_TOKENINFO_CACHE_SECONDS: " << v << "\n";
    }
    if (const char* v = std::getenv("OAUTH_INTROSPECTION_URL"))
        oauth.introspection_url = v;

    if (const char* v = std::getenv("HOST"))
        server.host = v;
    if (const char* v = std::getenv("PORT")) {
        uint32_t port = 0;
        if (env_uint(v, port) && port > 0 && port <= 65535)
            server.port = static_cast<uint16_t>(port);
        else
            std::cerr << "[config] Ignoring invalid PORT: " << v << "\n";
    }
    if (const char* v = std::getenv("DEBUG"))
        server.debug = parse_bool_like(v);
}

uint32_t Config::effective_cache_ttl() const {
    return std::max(kMinCacheTtlSeconds, oauth.cache_ttl_seconds);
}

} // namespace mcpgate
