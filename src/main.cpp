#include "config.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "auth/token_validator.hpp"
#include "auth/authorization_gate.hpp"
#include "memory/namespace_store.hpp"
#include "memory/memory_service.hpp"
#include "server/http_server.hpp"
#include "server/router.hpp"
#include "tools/memory_tool_util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: mcpgate [options]\n"
              << "\n"
              << "Options:\n"
              << "  --host HOST          Bind address (default: 127.0.0.1)\n"
              << "  --port PORT          Listen port (default: 8000)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  GOOGLE_OAUTH_CLIENT_ID         Expected token audience (required)\n"
              << "  OAUTH_TOKENINFO_CACHE_SECONDS  Max validation cache lifetime (default: 600)\n"
              << "  OAUTH_INTROSPECTION_URL        Token introspection endpoint\n"
              << "  MCP_MEMORY_DIR                 Directory for namespace files\n"
              << "  MCP_READ_ONLY                  Disable writes (default: true)\n"
              << "  MCP_MEMORY_WRITE_ENABLED       Allow memory writes in read-only mode (default: true)\n"
              << "  HOST, PORT                     Listen address\n"
              << "  DEBUG                          Verbose logging\n";
}

int main(int argc, char* argv[]) try {
    std::string host;
    std::string port_arg;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            host = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port_arg = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    mcpgate::http_init();
    auto config = mcpgate::Config::load();

    // Override config with CLI args
    if (!host.empty()) config.server.host = host;
    if (!port_arg.empty()) {
        int port = 0;
        try {
            port = std::stoi(port_arg);
        } catch (const std::exception&) {
            port = 0;
        }
        if (port <= 0 || port > 65535) {
            std::cerr << "Error: invalid port: " << port_arg << "\n";
            mcpgate::http_cleanup();
            return 1;
        }
        config.server.port = static_cast<uint16_t>(port);
    }

    if (config.oauth.client_id.empty()) {
        std::cerr << "Error: GOOGLE_OAUTH_CLIENT_ID (oauth.client_id) must be set.\n";
        mcpgate::http_cleanup();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    mcpgate::http_set_abort_flag(&g_shutdown);

    mcpgate::PlatformHttpClient http_client;

    mcpgate::TokenValidatorOptions validator_options;
    validator_options.client_id = config.oauth.client_id;
    validator_options.introspection_url = config.oauth.introspection_url;
    validator_options.cache_ttl_seconds = config.oauth.cache_ttl_seconds;
    validator_options.timeout_seconds = config.oauth.timeout_seconds;
    mcpgate::TokenValidator validator(validator_options, http_client);
    mcpgate::AuthorizationGate gate(validator);

    mcpgate::NamespaceStore store(config.memory.store_dir());
    mcpgate::MemoryService memory(store, config.memory);

    // Create tools and hand the memory service to those that need it
    auto tools = mcpgate::PluginRegistry::instance().create_all_tools();
    for (auto& tool : tools) {
        if (auto* mt = dynamic_cast<mcpgate::MemoryAwareTool*>(tool.get())) {
            mt->set_memory(&memory);
        }
    }

    mcpgate::Router router(gate, std::move(tools));

    std::string listen_addr = config.server.host + ":" + std::to_string(config.server.port);
    mcpgate::HttpServer server(listen_addr, config.server.max_body, config.server.workers,
        [&router](mcpgate::ServerRequest& req) { return router.handle(req); });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "[server] Failed to start: " << error << "\n";
        mcpgate::http_cleanup();
        return 1;
    }

    std::string base = "http://" + listen_addr;
    std::cerr << "[server] Listening on " << listen_addr << "\n"
              << "[server]   health:    " << base << "/health\n"
              << "[server]   sse:       " << base << "/sse\n"
              << "[server]   messages:  " << base << mcpgate::kMessagesEndpoint << "\n"
              << "[server]   discovery: " << base << "/.well-known/oauth-protected-resource\n"
              << "[memory] Store: " << store.root()
              << (memory.writes_allowed() ? "" : " (read-only)") << "\n";
    if (config.server.debug) {
        std::cerr << "[auth] Audience: " << config.oauth.client_id
                  << ", cache ceiling " << validator.max_ttl() << "s\n";
    }

    // Periodically drop expired validation results while serving
    int ticks = 0;
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (++ticks >= 300) {
            ticks = 0;
            size_t evicted = validator.evict_expired();
            if (config.server.debug && evicted > 0) {
                std::cerr << "[auth] Evicted " << evicted << " expired cache entries\n";
            }
        }
    }

    std::cerr << "[server] Shutting down\n";
    server.stop();
    mcpgate::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
