#pragma once
#include "request.hpp"
#include "../auth/authorization_gate.hpp"
#include "../tool.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mcpgate {

constexpr const char* kServiceName = "mcpgate";
constexpr const char* kMessagesEndpoint = "/messages/";

// Request pipeline: CORS, the authorization gate, then the route table.
class Router {
public:
    // The gate must outlive the router.
    Router(AuthorizationGate& gate, std::vector<std::unique_ptr<Tool>> tools);

    // Entry point for HttpServer. Every response carries the CORS header.
    ServerResponse handle(ServerRequest& req);

    // nullptr when no tool with that name is mounted.
    Tool* find_tool(const std::string& name) const;

    std::vector<std::string> tool_names() const;

private:
    ServerResponse route(ServerRequest& req);
    ServerResponse handle_root(const ServerRequest& req) const;
    ServerResponse handle_sse() const;
    ServerResponse handle_message(const ServerRequest& req);

    AuthorizationGate& gate_;
    std::vector<std::unique_ptr<Tool>> tools_;
};

} // namespace mcpgate
