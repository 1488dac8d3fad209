#include "router.hpp"
#include "../auth/discovery.hpp"
#include "../util.hpp"

#include <iostream>

namespace mcpgate {

static const char* kWellKnownPrefix    = "/.well-known/";
static const char* kSseWellKnownPrefix = "/sse/.well-known/";

Router::Router(AuthorizationGate& gate, std::vector<std::unique_ptr<Tool>> tools)
    : gate_(gate), tools_(std::move(tools)) {}

Tool* Router::find_tool(const std::string& name) const {
    for (const auto& t : tools_) {
        if (t->tool_name() == name) return t.get();
    }
    return nullptr;
}

std::vector<std::string> Router::tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& t : tools_) names.push_back(t->tool_name());
    return names;
}

ServerResponse Router::handle(ServerRequest& req) {
    ServerResponse resp;
    GateDecision decision = gate_.evaluate(req);
    if (decision.forwarded()) {
        resp = route(req);
    } else {
        resp = std::move(decision.rejection);
    }
    resp.headers["Access-Control-Allow-Origin"] = "*";
    return resp;
}

// First path segment after `prefix`: "/.well-known/x/y" -> "x".
static std::string document_name(const std::string& path, const std::string& prefix) {
    std::string rest = path.substr(prefix.size());
    auto slash = rest.find('/');
    return slash == std::string::npos ? rest : rest.substr(0, slash);
}

static ServerResponse method_not_allowed(const std::string& allow) {
    ServerResponse resp = json_response(405, {{"error", "method_not_allowed"}});
    resp.headers["Allow"] = allow;
    return resp;
}

ServerResponse Router::route(ServerRequest& req) {
    if (req.method == "OPTIONS") {
        ServerResponse resp;
        resp.status = 204;
        resp.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
        resp.headers["Access-Control-Allow-Headers"] = "Authorization, Content-Type";
        return resp;
    }

    const std::string& path = req.path;

    std::string prefix;
    if (starts_with(path, kWellKnownPrefix)) prefix = kWellKnownPrefix;
    else if (starts_with(path, kSseWellKnownPrefix)) prefix = kSseWellKnownPrefix;
    if (!prefix.empty()) {
        if (req.method != "GET") return method_not_allowed("GET, OPTIONS");
        return well_known_response(document_name(path, prefix), request_origin(req));
    }

    if (path == "/health") {
        if (req.method != "GET") return method_not_allowed("GET, OPTIONS");
        return json_response(200, {{"status", "ok"}, {"service", kServiceName}});
    }
    if (path == "/") {
        if (req.method != "GET") return method_not_allowed("GET, OPTIONS");
        return handle_root(req);
    }
    if (path == "/sse") {
        if (req.method != "GET") return method_not_allowed("GET, OPTIONS");
        return handle_sse();
    }
    if (path == "/messages" || path == kMessagesEndpoint) {
        if (req.method != "POST") return method_not_allowed("POST, OPTIONS");
        return handle_message(req);
    }

    return json_response(404, {{"error", "not_found"}});
}

ServerResponse Router::handle_root(const ServerRequest& req) const {
    std::string origin = request_origin(req);
    return json_response(200, {
        {"service", kServiceName},
        {"endpoints", {
            {"health", origin + "/health"},
            {"sse", origin + "/sse"},
            {"messages", origin + kMessagesEndpoint},
            {"protected_resource_metadata", protected_resource_metadata_url(origin)}
        }},
        {"tools", tool_names()}
    });
}

ServerResponse Router::handle_sse() const {
    ServerResponse resp;
    resp.content_type = "text/event-stream";
    resp.headers["Cache-Control"] = "no-cache";
    resp.body = std::string("event: endpoint\ndata: ") + kMessagesEndpoint + "\n\n";
    return resp;
}

ServerResponse Router::handle_message(const ServerRequest& req) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error&) {
        return json_response(400, {{"error", "bad_request"}, {"message", "Body must be JSON"}});
    }
    if (!body.is_object() || !body.contains("name") || !body["name"].is_string()) {
        return json_response(400, {{"error", "bad_request"},
                                   {"message", "Expected {\"name\": string, \"arguments\": object}"}});
    }

    std::string name = body["name"].get<std::string>();
    Tool* tool = find_tool(name);
    if (!tool) {
        return json_response(404, {{"error", "unknown_tool"}, {"message", "Unknown tool: " + name}});
    }

    std::string args = "{}";
    if (body.contains("arguments") && !body["arguments"].is_null()) {
        args = body["arguments"].dump();
    }

    ToolResult result = tool->execute(args);
    if (!result.success) {
        std::cerr << "[server] Tool " << name << " failed: " << result.output << "\n";
    }
    return json_response(200, {
        {"tool", name},
        {"success", result.success},
        {"output", result.output}
    });
}

} // namespace mcpgate
