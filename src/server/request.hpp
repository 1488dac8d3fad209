#pragma once
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpgate {

// A parsed inbound HTTP request.
struct ServerRequest {
    std::string method;   // "GET", "POST", "OPTIONS", ...
    std::string path;     // e.g. "/messages/"
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Request-scoped context: the validated token payload, set by the
    // authorization gate on protected routes.
    std::optional<nlohmann::json> auth;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;

    // Return a header value (name matched case-insensitively), or "" if absent.
    std::string header(const std::string& name) const;
};

struct ServerResponse {
    int         status       = 200;
    std::string content_type = "text/plain";
    std::map<std::string, std::string> headers;  // extra headers
    std::string body;
};

// JSON response with the given status.
ServerResponse json_response(int status, const nlohmann::json& body);

} // namespace mcpgate
