#pragma once
#include "../server/request.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace mcpgate {

constexpr const char* kAuthorizationServerIssuer = "https://accounts.google.com";

// "<scheme>://<host>" of the requesting client, taken from the Host header.
// The scheme comes from X-Forwarded-Proto when a proxy sets it, else "http".
std::string request_origin(const ServerRequest& req);

// RFC 8414 authorization server metadata (static).
nlohmann::json authorization_server_metadata();

// RFC 9728 protected resource metadata for the given origin.
nlohmann::json protected_resource_metadata(const std::string& origin);

// Where clients find the protected resource metadata document.
std::string protected_resource_metadata_url(const std::string& origin);

// Serve one well-known document by name; unknown names get 404.
ServerResponse well_known_response(const std::string& doc_name, const std::string& origin);

} // namespace mcpgate
