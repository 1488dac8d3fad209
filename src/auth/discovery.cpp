#include "discovery.hpp"
#include "../util.hpp"

namespace mcpgate {

static const nlohmann::json kScopes = {"openid", "email", "profile"};

std::string request_origin(const ServerRequest& req) {
    std::string scheme = to_lower(trim(req.header("x-forwarded-proto")));
    // A proxy chain may append several values; the first is the client's.
    auto comma = scheme.find(',');
    if (comma != std::string::npos) scheme = trim(scheme.substr(0, comma));
    if (scheme != "https" && scheme != "http") scheme = "http";

    std::string host = trim(req.header("host"));
    if (host.empty()) host = "localhost";
    return scheme + "://" + host;
}

nlohmann::json authorization_server_metadata() {
    return {
        {"issuer", kAuthorizationServerIssuer},
        {"authorization_endpoint", "https://accounts.google.com/o/oauth2/v2/auth"},
        {"token_endpoint", "https://oauth2.googleapis.com/token"},
        {"jwks_uri", "https://www.googleapis.com/oauth2/v3/certs"},
        {"response_types_supported", {"code"}},
        {"grant_types_supported", {"authorization_code", "refresh_token"}},
        {"token_endpoint_auth_methods_supported", {"client_secret_post", "client_secret_basic"}},
        {"scopes_supported", kScopes}
    };
}

nlohmann::json protected_resource_metadata(const std::string& origin) {
    return {
        {"resource", origin + "/sse"},
        {"authorization_servers", {kAuthorizationServerIssuer}},
        {"scopes_supported", kScopes}
    };
}

std::string protected_resource_metadata_url(const std::string& origin) {
    return origin + "/.well-known/oauth-protected-resource";
}

ServerResponse well_known_response(const std::string& doc_name, const std::string& origin) {
    if (doc_name == "oauth-authorization-server" || doc_name == "openid-configuration") {
        return json_response(200, authorization_server_metadata());
    }
    if (doc_name == "oauth-protected-resource") {
        return json_response(200, protected_resource_metadata(origin));
    }
    return json_response(404, {{"error", "not_found"}});
}

} // namespace mcpgate
